#include <mcpline/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace mcpline {

bool IsTerminal(int fd) {
#ifdef _WIN32
    return _isatty(fd) != 0;
#else
    return isatty(fd) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveColor(ColorMode mode, int fd) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        case ColorMode::Auto:   break;
    }
    return !NoColorEnvSet() && IsTerminal(fd);
}

int StderrFd() {
#ifdef _WIN32
    return _fileno(stderr);
#else
    return STDERR_FILENO;
#endif
}

} // namespace mcpline
