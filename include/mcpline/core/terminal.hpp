#pragma once

namespace mcpline {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output on fd gets ANSI colors.
/// Always/Never win; Auto means "fd is a terminal and NO_COLOR is unset".
bool ResolveColor(ColorMode mode, int fd);

/// File descriptor diagnostics are written to.
int StderrFd();

} // namespace mcpline
