#pragma once

#include <mcpline/core/log.hpp>
#include <mcpline/core/terminal.hpp>

#include <optional>
#include <string>

namespace mcpline {

// Which static tool set the process serves.
enum class ToolSetKind {
    Example,  // calculate, reverse_string
    Fixture,  // test_tool
};

enum class LogFormat {
    Text,
    Json,
};

// Every field is optional so that a command line can override a file
// field by field. Unset fields fall back to the defaults below.
struct ServerSection {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> protocol_version;
    std::optional<ToolSetKind> toolset;
};

struct LoggingSection {
    std::optional<LogLevel> level;
    std::optional<LogFormat> format;
    std::optional<std::string> file;
    std::optional<ColorMode> color;
};

struct AppConfig {
    std::optional<std::string> config_file;
    ServerSection server;
    LoggingSection logging;
};

constexpr const char* kDefaultProtocolVersion = "2024-11-05";
constexpr LogLevel kDefaultLogLevel = LogLevel::Warn;

} // namespace mcpline
