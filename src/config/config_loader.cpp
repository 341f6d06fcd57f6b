#include <mcpline/config/config_loader.hpp>

#include <mcpline/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace mcpline {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Reads an optional scalar under `node[key]` through `parse`, reporting
// unparseable values as config errors naming the YAML path.
template <typename T, typename ParseFn>
Result<void, Error> ReadEnum(const YAML::Node& node, const char* section,
                             const char* key, ParseFn parse,
                             std::optional<T>& out) {
    if (!node[key]) {
        return Result<void, Error>::Ok();
    }
    auto text = node[key].as<std::string>();
    auto parsed = parse(text);
    if (!parsed) {
        return Result<void, Error>::Err(MakeConfigError(
            std::string("Invalid value for ") + section + "." + key + ": '" +
            text + "'"));
    }
    out = *parsed;
    return Result<void, Error>::Ok();
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;

    // -- server --
    if (const auto server = root["server"]) {
        if (server["name"]) {
            config.server.name = server["name"].as<std::string>();
        }
        if (server["version"]) {
            config.server.version = server["version"].as<std::string>();
        }
        if (server["protocol_version"]) {
            config.server.protocol_version =
                server["protocol_version"].as<std::string>();
        }
        auto toolset = ReadEnum(server, "server", "toolset", ParseToolSet,
                                config.server.toolset);
        if (toolset.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(toolset).Error());
        }
    }

    // -- logging --
    if (const auto logging = root["logging"]) {
        auto level = ReadEnum(logging, "logging", "level", ParseLogLevel,
                              config.logging.level);
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(level).Error());
        }
        auto format = ReadEnum(logging, "logging", "format", ParseLogFormat,
                               config.logging.format);
        if (format.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(format).Error());
        }
        auto color = ReadEnum(logging, "logging", "color", ParseColorMode,
                              config.logging.color);
        if (color.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(color).Error());
        }
        if (logging["file"]) {
            config.logging.file = logging["file"].as<std::string>();
        }
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

std::optional<ToolSetKind> ParseToolSet(std::string_view name) {
    const auto lower = ToLower(name);
    if (lower == "example") return ToolSetKind::Example;
    if (lower == "fixture") return ToolSetKind::Fixture;
    return std::nullopt;
}

std::optional<LogFormat> ParseLogFormat(std::string_view name) {
    const auto lower = ToLower(name);
    if (lower == "text") return LogFormat::Text;
    if (lower == "json") return LogFormat::Json;
    return std::nullopt;
}

std::optional<ColorMode> ParseColorMode(std::string_view name) {
    const auto lower = ToLower(name);
    if (lower == "auto") return ColorMode::Auto;
    if (lower == "always" || lower == "true") return ColorMode::Always;
    if (lower == "never" || lower == "false") return ColorMode::Never;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        auto root = YAML::LoadFile(std::string(file_path));
        if (!root.IsNull() && !root.IsMap()) {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                "Config file must contain a mapping: " + std::string(file_path)));
        }
        return ParseYamlRoot(root);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcpline", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Serves a static tool set over line-delimited JSON-RPC on stdin/stdout.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--toolset")
        .help("Tool set to serve: example | fixture");
    program.add_argument("--server-name")
        .help("Override serverInfo.name");
    program.add_argument("--server-version")
        .help("Override serverInfo.version");
    program.add_argument("--protocol-version")
        .help("Protocol version advertised by initialize");

    program.add_argument("--log-level")
        .help("Minimum log level: debug | info | warn | error");
    int verbosity = 0;
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--log-format")
        .help("Log format: text | json");
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("--color")
        .help("Force colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }

    // Server
    if (auto val = program.present("--toolset")) {
        auto kind = ParseToolSet(*val);
        if (!kind) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --toolset: '" + *val + "'"));
        }
        config.server.toolset = *kind;
    }
    if (auto val = program.present("--server-name")) {
        config.server.name = *val;
    }
    if (auto val = program.present("--server-version")) {
        config.server.version = *val;
    }
    if (auto val = program.present("--protocol-version")) {
        config.server.protocol_version = *val;
    }

    // Logging
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --log-level: '" + *val + "'"));
        }
        config.logging.level = *level;
    } else if (verbosity >= 2) {
        config.logging.level = LogLevel::Debug;
    } else if (verbosity == 1) {
        config.logging.level = LogLevel::Info;
    }
    if (auto val = program.present("--log-format")) {
        auto format = ParseLogFormat(*val);
        if (!format) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --log-format: '" + *val + "'"));
        }
        config.logging.format = *format;
    }
    if (auto val = program.present("--log-file")) {
        config.logging.file = *val;
    }
    if (program.get<bool>("--color") && program.get<bool>("--no-color")) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("--color and --no-color are mutually exclusive"));
    }
    if (program.get<bool>("--color")) {
        config.logging.color = ColorMode::Always;
    } else if (program.get<bool>("--no-color")) {
        config.logging.color = ColorMode::Never;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& file_base, const AppConfig& cli_overrides) {
    AppConfig merged = file_base;

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    if (cli_overrides.server.name.has_value()) {
        merged.server.name = cli_overrides.server.name;
    }
    if (cli_overrides.server.version.has_value()) {
        merged.server.version = cli_overrides.server.version;
    }
    if (cli_overrides.server.protocol_version.has_value()) {
        merged.server.protocol_version = cli_overrides.server.protocol_version;
    }
    if (cli_overrides.server.toolset.has_value()) {
        merged.server.toolset = cli_overrides.server.toolset;
    }

    if (cli_overrides.logging.level.has_value()) {
        merged.logging.level = cli_overrides.logging.level;
    }
    if (cli_overrides.logging.format.has_value()) {
        merged.logging.format = cli_overrides.logging.format;
    }
    if (cli_overrides.logging.file.has_value()) {
        merged.logging.file = cli_overrides.logging.file;
    }
    if (cli_overrides.logging.color.has_value()) {
        merged.logging.color = cli_overrides.logging.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.has_value() && config.server.name->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("server name must not be empty"));
    }
    if (config.server.version.has_value() && config.server.version->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("server version must not be empty"));
    }
    if (config.server.protocol_version.has_value() &&
        config.server.protocol_version->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("protocol version must not be empty"));
    }
    if (config.logging.file.has_value() && config.logging.file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("log file path must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcpline
