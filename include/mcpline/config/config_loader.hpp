#pragma once

#include <mcpline/config/server_config.hpp>
#include <mcpline/core/result.hpp>

#include <optional>
#include <string_view>

namespace mcpline {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
// --help is handled by the parser itself (prints usage, exits 0).
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in cli_overrides replace those in file_base.
AppConfig MergeConfigs(const AppConfig& file_base, const AppConfig& cli_overrides);

// Validate values that parsing alone cannot reject.
Result<void, Error> ValidateConfig(const AppConfig& config);

std::optional<ToolSetKind> ParseToolSet(std::string_view name);
std::optional<LogFormat> ParseLogFormat(std::string_view name);
std::optional<ColorMode> ParseColorMode(std::string_view name);

} // namespace mcpline
