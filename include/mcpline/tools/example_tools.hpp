#pragma once

#include <mcpline/config/server_config.hpp>
#include <mcpline/core/result.hpp>
#include <mcpline/mcp/dispatcher.hpp>
#include <mcpline/mcp/tool_registry.hpp>

#include <string>
#include <string_view>

namespace mcpline {

// Registers calculate and reverse_string, in that order.
Result<void, Error> RegisterExampleTools(ToolRegistry& registry);

// Registers test_tool, which always answers "Result A".
Result<void, Error> RegisterFixtureTools(ToolRegistry& registry);

// A fresh registry holding the requested tool set.
Result<ToolRegistry, Error> BuildToolRegistry(ToolSetKind kind);

// Identity reported by initialize for each tool set.
ServerInfo DefaultServerInfo(ToolSetKind kind);

// Tool bodies, exposed for direct testing.
Result<std::string, std::string> CalculateTool(const Json& arguments);
Result<std::string, std::string> ReverseStringTool(const Json& arguments);

// Reverse by code point. Malformed UTF-8 bytes are kept as single units.
std::string ReverseUtf8(std::string_view text);

} // namespace mcpline
