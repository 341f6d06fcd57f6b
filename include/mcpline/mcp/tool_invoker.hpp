#pragma once

#include <mcpline/core/result.hpp>
#include <mcpline/mcp/message_codec.hpp>
#include <mcpline/mcp/tool_registry.hpp>

namespace mcpline {

// ---------------------------------------------------------------------------
// ToolInvoker — the generic tools/call handler.
//
// params.name resolves the tool (absent or non-string counts as unknown),
// params.arguments (default {}) is handed to its body. The body's text is
// wrapped as {"content":[{"type":"text","text":...}]}. Faults, returned or
// thrown, come back as ErrorCategory::ToolExecution and never escape.
// ---------------------------------------------------------------------------
class ToolInvoker {
public:
    explicit ToolInvoker(const ToolRegistry& registry) : registry_(registry) {}

    [[nodiscard]] Result<Json, Error> Invoke(const Json& params) const;

private:
    const ToolRegistry& registry_;
};

// {"content":[{"type":"text","text":text}]}
Json MakeTextContent(const std::string& text);

} // namespace mcpline
