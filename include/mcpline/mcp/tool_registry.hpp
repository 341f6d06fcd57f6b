#pragma once

#include <mcpline/core/result.hpp>
#include <mcpline/mcp/message_codec.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpline {

// ---------------------------------------------------------------------------
// ToolDescriptor — what tools/list advertises for one tool.
//
// input_schema is documentation for clients; calls are never validated
// against it.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    Json input_schema;

    [[nodiscard]] Json ToJson() const;
};

// A tool body: arguments object in, text out, or a fault description.
// Throwing std::exception is also treated as a fault by the invoker.
using ToolHandler = std::function<Result<std::string, std::string>(const Json& arguments)>;

struct Tool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

// ---------------------------------------------------------------------------
// ToolRegistry — ordered, name-unique catalog of tools.
//
// Filled once during startup, read-only while the server loop runs.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Fails if a tool with the same name is already registered.
    Result<void, Error> Register(ToolDescriptor descriptor, ToolHandler handler);

    // Tools in registration order.
    [[nodiscard]] const std::vector<Tool>& List() const noexcept {
        return tools_;
    }

    // Exact, case-sensitive lookup. nullptr when absent.
    [[nodiscard]] const Tool* Find(std::string_view name) const;

    [[nodiscard]] std::size_t Size() const noexcept { return tools_.size(); }

private:
    std::vector<Tool> tools_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace mcpline
