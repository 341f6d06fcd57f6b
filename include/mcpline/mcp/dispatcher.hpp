#pragma once

#include <mcpline/mcp/message_codec.hpp>
#include <mcpline/mcp/tool_invoker.hpp>
#include <mcpline/mcp/tool_registry.hpp>

#include <map>
#include <string>

namespace mcpline {

// Static identity reported by initialize.
struct ServerInfo {
    std::string name;
    std::string version;

    bool operator==(const ServerInfo& other) const {
        return name == other.name && version == other.version;
    }
};

// ---------------------------------------------------------------------------
// Dispatcher — total mapping from a decoded request to one response.
//
//   initialize   -> protocolVersion, capabilities {tools:{}}, serverInfo
//   tools/list   -> registered tools in registration order
//   tools/call   -> ToolInvoker
//   otherwise    -> -32601 "Method not found: <method>"
//
// Holds only read-only state; the registry must outlive the dispatcher.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry, ServerInfo server_info,
               std::string protocol_version);

    [[nodiscard]] Response Route(const Request& request) const;

    [[nodiscard]] const ServerInfo& Info() const noexcept { return server_info_; }

private:
    using MethodHandler = Response (Dispatcher::*)(const Request&) const;

    Response HandleInitialize(const Request& request) const;
    Response HandleToolsList(const Request& request) const;
    Response HandleToolsCall(const Request& request) const;

    const ToolRegistry& registry_;
    ServerInfo server_info_;
    std::string protocol_version_;
    ToolInvoker invoker_;
    std::map<std::string, MethodHandler, std::less<>> methods_;
};

} // namespace mcpline
