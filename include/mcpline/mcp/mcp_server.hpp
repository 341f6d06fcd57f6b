#pragma once

#include <mcpline/config/server_config.hpp>
#include <mcpline/mcp/dispatcher.hpp>
#include <mcpline/mcp/message_codec.hpp>
#include <mcpline/mcp/tool_registry.hpp>

#include <atomic>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace mcpline {

enum class ServerState {
    Starting,
    Serving,
    Draining,
    Stopped,
};

const char* ServerStateName(ServerState state);

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over line-delimited stdin/stdout.
//
// Reads one line at a time, answers it completely, then reads the next.
// Blank lines and lines that are not JSON produce no output; every other
// line produces exactly one response line, in arrival order. Nothing but
// encoded responses is ever written to `out`.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry,
              ServerInfo server_info,
              std::string protocol_version = kDefaultProtocolVersion,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Serve until EOF on `in` or until RequestStop(). Returns immediately if
    // a stop was requested before the call.
    void Run();

    // Async-signal-safe: only sets a flag. The request being handled, if
    // any, still completes; no further line is dispatched.
    void RequestStop() noexcept;

    [[nodiscard]] bool StopRequested() const noexcept;
    [[nodiscard]] ServerState State() const noexcept;

    // Decode and dispatch one input line. nullopt for blank or non-JSON lines.
    [[nodiscard]] std::optional<Response> HandleLine(std::string_view line);

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    void Write(const Response& response);

    ToolRegistry registry_;
    Dispatcher dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<ServerState> state_{ServerState::Starting};
};

// Route SIGINT/SIGTERM to server.RequestStop() and ignore SIGPIPE.
// Handlers are installed without SA_RESTART so a blocking read on stdin is
// interrupted. Only one server can be registered at a time.
void InstallTerminationHandlers(McpServer& server);

// Restore default SIGINT/SIGTERM handling and forget the registered server.
void RemoveTerminationHandlers();

} // namespace mcpline
