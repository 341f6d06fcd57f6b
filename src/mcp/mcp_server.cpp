#include <mcpline/mcp/mcp_server.hpp>

#include <mcpline/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <csignal>
#include <exception>
#include <string>

#ifndef _WIN32
#include <signal.h>
#endif

namespace mcpline {

namespace {

constexpr const char* kComponent = "server";

bool IsBlank(std::string_view line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // anonymous namespace

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Starting: return "starting";
        case ServerState::Serving:  return "serving";
        case ServerState::Draining: return "draining";
        case ServerState::Stopped:  return "stopped";
    }
    return "unknown";
}

McpServer::McpServer(ToolRegistry registry,
                     ServerInfo server_info,
                     std::string protocol_version,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)),
      dispatcher_(registry_, std::move(server_info), std::move(protocol_version)),
      in_(in),
      out_(out) {}

void McpServer::Run() {
    if (stop_requested_.load()) {
        state_ = ServerState::Stopped;
        LogInfo(kComponent, "Stop requested before start; not serving");
        return;
    }

    state_ = ServerState::Serving;
    LogInfo(kComponent, dispatcher_.Info().name + " " + dispatcher_.Info().version +
                            " ready, " + std::to_string(registry_.Size()) +
                            " tool(s)");

    std::string line;
    while (!stop_requested_.load() && std::getline(in_, line)) {
        // A stop that arrived while blocked in the read wins over the line.
        if (stop_requested_.load()) {
            break;
        }
        try {
            auto response = HandleLine(line);
            if (response) {
                Write(*response);
            }
        } catch (const std::exception& e) {
            LogError(kComponent,
                     std::string("Unexpected error while handling message: ") +
                         e.what());
        } catch (...) {
            LogError(kComponent,
                     "Unexpected non-standard exception while handling message");
        }
    }

    state_ = ServerState::Draining;
    if (stop_requested_.load()) {
        LogInfo(kComponent, "Termination requested, shutting down");
    } else {
        LogInfo(kComponent, "Input closed, shutting down");
    }
    try {
        out_.flush();
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("Final flush failed: ") + e.what());
    }
    state_ = ServerState::Stopped;
}

void McpServer::RequestStop() noexcept {
    stop_requested_.store(true);
}

bool McpServer::StopRequested() const noexcept {
    return stop_requested_.load();
}

ServerState McpServer::State() const noexcept {
    return state_.load();
}

std::optional<Response> McpServer::HandleLine(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (IsBlank(line)) {
        return std::nullopt;
    }

    auto decoded = DecodeRequest(line);
    if (decoded.IsErr()) {
        LogWarn(kComponent, "Dropping unparsable line: " + decoded.Error().message);
        return std::nullopt;
    }

    return dispatcher_.Route(decoded.Value());
}

void McpServer::Write(const Response& response) {
    out_ << EncodeResponse(response);
    out_.flush();
    if (!out_) {
        LogError(kComponent, "Output stream failed; stopping");
        RequestStop();
    }
}

// ---------------------------------------------------------------------------
// Termination signals
// ---------------------------------------------------------------------------
namespace {

std::atomic<McpServer*> g_signal_target{nullptr};

void HandleTerminationSignal(int /*signum*/) {
    if (auto* server = g_signal_target.load()) {
        server->RequestStop();
    }
}

} // anonymous namespace

void InstallTerminationHandlers(McpServer& server) {
    g_signal_target.store(&server);
#ifdef _WIN32
    std::signal(SIGINT, HandleTerminationSignal);
    std::signal(SIGTERM, HandleTerminationSignal);
#else
    struct sigaction action {};
    action.sa_handler = HandleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 ||
        sigaction(SIGTERM, &action, nullptr) != 0) {
        LogWarn(kComponent, "Could not install termination handlers");
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        LogWarn(kComponent, "Could not ignore SIGPIPE");
    }
#endif
    LogDebug(kComponent, "Termination handlers installed");
}

void RemoveTerminationHandlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_target.store(nullptr);
}

} // namespace mcpline
