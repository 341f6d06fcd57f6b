#include <catch2/catch_test_macros.hpp>

#include <mcpline/core/log.hpp>
#include <mcpline/mcp/mcp_server.hpp>
#include <mcpline/tools/example_tools.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

using namespace mcpline;

namespace {

ToolRegistry MakeExampleRegistry() {
    auto registry = BuildToolRegistry(ToolSetKind::Example);
    REQUIRE(registry.IsOk());
    return std::move(registry).Value();
}

const ServerInfo kExampleInfo{"python-example-server", "1.0.0"};

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Feed `input` through a fresh server and return its output lines.
std::vector<std::string> Serve(const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);
    server.Run();
    CHECK(server.State() == ServerState::Stopped);
    return SplitLines(out.str());
}

struct CapturedMessage {
    LogLevel level;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>& out) : out_(out) {}

    void Write(LogLevel level, std::string_view /*component*/,
               std::string_view message) override {
        out_.push_back({level, std::string(message)});
    }

private:
    std::vector<CapturedMessage>& out_;
};

// Routes the global logger into `captured` for the lifetime of the scope,
// then leaves a quiet logger behind.
class ScopedCapture {
public:
    explicit ScopedCapture(std::vector<CapturedMessage>& captured) {
        InitGlobalLogger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);
    }
    ~ScopedCapture() {
        InitGlobalLogger(std::make_unique<TextSink>(std::cerr), LogLevel::Error);
    }

    ScopedCapture(const ScopedCapture&) = delete;
    ScopedCapture& operator=(const ScopedCapture&) = delete;
};

std::size_t CountStartingWith(const std::vector<CapturedMessage>& captured,
                              std::string_view prefix) {
    std::size_t count = 0;
    for (const auto& m : captured) {
        if (m.level == LogLevel::Error && m.message.rfind(prefix, 0) == 0) {
            ++count;
        }
    }
    return count;
}

// Output buffer that refuses every write.
class RefusingBuf : public std::streambuf {
protected:
    int_type overflow(int_type /*ch*/) override { return traits_type::eof(); }
};

// Output buffer whose writes throw something that is not a std::exception.
class ThrowingBuf : public std::streambuf {
protected:
    int_type overflow(int_type /*ch*/) override { throw 42; }
};

} // anonymous namespace

// ===========================================================================
// HandleLine
// ===========================================================================

TEST_CASE("McpServer: HandleLine skips blank lines", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    CHECK_FALSE(server.HandleLine("").has_value());
    CHECK_FALSE(server.HandleLine("   \t").has_value());
    CHECK_FALSE(server.HandleLine("\r").has_value());
}

TEST_CASE("McpServer: HandleLine drops malformed JSON", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    CHECK_FALSE(server.HandleLine("{\"jsonrpc\":\"2.0\",").has_value());
    CHECK_FALSE(server.HandleLine("hello").has_value());
}

TEST_CASE("McpServer: HandleLine tolerates CRLF", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    auto response = server.HandleLine(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\r");
    REQUIRE(response.has_value());
    CHECK_FALSE(response->IsError());
}

TEST_CASE("McpServer: non-object JSON gets method-not-found with null id", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    auto response = server.HandleLine("42");
    REQUIRE(response.has_value());
    REQUIRE(response->IsError());
    CHECK(response->Id().is_null());
    CHECK(response->ErrorValue().code == -32601);
}

// ===========================================================================
// Run — full sessions over streams
// ===========================================================================

TEST_CASE("McpServer: initialize handshake", "[mcp][server]") {
    auto lines = Serve(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"1.0"}}})" "\n");

    REQUIRE(lines.size() == 1);
    CHECK(lines[0] ==
          R"({"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"2024-11-05",)"
          R"("capabilities":{"tools":{}},"serverInfo":{"name":"python-example-server","version":"1.0.0"}}})");
}

TEST_CASE("McpServer: reverse_string over the wire", "[mcp][server]") {
    auto lines = Serve(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"reverse_string","arguments":{"text":"abc"}}})" "\n");

    REQUIRE(lines.size() == 1);
    CHECK(lines[0] ==
          R"({"jsonrpc":"2.0","id":3,"result":{"content":[{"type":"text","text":"Original: 'abc' -> Reversed: 'cba'"}]}})");
}

TEST_CASE("McpServer: unknown tool over the wire", "[mcp][server]") {
    auto lines = Serve(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"nope","arguments":{}}})" "\n");

    REQUIRE(lines.size() == 1);
    CHECK(lines[0] ==
          R"({"jsonrpc":"2.0","id":2,"error":{"code":-32601,"message":"Unknown tool: nope"}})");
}

TEST_CASE("McpServer: malformed line is silent and the next is answered", "[mcp][server]") {
    auto lines = Serve(
        "{not json\n"
        R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})" "\n");

    REQUIRE(lines.size() == 1);
    auto response = Json::parse(lines[0]);
    CHECK(response["id"] == 5);
    CHECK(response["result"]["tools"].size() == 2);
}

TEST_CASE("McpServer: responses follow request order", "[mcp][server]") {
    auto lines = Serve(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":"two","method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"calculate","arguments":{"expression":"2 + 2"}}})" "\n"
        R"({"jsonrpc":"2.0","id":4,"method":"ping"})" "\n");

    REQUIRE(lines.size() == 4);
    CHECK(Json::parse(lines[0])["id"] == 1);
    CHECK(Json::parse(lines[1])["id"] == "two");

    auto call = Json::parse(lines[2]);
    CHECK(call["id"] == 3);
    CHECK(call["result"]["content"][0]["text"] == "Result: 2 + 2 = 4");

    auto ping = Json::parse(lines[3]);
    CHECK(ping["id"] == 4);
    CHECK(ping["error"]["code"] == -32601);
    CHECK(ping["error"]["message"] == "Method not found: ping");
}

TEST_CASE("McpServer: null id is echoed", "[mcp][server]") {
    auto lines = Serve(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})" "\n");

    REQUIRE(lines.size() == 1);
    auto response = Json::parse(lines[0]);
    REQUIRE(response.contains("id"));
    CHECK(response["id"].is_null());
}

TEST_CASE("McpServer: calculation fault is -32000", "[mcp][server]") {
    auto lines = Serve(
        R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"calculate","arguments":{"expression":"1 / 0"}}})" "\n");

    REQUIRE(lines.size() == 1);
    CHECK(lines[0] ==
          R"({"jsonrpc":"2.0","id":8,"error":{"code":-32000,"message":"Calculation error: division by zero"}})");
}

TEST_CASE("McpServer: deeply nested expression is -32000 and serving continues",
          "[mcp][server]") {
    const std::size_t depth = 100000;
    const std::string expression =
        std::string(depth, '(') + "1" + std::string(depth, ')');
    auto lines = Serve(
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"calculate","arguments":{"expression":")" +
        expression + R"("}}})" "\n"
        R"({"jsonrpc":"2.0","id":10,"method":"tools/list"})" "\n");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] ==
          R"({"jsonrpc":"2.0","id":9,"error":{"code":-32000,"message":"Calculation error: too many nested parentheses"}})");
    auto next = Json::parse(lines[1]);
    CHECK(next["id"] == 10);
    CHECK(next["result"]["tools"].size() == 2);
}

TEST_CASE("McpServer: last line without newline is still answered", "[mcp][server]") {
    auto lines = Serve(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    CHECK(lines.size() == 1);
}

TEST_CASE("McpServer: empty input stops cleanly", "[mcp][server]") {
    auto lines = Serve("");
    CHECK(lines.empty());
}

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("McpServer: starts in Starting state", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    CHECK(server.State() == ServerState::Starting);
    CHECK_FALSE(server.StopRequested());
    CHECK(server.Registry().Size() == 2);
}

TEST_CASE("McpServer: stop before Run serves nothing", "[mcp][server]") {
    std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n");
    std::ostringstream out;
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    server.RequestStop();
    server.Run();
    CHECK(server.State() == ServerState::Stopped);
    CHECK(out.str().empty());
}

TEST_CASE("McpServer: stop during a request finishes it and reads no further",
          "[mcp][server]") {
    McpServer* target = nullptr;
    ToolRegistry registry;
    REQUIRE(registry.Register(
        {"halt", "Requests a stop, then answers", Json::object()},
        [&target](const Json&) {
            target->RequestStop();
            return Result<std::string, std::string>::Ok("stopping");
        }).IsOk());

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"halt"}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
    std::ostringstream out;
    McpServer server(std::move(registry), kExampleInfo, kDefaultProtocolVersion,
                     in, out);
    target = &server;

    server.Run();

    auto lines = SplitLines(out.str());
    REQUIRE(lines.size() == 1);
    auto response = Json::parse(lines[0]);
    CHECK(response["id"] == 1);
    CHECK(response["result"]["content"][0]["text"] == "stopping");
    CHECK(server.StopRequested());
    CHECK(server.State() == ServerState::Stopped);
}

TEST_CASE("McpServer: throwing output is logged and the loop keeps reading",
          "[mcp][server]") {
    std::vector<CapturedMessage> captured;
    ScopedCapture capture(captured);

    RefusingBuf buf;
    std::ostream out(&buf);
    out.exceptions(std::ios::badbit);
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    REQUIRE_NOTHROW(server.Run());

    CHECK(in.eof());
    CHECK(CountStartingWith(captured, "Unexpected error while handling message: ") >= 1);
    CHECK(server.State() == ServerState::Stopped);
}

TEST_CASE("McpServer: non-standard exception is logged and the loop keeps reading",
          "[mcp][server]") {
    std::vector<CapturedMessage> captured;
    ScopedCapture capture(captured);

    ThrowingBuf buf;
    std::ostream out(&buf);
    out.exceptions(std::ios::badbit);
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
    McpServer server(MakeExampleRegistry(), kExampleInfo, kDefaultProtocolVersion,
                     in, out);

    REQUIRE_NOTHROW(server.Run());

    CHECK(in.eof());
    CHECK(CountStartingWith(
              captured, "Unexpected non-standard exception while handling message") == 1);
    CHECK(server.State() == ServerState::Stopped);
}

TEST_CASE("ServerStateName: all states", "[mcp][server]") {
    CHECK(std::string(ServerStateName(ServerState::Starting)) == "starting");
    CHECK(std::string(ServerStateName(ServerState::Serving)) == "serving");
    CHECK(std::string(ServerStateName(ServerState::Draining)) == "draining");
    CHECK(std::string(ServerStateName(ServerState::Stopped)) == "stopped");
}
