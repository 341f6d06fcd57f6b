#include <catch2/catch_test_macros.hpp>

#include <mcpline/mcp/dispatcher.hpp>

#include <string>

using namespace mcpline;

namespace {

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    auto first = registry.Register(
        {"first", "First tool", {{"type", "object"}}},
        [](const Json&) { return Result<std::string, std::string>::Ok("one"); });
    auto second = registry.Register(
        {"second", "Second tool", {{"type", "object"}}},
        [](const Json&) { return Result<std::string, std::string>::Err("broken"); });
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    return registry;
}

Request MakeRequest(Json id, std::string method, Json params = Json::object()) {
    Request request;
    request.id = std::move(id);
    request.method = std::move(method);
    request.params = std::move(params);
    return request;
}

const ServerInfo kInfo{"test-server", "0.0.1"};

} // anonymous namespace

// ===========================================================================
// initialize
// ===========================================================================

TEST_CASE("Dispatcher: initialize reports version, capabilities, identity", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(1, "initialize",
        {{"protocolVersion", "2024-11-05"},
         {"clientInfo", {{"name", "tester"}, {"version", "1"}}}}));

    REQUIRE_FALSE(response.IsError());
    CHECK(response.Id() == 1);
    const auto& result = response.ResultValue();
    CHECK(result.dump() ==
          R"({"protocolVersion":"2024-11-05","capabilities":{"tools":{}},)"
          R"("serverInfo":{"name":"test-server","version":"0.0.1"}})");
}

TEST_CASE("Dispatcher: initialize tolerates missing params", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest("init", "initialize"));
    REQUIRE_FALSE(response.IsError());
    CHECK(response.Id() == "init");
    CHECK(response.ResultValue()["serverInfo"]["name"] == "test-server");
}

TEST_CASE("Dispatcher: protocol version is configurable", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2025-03-26");

    auto response = dispatcher.Route(MakeRequest(1, "initialize"));
    CHECK(response.ResultValue()["protocolVersion"] == "2025-03-26");
}

// ===========================================================================
// tools/list
// ===========================================================================

TEST_CASE("Dispatcher: tools/list in registration order", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(2, "tools/list"));
    REQUIRE_FALSE(response.IsError());
    const auto& tools = response.ResultValue()["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "first");
    CHECK(tools[0]["description"] == "First tool");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
    CHECK(tools[1]["name"] == "second");
}

TEST_CASE("Dispatcher: tools/list is idempotent", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto a = dispatcher.Route(MakeRequest(1, "tools/list"));
    auto b = dispatcher.Route(MakeRequest(1, "tools/list"));
    CHECK(a.ToJson() == b.ToJson());
}

TEST_CASE("Dispatcher: tools/list with empty registry", "[mcp][dispatch]") {
    ToolRegistry empty;
    Dispatcher dispatcher(empty, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(1, "tools/list"));
    REQUIRE_FALSE(response.IsError());
    CHECK(response.ResultValue()["tools"].is_array());
    CHECK(response.ResultValue()["tools"].empty());
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("Dispatcher: tools/call success", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(3, "tools/call", {{"name", "first"}}));
    REQUIRE_FALSE(response.IsError());
    CHECK(response.ResultValue()["content"][0]["text"] == "one");
}

TEST_CASE("Dispatcher: tools/call unknown tool is -32601", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(2, "tools/call",
                                                 {{"name", "nope"}, {"arguments", Json::object()}}));
    REQUIRE(response.IsError());
    CHECK(response.Id() == 2);
    CHECK(response.ErrorValue().code == -32601);
    CHECK(response.ErrorValue().message == "Unknown tool: nope");
}

TEST_CASE("Dispatcher: tools/call fault is -32000", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(4, "tools/call", {{"name", "second"}}));
    REQUIRE(response.IsError());
    CHECK(response.ErrorValue().code == -32000);
    CHECK(response.ErrorValue().message == "broken");
}

// ===========================================================================
// Unknown methods
// ===========================================================================

TEST_CASE("Dispatcher: unknown method", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(5, "resources/list"));
    REQUIRE(response.IsError());
    CHECK(response.ErrorValue().code == -32601);
    CHECK(response.ErrorValue().message == "Method not found: resources/list");
}

TEST_CASE("Dispatcher: method names are case-sensitive", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    auto response = dispatcher.Route(MakeRequest(6, "Tools/List"));
    REQUIRE(response.IsError());
    CHECK(response.ErrorValue().code == -32601);
}

TEST_CASE("Dispatcher: missing method", "[mcp][dispatch]") {
    auto registry = MakeTestRegistry();
    Dispatcher dispatcher(registry, kInfo, "2024-11-05");

    Request request;
    request.id = 9;
    auto response = dispatcher.Route(request);
    REQUIRE(response.IsError());
    CHECK(response.Id() == 9);
    CHECK(response.ErrorValue().message == "Method not found: <missing>");
}
