#include <mcpline/mcp/dispatcher.hpp>

#include <mcpline/core/log.hpp>

namespace mcpline {

namespace {

constexpr const char* kComponent = "dispatch";

} // anonymous namespace

Dispatcher::Dispatcher(const ToolRegistry& registry, ServerInfo server_info,
                       std::string protocol_version)
    : registry_(registry),
      server_info_(std::move(server_info)),
      protocol_version_(std::move(protocol_version)),
      invoker_(registry),
      methods_{
          {"initialize", &Dispatcher::HandleInitialize},
          {"tools/list", &Dispatcher::HandleToolsList},
          {"tools/call", &Dispatcher::HandleToolsCall},
      } {}

Response Dispatcher::Route(const Request& request) const {
    if (request.HasMethodName()) {
        auto it = methods_.find(request.method.get_ref<const std::string&>());
        if (it != methods_.end()) {
            LogDebug(kComponent, "-> " + it->first);
            return (this->*(it->second))(request);
        }
    }

    auto label = request.MethodLabel();
    LogInfo(kComponent, "Method not found: " + label);
    return Response::Failure(request.id, rpc_code::kMethodNotFound,
                             "Method not found: " + label);
}

Response Dispatcher::HandleInitialize(const Request& request) const {
    Json result = Json::object();
    result["protocolVersion"] = protocol_version_;
    result["capabilities"] = {
        {"tools", Json::object()}
    };
    result["serverInfo"] = {
        {"name", server_info_.name},
        {"version", server_info_.version}
    };

    auto client = request.params.find("clientInfo");
    if (client != request.params.end() && client->is_object()) {
        auto name = client->find("name");
        LogInfo(kComponent, "initialize from " +
                                (name != client->end() && name->is_string()
                                     ? name->get<std::string>()
                                     : std::string("<unnamed client>")));
    }
    return Response::Success(request.id, std::move(result));
}

Response Dispatcher::HandleToolsList(const Request& request) const {
    Json tools = Json::array();
    for (const auto& tool : registry_.List()) {
        tools.push_back(tool.descriptor.ToJson());
    }
    return Response::Success(request.id, {{"tools", std::move(tools)}});
}

Response Dispatcher::HandleToolsCall(const Request& request) const {
    auto outcome = invoker_.Invoke(request.params);
    if (outcome.IsErr()) {
        return Response::Failure(request.id, outcome.Error());
    }
    return Response::Success(request.id, std::move(outcome).Value());
}

} // namespace mcpline
