#include <mcpline/mcp/tool_invoker.hpp>

#include <mcpline/core/log.hpp>

#include <exception>
#include <string>

namespace mcpline {

namespace {

constexpr const char* kComponent = "tools";

std::string ToolNameLabel(const Json& params) {
    auto it = params.find("name");
    if (it == params.end() || it->is_null()) {
        return "<missing>";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump(-1, ' ', false, Json::error_handler_t::replace);
}

Error ExecutionError(std::string message) {
    return Error::Make(ErrorCategory::ToolExecution, "ToolInvoker",
                       std::move(message));
}

} // anonymous namespace

Json MakeTextContent(const std::string& text) {
    return {
        {"content", Json::array({
            {{"type", "text"}, {"text", text}}
        })}
    };
}

Result<Json, Error> ToolInvoker::Invoke(const Json& params) const {
    const Tool* tool = nullptr;
    if (auto it = params.find("name"); it != params.end() && it->is_string()) {
        tool = registry_.Find(it->get<std::string>());
    }
    if (tool == nullptr) {
        auto name = ToolNameLabel(params);
        LogInfo(kComponent, "Unknown tool requested: " + name);
        return Result<Json, Error>::Err(Error::Make(
            ErrorCategory::UnknownTool, "ToolInvoker", "Unknown tool: " + name));
    }

    Json arguments = Json::object();
    if (auto it = params.find("arguments"); it != params.end() && it->is_object()) {
        arguments = *it;
    }

    const auto& name = tool->descriptor.name;
    LogDebug(kComponent, "Invoking " + name + " with " +
                             arguments.dump(-1, ' ', false,
                                            Json::error_handler_t::replace));

    try {
        auto outcome = tool->handler(arguments);
        if (outcome.IsErr()) {
            LogWarn(kComponent, name + " failed: " + outcome.Error());
            return Result<Json, Error>::Err(
                ExecutionError(std::move(outcome).Error()));
        }
        return Result<Json, Error>::Ok(MakeTextContent(outcome.Value()));
    } catch (const std::exception& e) {
        LogWarn(kComponent, name + " threw: " + e.what());
        return Result<Json, Error>::Err(
            ExecutionError("Tool '" + name + "' failed: " + e.what()));
    } catch (...) {
        LogWarn(kComponent, name + " threw a non-standard exception");
        return Result<Json, Error>::Err(
            ExecutionError("Tool '" + name + "' failed: unknown error"));
    }
}

} // namespace mcpline
