#include <mcpline/mcp/message_codec.hpp>

namespace mcpline {

std::string Request::MethodLabel() const {
    if (method.is_string()) {
        return method.get<std::string>();
    }
    if (method.is_null()) {
        return "<missing>";
    }
    return method.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
Response Response::Success(Json id, Json result) {
    return Response(std::move(id), Result<Json, RpcError>::Ok(std::move(result)));
}

Response Response::Failure(Json id, int code, std::string message) {
    return Response(std::move(id),
                    Result<Json, RpcError>::Err(RpcError{code, std::move(message)}));
}

Response Response::Failure(Json id, const Error& error) {
    return Failure(std::move(id), error.RpcCode(), error.message);
}

Json Response::ToJson() const {
    Json envelope = Json::object();
    envelope["jsonrpc"] = "2.0";
    envelope["id"] = id_;
    if (outcome_.IsOk()) {
        envelope["result"] = outcome_.Value();
    } else {
        const auto& error = outcome_.Error();
        envelope["error"] = {
            {"code", error.code},
            {"message", error.message}
        };
    }
    return envelope;
}

// ---------------------------------------------------------------------------
// Codec
// ---------------------------------------------------------------------------
Result<Request, Error> DecodeRequest(std::string_view line) {
    Json message;
    try {
        message = Json::parse(line.begin(), line.end());
    } catch (const Json::parse_error& e) {
        return Result<Request, Error>::Err(
            Error::Make(ErrorCategory::Decode, "DecodeRequest", e.what()));
    }

    Request request;
    if (!message.is_object()) {
        return Result<Request, Error>::Ok(std::move(request));
    }

    if (auto it = message.find("id"); it != message.end()) {
        request.id = *it;
    }
    if (auto it = message.find("method"); it != message.end()) {
        request.method = *it;
    }
    if (auto it = message.find("params"); it != message.end() && it->is_object()) {
        request.params = *it;
    }
    return Result<Request, Error>::Ok(std::move(request));
}

std::string EncodeResponse(const Response& response) {
    auto line = response.ToJson().dump(-1, ' ', false,
                                        Json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

} // namespace mcpline
