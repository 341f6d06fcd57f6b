#pragma once

#include <mcpline/core/result.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcpline {

// Insertion-ordered JSON keeps envelopes and schemas in the order they were
// written ("jsonrpc", "id", "result" on the wire).
using Json = nlohmann::ordered_json;

// ---------------------------------------------------------------------------
// Request — one decoded JSON-RPC request.
//
// Extraction is lenient: a missing id becomes null, missing or non-object
// params become {}. `method` keeps the raw value (null when absent) so an
// unroutable method can be echoed back in the error message.
// ---------------------------------------------------------------------------
struct Request {
    Json id = nullptr;
    Json method = nullptr;
    Json params = Json::object();

    [[nodiscard]] bool HasMethodName() const noexcept { return method.is_string(); }

    // Method name, or a printable stand-in when it is missing or not a string.
    [[nodiscard]] std::string MethodLabel() const;
};

struct RpcError {
    int code = 0;
    std::string message;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message;
    }
};

// ---------------------------------------------------------------------------
// Response — exactly one of {id, result} or {id, error:{code, message}}.
// ---------------------------------------------------------------------------
class Response {
public:
    static Response Success(Json id, Json result);
    static Response Failure(Json id, int code, std::string message);
    static Response Failure(Json id, const Error& error);

    [[nodiscard]] const Json& Id() const noexcept { return id_; }
    [[nodiscard]] bool IsError() const noexcept { return outcome_.IsErr(); }
    [[nodiscard]] const Json& ResultValue() const { return outcome_.Value(); }
    [[nodiscard]] const RpcError& ErrorValue() const { return outcome_.Error(); }

    // Full envelope, including "jsonrpc": "2.0".
    [[nodiscard]] Json ToJson() const;

private:
    Response(Json id, Result<Json, RpcError> outcome)
        : id_(std::move(id)), outcome_(std::move(outcome)) {}

    Json id_;
    Result<Json, RpcError> outcome_;
};

// Parse one input line. Fails with ErrorCategory::Decode if it is not JSON.
// A JSON value that is not an object yields a request without a method.
Result<Request, Error> DecodeRequest(std::string_view line);

// Serialize a response to one line terminated by '\n'. Never throws on
// invalid UTF-8; offending bytes are replaced.
std::string EncodeResponse(const Response& response);

} // namespace mcpline
