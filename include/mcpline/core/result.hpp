#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace mcpline {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// JSON-RPC error codes surfaced to clients.
// ---------------------------------------------------------------------------
namespace rpc_code {

constexpr int kMethodNotFound = -32601;
constexpr int kInternalError  = -32603;
constexpr int kServerError    = -32000;

} // namespace rpc_code

// ---------------------------------------------------------------------------
// ErrorCategory — classifies failures by where they surface.
//
//   Decode          input line is not JSON; logged, never answered
//   MethodNotFound  unknown or missing JSON-RPC method
//   UnknownTool     tools/call names a tool that is not registered
//   ToolExecution   the tool body itself failed
//   Config          invalid command line or configuration file
//   Internal        anything else
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Decode,
    MethodNotFound,
    UnknownTool,
    ToolExecution,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error value carried by Result<T, Error>.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    static Error Make(ErrorCategory category, std::string operation,
                      std::string message);

    // Unknown methods and unknown tools share -32601; existing clients
    // depend on that.
    [[nodiscard]] int RpcCode() const {
        switch (category) {
            case ErrorCategory::MethodNotFound: return rpc_code::kMethodNotFound;
            case ErrorCategory::UnknownTool:    return rpc_code::kMethodNotFound;
            case ErrorCategory::ToolExecution:  return rpc_code::kServerError;
            case ErrorCategory::Decode:         return rpc_code::kInternalError;
            case ErrorCategory::Config:         return rpc_code::kInternalError;
            case ErrorCategory::Internal:       return rpc_code::kInternalError;
        }
        return rpc_code::kInternalError;
    }

    [[nodiscard]] int ExitCode() const {
        return category == ErrorCategory::Config ? 2 : 1;
    }

    [[nodiscard]] std::string CategoryName() const;
    [[nodiscard]] std::string ToString() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace mcpline
