#include <mcpline/core/result.hpp>

#include <sstream>

namespace mcpline {

Error Error::Make(ErrorCategory category, std::string operation,
                  std::string message) {
    Error error;
    error.operation = std::move(operation);
    error.message = std::move(message);
    error.category = category;
    return error;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Decode:         return "decode";
        case ErrorCategory::MethodNotFound: return "method_not_found";
        case ErrorCategory::UnknownTool:    return "unknown_tool";
        case ErrorCategory::ToolExecution:  return "tool_execution";
        case ErrorCategory::Config:         return "config";
        case ErrorCategory::Internal:       return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    oss << " (" << CategoryName() << ")";
    oss << ": " << message;
    return oss.str();
}

} // namespace mcpline
