#include <mcpline/mcp/tool_registry.hpp>

namespace mcpline {

Json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

Result<void, Error> ToolRegistry::Register(ToolDescriptor descriptor,
                                           ToolHandler handler) {
    if (descriptor.name.empty()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "ToolRegistry", "Tool name must not be empty"));
    }
    if (index_.count(descriptor.name) > 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "ToolRegistry",
            "Duplicate tool name: " + descriptor.name));
    }
    if (!handler) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "ToolRegistry",
            "Tool has no handler: " + descriptor.name));
    }

    index_.emplace(descriptor.name, tools_.size());
    tools_.push_back(Tool{std::move(descriptor), std::move(handler)});
    return Result<void, Error>::Ok();
}

const Tool* ToolRegistry::Find(std::string_view name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

} // namespace mcpline
