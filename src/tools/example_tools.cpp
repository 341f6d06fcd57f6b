#include <mcpline/tools/example_tools.hpp>

#include <mcpline/core/log.hpp>
#include <mcpline/tools/calculator.hpp>

#include <vector>

namespace mcpline {

namespace {

constexpr const char* kComponent = "tools";

// ---------------------------------------------------------------------------
// Schema helpers
// ---------------------------------------------------------------------------

Json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

Json MakeSchema(const Json& properties, const Json& required) {
    Json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

// Length of the UTF-8 sequence starting at text[i], or 1 when the bytes
// there do not form a complete sequence.
std::size_t SequenceLength(std::string_view text, std::size_t i) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t len = 1;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
    }
    if (i + len > text.size()) {
        return 1;
    }
    for (std::size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return len;
}

Result<std::string, std::string> FixtureTool(const Json& /*arguments*/) {
    return Result<std::string, std::string>::Ok("Result A");
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Tool bodies
// ---------------------------------------------------------------------------

std::string ReverseUtf8(std::string_view text) {
    std::vector<std::string_view> units;
    for (std::size_t i = 0; i < text.size();) {
        auto len = SequenceLength(text, i);
        units.push_back(text.substr(i, len));
        i += len;
    }
    std::string reversed;
    reversed.reserve(text.size());
    for (auto it = units.rbegin(); it != units.rend(); ++it) {
        reversed.append(it->data(), it->size());
    }
    return reversed;
}

Result<std::string, std::string> CalculateTool(const Json& arguments) {
    std::string expression;
    auto it = arguments.find("expression");
    if (it != arguments.end()) {
        if (!it->is_string()) {
            return Result<std::string, std::string>::Err(
                "Calculation error: expression must be a string");
        }
        expression = it->get<std::string>();
    }

    auto value = EvaluateExpression(expression);
    if (value.IsErr()) {
        LogDebug(kComponent, "calculate '" + expression + "': " + value.Error());
        return Result<std::string, std::string>::Err("Calculation error: " +
                                                     value.Error());
    }
    return Result<std::string, std::string>::Ok(
        "Result: " + expression + " = " + FormatNumber(value.Value()));
}

Result<std::string, std::string> ReverseStringTool(const Json& arguments) {
    std::string text;
    auto it = arguments.find("text");
    if (it != arguments.end()) {
        if (!it->is_string()) {
            return Result<std::string, std::string>::Err("text must be a string");
        }
        text = it->get<std::string>();
    }
    return Result<std::string, std::string>::Ok(
        "Original: '" + text + "' -> Reversed: '" + ReverseUtf8(text) + "'");
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

Result<void, Error> RegisterExampleTools(ToolRegistry& registry) {
    auto calc = registry.Register(
        {"calculate",
         "Perform basic mathematical calculations",
         MakeSchema(
             {{"expression",
               StringProp("Mathematical expression to evaluate (e.g., '2 + 2')")}},
             {"expression"})},
        CalculateTool);
    if (calc.IsErr()) {
        return calc;
    }

    return registry.Register(
        {"reverse_string",
         "Reverse a given string",
         MakeSchema({{"text", StringProp("Text to reverse")}}, {"text"})},
        ReverseStringTool);
}

Result<void, Error> RegisterFixtureTools(ToolRegistry& registry) {
    return registry.Register(
        {"test_tool",
         "A simple test tool that returns a specific result",
         MakeSchema({{"input", StringProp("Test input parameter")}}, Json::array())},
        FixtureTool);
}

Result<ToolRegistry, Error> BuildToolRegistry(ToolSetKind kind) {
    ToolRegistry registry;
    auto registered = kind == ToolSetKind::Fixture ? RegisterFixtureTools(registry)
                                                   : RegisterExampleTools(registry);
    if (registered.IsErr()) {
        return Result<ToolRegistry, Error>::Err(std::move(registered).Error());
    }
    return Result<ToolRegistry, Error>::Ok(std::move(registry));
}

ServerInfo DefaultServerInfo(ToolSetKind kind) {
    if (kind == ToolSetKind::Fixture) {
        return {"test-server-v1", "1.0.0"};
    }
    return {"python-example-server", "1.0.0"};
}

} // namespace mcpline
