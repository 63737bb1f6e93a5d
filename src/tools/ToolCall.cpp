#include "ToolCall.hpp"
#include <spdlog/spdlog.h>

namespace calc_mcp {

namespace {
    double number_argument(const json& arguments, const char* key) {
        auto it = arguments.find(key);
        if (it == arguments.end()) {
            throw ToolError(std::string("invalid arguments: missing '") + key + "'");
        }
        if (!it->is_number()) {
            throw ToolError(std::string("invalid arguments: '") + key +
                            "' must be a number, got " + it->type_name());
        }
        return it->get<double>();
    }
}

Operands parse_operands(const json& arguments) {
    if (!arguments.is_object()) {
        throw ToolError(std::string("invalid arguments: expected an object, got ") +
                        arguments.type_name());
    }

    Operands operands{number_argument(arguments, "a"), number_argument(arguments, "b")};

    for (const auto& item : arguments.items()) {
        if (item.key() != "a" && item.key() != "b") {
            throw ToolError("invalid arguments: unexpected argument '" + item.key() + "'");
        }
    }

    return operands;
}

std::string run_tool(const ToolTable& table, const std::string& name, const json& arguments) {
    const ToolEntry* entry = table.find(name);
    if (!entry) {
        throw ToolError("unknown tool");
    }

    Operands operands = parse_operands(arguments);

    try {
        return format_number(apply(entry->operation, operands));
    } catch (const ArithmeticError& e) {
        throw ToolError(e.what());
    }
}

json execute_call(const ToolTable& table, const json& call) {
    if (!call.is_object()) {
        return {{"name", nullptr}, {"error", "invalid call: expected an object"}};
    }

    auto name_it = call.find("name");
    if (name_it == call.end() || !name_it->is_string()) {
        json name = name_it == call.end() ? json() : *name_it;
        return {{"name", name}, {"error", "invalid call: name must be a string"}};
    }

    const std::string name = name_it->get<std::string>();
    json arguments = call.contains("arguments") ? call.at("arguments") : json::object();

    try {
        std::string text = run_tool(table, name, arguments);
        spdlog::debug("Tool {} returned {}", name, text);
        return {
            {"name", name},
            {"content", json::array({
                {{"type", "text"}, {"text", text}}
            })}
        };
    } catch (const ToolError& e) {
        spdlog::warn("Tool {} failed: {}", name, e.what());
        return {{"name", name}, {"error", e.what()}};
    }
}

} // namespace calc_mcp
