#include "ToolTable.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace calc_mcp {

namespace {
    json binary_schema(const std::string& a_description, const std::string& b_description) {
        return {
            {"type", "object"},
            {"properties", {
                {"a", {{"type", "number"}, {"description", a_description}}},
                {"b", {{"type", "number"}, {"description", b_description}}}
            }},
            {"required", json::array({"a", "b"})}
        };
    }
}

ToolTable::ToolTable(std::vector<ToolEntry> entries)
    : entries_(std::move(entries)) {
    std::set<std::string> names;
    for (const auto& entry : entries_) {
        if (entry.info.name.empty()) {
            throw std::invalid_argument("Tool name cannot be empty");
        }
        if (!names.insert(entry.info.name).second) {
            throw std::invalid_argument("Duplicate tool name: " + entry.info.name);
        }
    }
    spdlog::debug("ToolTable built with {} tools", entries_.size());
}

ToolTable ToolTable::arithmetic() {
    return ToolTable({
        {{"add", "Add two numbers",
          binary_schema("First number", "Second number")}, Operation::Add},
        {{"subtract", "Subtract second number from first",
          binary_schema("First number", "Second number")}, Operation::Subtract},
        {{"multiply", "Multiply two numbers",
          binary_schema("First number", "Second number")}, Operation::Multiply},
        {{"divide", "Divide first number by second",
          binary_schema("Numerator", "Denominator")}, Operation::Divide}
    });
}

const ToolEntry* ToolTable::find(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&name](const ToolEntry& entry) { return entry.info.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

json ToolTable::descriptors() const {
    json tools_array = json::array();

    for (const auto& entry : entries_) {
        tools_array.push_back({
            {"name", entry.info.name},
            {"description", entry.info.description},
            {"inputSchema", entry.info.input_schema}
        });
    }

    return tools_array;
}

} // namespace calc_mcp
