#pragma once

#include "core/Arithmetic.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace calc_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief A tool descriptor bound to the operation it runs
 */
struct ToolEntry {
    ToolInfo info;
    Operation operation;
};

/**
 * @brief Immutable, ordered mapping from tool name to operation
 *
 * Built once at startup and shared read-only with the server.
 * Iteration follows declaration order.
 */
class ToolTable {
public:
    /**
     * @brief Construct table from entries
     * @param entries Tools in advertisement order
     * @throws std::invalid_argument on an empty or duplicate name
     */
    explicit ToolTable(std::vector<ToolEntry> entries);

    /**
     * @brief The fixed calculator table: add, subtract, multiply, divide
     */
    static ToolTable arithmetic();

    /**
     * @brief Look up a tool by name
     * @return Entry or nullptr when no tool has that name
     */
    const ToolEntry* find(const std::string& name) const;

    size_t size() const { return entries_.size(); }

    /**
     * @brief Descriptors in the shape returned by tools/list
     */
    json descriptors() const;

private:
    std::vector<ToolEntry> entries_;
};

} // namespace calc_mcp
