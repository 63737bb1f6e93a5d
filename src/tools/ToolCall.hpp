#pragma once

#include "tools/ToolTable.hpp"
#include <stdexcept>
#include <string>

namespace calc_mcp {

/**
 * @brief Tool-level failure reported inline for a single call
 *
 * what() is the text placed in the call's "error" field,
 * e.g. "unknown tool" or "invalid arguments: missing 'b'".
 */
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Extract the operands of a binary tool
 *
 * Requires an object holding exactly the numeric members "a" and "b".
 *
 * @param arguments Call arguments
 * @return Operands converted to double
 * @throws ToolError prefixed with "invalid arguments: "
 */
Operands parse_operands(const json& arguments);

/**
 * @brief Run one tool by name
 * @param table Tool table to look the name up in
 * @param name Tool name
 * @param arguments Call arguments
 * @return Result rendered as text
 * @throws ToolError for unknown tools, bad arguments or arithmetic failures
 */
std::string run_tool(const ToolTable& table, const std::string& name, const json& arguments);

/**
 * @brief Execute one entry of a tools/call batch
 *
 * Never throws for tool-level failures.
 *
 * @param table Tool table
 * @param call Invocation {name, arguments}
 * @return {name, content: [{type: "text", text}]} or {name, error}
 */
json execute_call(const ToolTable& table, const json& call);

} // namespace calc_mcp
