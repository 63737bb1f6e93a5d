#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace calc_mcp {

/**
 * @brief Closed set of arithmetic operations exposed as tools
 */
enum class Operation {
    Add,
    Subtract,
    Multiply,
    Divide
};

/**
 * @brief Two scalar operands of a binary operation
 */
struct Operands {
    double a;
    double b;
};

/**
 * @brief Raised when an operation cannot produce a result
 *
 * Carries the short reason reported back to the caller
 * ("division by zero", "arithmetic overflow").
 */
class ArithmeticError : public std::runtime_error {
public:
    explicit ArithmeticError(const std::string& reason)
        : std::runtime_error(reason) {}
};

/**
 * @brief Evaluate a binary operation
 * @param op Operation to apply
 * @param operands Left (a) and right (b) operands
 * @return a op b
 * @throws ArithmeticError on division by zero or a non-finite result
 */
double apply(Operation op, const Operands& operands);

/**
 * @brief Render a result as text
 *
 * Whole numbers below 2^53 in magnitude are rendered without a fractional
 * part ("6", not "6.0"). Everything else uses the shortest decimal form
 * that parses back to the same double.
 */
std::string format_number(double value);

std::string_view to_string(Operation op);

} // namespace calc_mcp
