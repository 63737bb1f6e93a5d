#include "Arithmetic.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdint>

namespace calc_mcp {

namespace {
    // Largest magnitude below which every whole double is an exact integer
    constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53
}

double apply(Operation op, const Operands& operands) {
    const double a = operands.a;
    const double b = operands.b;
    double result = 0.0;

    switch (op) {
        case Operation::Add:
            result = a + b;
            break;
        case Operation::Subtract:
            result = a - b;
            break;
        case Operation::Multiply:
            result = a * b;
            break;
        case Operation::Divide:
            if (b == 0.0) {
                throw ArithmeticError("division by zero");
            }
            result = a / b;
            break;
    }

    if (!std::isfinite(result)) {
        throw ArithmeticError("arithmetic overflow");
    }

    spdlog::debug("{}({}, {}) = {}", to_string(op), a, b, result);
    return result;
}

std::string format_number(double value) {
    if (std::trunc(value) == value && std::fabs(value) < kMaxExactInteger) {
        return std::to_string(static_cast<std::int64_t>(value));
    }
    // nlohmann's serializer emits the shortest round-trip representation
    return nlohmann::json(value).dump();
}

std::string_view to_string(Operation op) {
    switch (op) {
        case Operation::Add:      return "add";
        case Operation::Subtract: return "subtract";
        case Operation::Multiply: return "multiply";
        case Operation::Divide:   return "divide";
    }
    return "unknown";
}

} // namespace calc_mcp
