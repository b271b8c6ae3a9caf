#include "input_validator.hpp"

InputValidator::Result InputValidator::validate(const Coil& coil) {
    // Check 1: Width >= 0
    if (coil.width < 0) {
        return {false, "Coil width must not be negative. Found: " + std::to_string(coil.width)};
    }

    // Check 2: Length >= 0
    if (coil.length < 0) {
        return {false, "Coil length must not be negative. Found: " + std::to_string(coil.length)};
    }

    return {true, ""};
}

InputValidator::Result InputValidator::validate(const Order& order) {
    // Check 1: Width > 0
    if (order.width <= 0) {
        return {false, "Order width must be positive. Found: " + std::to_string(order.width)};
    }

    // Check 2: Length >= 0
    if (order.length < 0) {
        return {false, "Order length must not be negative. Found: " + std::to_string(order.length)};
    }

    return {true, ""};
}

std::vector<RecordIssue> InputValidator::validate(const std::vector<Order>& orders) {
    std::vector<RecordIssue> issues;

    for (size_t i = 0; i < orders.size(); ++i) {
        auto result = validate(orders[i]);
        if (!result.valid) {
            issues.push_back({"order", i, result.reason});
        }
    }

    return issues;
}
