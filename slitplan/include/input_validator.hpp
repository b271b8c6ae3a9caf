#pragma once

#include "types.hpp"
#include <vector>
#include <string>

class InputValidator {
public:
    struct Result {
        bool valid;
        std::string reason;
    };

    // A coil of width 0 is valid and simply yields an empty pattern.
    static Result validate(const Coil& coil);

    static Result validate(const Order& order);

    // One issue per offending order, in catalog order.
    static std::vector<RecordIssue> validate(const std::vector<Order>& orders);
};
