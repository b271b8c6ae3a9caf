#pragma once

#include "types.hpp"
#include <string>
#include <vector>

class PlanReport {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_BAD_INPUT = 1;
    static constexpr int EXIT_PARTIAL = 2;

    // "Patterns Before Shear Adjustment" and "Patterns After Shear Adjustment"
    // tables, one tab-separated row per coil. Failed slots show their message.
    static std::string tables(const Plan& plan, const std::vector<Coil>& coils);

    // EXIT_PARTIAL when a coil failed or an order was rejected, EXIT_OK otherwise.
    static int exit_code(const Plan& plan);
};
