#pragma once

#include "types.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <vector>

// The solver could not certify a result for a coil.
class OptimizationInfeasible : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DeadlineExceeded : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SolverOptions {
    // Upper bound on the working memory of one solve, see PatternSolver::table_bytes.
    size_t max_table_bytes = size_t{256} << 20;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

class PatternSolver {
public:
    // Select the subset of orders that fits within coil.width and maximizes the
    // total order length (exact 0/1 knapsack over integer widths).
    //
    // Ties are broken by preferring fewer orders, then the lexicographically
    // smallest ascending list of order indices, so equal inputs always give
    // equal patterns.
    //
    // Orders that cannot be selected (width <= 0, width > coil.width, negative
    // length) are skipped. An empty catalog or a coil width <= 0 yields an empty
    // pattern.
    static Pattern solve(
        const Coil& coil,
        const std::vector<Order>& orders,
        const SolverOptions& options = SolverOptions{}
    );

    // Bytes needed to solve `candidates` orders against `capacity` mm: one score
    // row of capacity + 1 cells plus one decision bit per candidate and cell.
    // Saturates at SIZE_MAX.
    static size_t table_bytes(size_t candidates, int64_t capacity);
};
