#include "pattern_solver.hpp"
#include <limits>

namespace {

struct Score {
    int64_t length = 0;
    int64_t count = 0;

    Score plus(const Order& order) const {
        return {length + order.length, count + 1};
    }

    bool better_than(const Score& other) const {
        if (length != other.length) {
            return length > other.length;
        }
        return count < other.count;
    }
};

bool selectable(const Order& order, int64_t capacity) {
    return order.width > 0 && order.width <= capacity && order.length >= 0;
}

} // namespace

size_t PatternSolver::table_bytes(size_t candidates, int64_t capacity) {
    constexpr size_t kMax = std::numeric_limits<size_t>::max();
    if (capacity < 0) {
        return 0;
    }

    const size_t cols = static_cast<size_t>(capacity) + 1;
    if (cols > kMax / sizeof(Score)) {
        return kMax;
    }
    const size_t row = cols * sizeof(Score);

    if (candidates != 0 && cols > (kMax - 7) / candidates) {
        return kMax;
    }
    const size_t decisions = (candidates * cols + 7) / 8;

    if (decisions > kMax - row) {
        return kMax;
    }
    return row + decisions;
}

Pattern PatternSolver::solve(
    const Coil& coil,
    const std::vector<Order>& orders,
    const SolverOptions& options
) {
    Pattern pattern{coil, {}, {}, 0};

    if (coil.width <= 0 || orders.empty()) {
        return pattern;
    }

    // 1. Collect candidates and shrink the capacity to what they can fill
    std::vector<size_t> candidates;
    int64_t capacity = 0;
    int64_t length_bound = 0;
    for (size_t i = 0; i < orders.size(); ++i) {
        const Order& order = orders[i];
        if (!selectable(order, coil.width)) {
            continue;
        }
        candidates.push_back(i);

        if (order.width >= coil.width - capacity) {
            capacity = coil.width;
        } else {
            capacity += order.width;
        }

        // No subset total can exceed the sum of all candidate lengths
        if (order.length > std::numeric_limits<int64_t>::max() - length_bound) {
            throw OptimizationInfeasible(
                "Total order length overflows for coil of width " + std::to_string(coil.width));
        }
        length_bound += order.length;
    }

    if (candidates.empty()) {
        return pattern;
    }

    const size_t bytes = table_bytes(candidates.size(), capacity);
    if (bytes > options.max_table_bytes) {
        throw OptimizationInfeasible(
            "Selection for " + std::to_string(candidates.size()) + " orders on coil of width " +
            std::to_string(coil.width) + " needs " + std::to_string(bytes) +
            " bytes, over the limit of " + std::to_string(options.max_table_bytes));
    }

    // 2. best[c]: best score of the candidates processed so far within capacity c.
    // Candidates are processed from last to first and take[k][c] records whether
    // candidate k belongs to the optimum at c; ties favour taking, so the forward
    // walk below picks the smallest indices.
    const size_t cols = static_cast<size_t>(capacity) + 1;
    std::vector<Score> best(cols);
    std::vector<bool> take(candidates.size() * cols);

    for (size_t k = candidates.size(); k-- > 0;) {
        if (options.deadline && std::chrono::steady_clock::now() > *options.deadline) {
            throw DeadlineExceeded("Deadline passed while solving coil of width " +
                                   std::to_string(coil.width));
        }

        const Order& order = orders[candidates[k]];
        const size_t weight = static_cast<size_t>(order.width);
        for (size_t c = cols; c-- > weight;) {
            Score with = best[c - weight].plus(order);
            if (!best[c].better_than(with)) {
                best[c] = with;
                take[k * cols + c] = true;
            }
        }
    }

    // 3. Reconstruct
    size_t remaining = cols - 1;
    for (size_t k = 0; k < candidates.size(); ++k) {
        if (take[k * cols + remaining]) {
            const Order& order = orders[candidates[k]];
            pattern.cuts.push_back(order.width);
            pattern.order_indices.push_back(candidates[k]);
            pattern.total_length += order.length;
            remaining -= static_cast<size_t>(order.width);
        }
    }

    // 4. Certificate check
    int64_t used = 0;
    for (int64_t cut : pattern.cuts) {
        used += cut;
    }
    if (used > coil.width || pattern.total_length != best[cols - 1].length) {
        throw OptimizationInfeasible(
            "Selection for coil of width " + std::to_string(coil.width) +
            " failed verification (used width " + std::to_string(used) + ")");
    }

    return pattern;
}
