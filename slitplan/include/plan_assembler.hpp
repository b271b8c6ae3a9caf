#pragma once

#include "types.hpp"
#include "pattern_solver.hpp"
#include <chrono>
#include <optional>
#include <vector>

struct AssemblerOptions {
    // Worker threads; 0 uses the hardware concurrency. Never more than the coil count.
    unsigned threads = 0;
    // Overall deadline. Slots not finished by then are marked DEADLINE_EXCEEDED.
    std::optional<std::chrono::steady_clock::time_point> deadline;
    // Solver memory for the whole run, split evenly across the workers.
    size_t max_memory_bytes = size_t{1} << 30;
};

class PlanAssembler {
public:
    // Solve and sequence every coil independently against the full order catalog.
    //
    // Invalid orders are dropped from the catalog and reported in
    // Plan::rejected_orders. A failing coil is marked in its own slot; the other
    // coils are still solved. The returned plan always has one entry per coil,
    // in input order. Each worker may use max_memory_bytes / workers for a solve,
    // where workers is the thread count after clamping to the coil count.
    static Plan assemble(
        const std::vector<Coil>& coils,
        const std::vector<Order>& orders,
        const AssemblerOptions& options = AssemblerOptions{}
    );

    // Single slot: validate, solve and sequence one coil.
    static PlanEntry assemble_one(
        const Coil& coil,
        const std::vector<Order>& orders,
        const SolverOptions& options
    );
};
