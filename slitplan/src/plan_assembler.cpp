#include "plan_assembler.hpp"
#include "input_validator.hpp"
#include "shear_sequencer.hpp"
#include <algorithm>
#include <atomic>
#include <new>
#include <string>
#include <thread>
#include <utility>

namespace {

PlanEntry failed(ErrorKind error, std::string message) {
    return {SlotStatus::FAILED, error, std::move(message), std::nullopt, std::nullopt};
}

} // namespace

PlanEntry PlanAssembler::assemble_one(
    const Coil& coil,
    const std::vector<Order>& orders,
    const SolverOptions& options
) {
    auto validation = InputValidator::validate(coil);
    if (!validation.valid) {
        return failed(ErrorKind::INVALID_INPUT, validation.reason);
    }

    if (options.deadline && std::chrono::steady_clock::now() > *options.deadline) {
        return failed(ErrorKind::DEADLINE_EXCEEDED, "Deadline passed before the coil was solved");
    }

    try {
        Pattern pattern = PatternSolver::solve(coil, orders, options);
        AdjustedPattern adjusted = ShearSequencer::sequence(pattern);
        return {SlotStatus::SEQUENCED, ErrorKind::NONE, "", std::move(pattern), std::move(adjusted)};
    } catch (const OptimizationInfeasible& e) {
        return failed(ErrorKind::OPTIMIZATION_INFEASIBLE, e.what());
    } catch (const DeadlineExceeded& e) {
        return failed(ErrorKind::DEADLINE_EXCEEDED, e.what());
    } catch (const std::bad_alloc&) {
        return failed(ErrorKind::OPTIMIZATION_INFEASIBLE, "Out of memory while solving the coil");
    }
}

Plan PlanAssembler::assemble(
    const std::vector<Coil>& coils,
    const std::vector<Order>& orders,
    const AssemblerOptions& options
) {
    Plan plan;

    // 1. Validate the catalog. Rejected orders are replaced by a zero-width
    // placeholder the solver never selects, so indices keep pointing into the
    // caller's sequence.
    plan.rejected_orders = InputValidator::validate(orders);

    std::vector<Order> catalog = orders;
    for (const auto& issue : plan.rejected_orders) {
        catalog[issue.index] = Order{0, 0};
    }

    // 2. Solve every coil on a bounded worker pool
    plan.entries.resize(coils.size());
    if (coils.empty()) {
        return plan;
    }

    unsigned threads = options.threads;
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    if (threads > coils.size()) {
        threads = static_cast<unsigned>(coils.size());
    }

    SolverOptions solver_options;
    solver_options.max_table_bytes = options.max_memory_bytes / threads;
    solver_options.deadline = options.deadline;

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            const size_t slot = next.fetch_add(1);
            if (slot >= coils.size()) {
                return;
            }
            plan.entries[slot] = assemble_one(coils[slot], catalog, solver_options);
        }
    };

    if (threads == 1) {
        worker();
        return plan;
    }

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (unsigned t = 0; t < threads; ++t) {
        pool.emplace_back(worker);
    }
    for (auto& th : pool) {
        th.join();
    }

    return plan;
}
