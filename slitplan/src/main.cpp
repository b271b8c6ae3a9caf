#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include "types.hpp"
#include "plan_assembler.hpp"
#include "plan_report.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-j N] [-d MS] [--table] < input.json\n";
    std::cerr << "  -j N     Worker threads (0 = hardware concurrency)\n";
    std::cerr << "  -d MS    Overall deadline in milliseconds\n";
    std::cerr << "  --table  Print the before/after shear adjustment tables instead of JSON\n";
}

int main(int argc, char* argv[]) {
    AssemblerOptions options;
    bool table = false;

    for (int i = 1; i < argc; ++i) {
        try {
            if (std::strcmp(argv[i], "-j") == 0 && i + 1 < argc) {
                options.threads = static_cast<unsigned>(std::stoul(argv[++i]));
            } else if (std::strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
                options.deadline = std::chrono::steady_clock::now() +
                                   std::chrono::milliseconds(std::stol(argv[++i]));
            } else if (std::strcmp(argv[i], "--table") == 0) {
                table = true;
            } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return PlanReport::EXIT_OK;
            } else {
                print_usage(argv[0]);
                return PlanReport::EXIT_BAD_INPUT;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << argv[i - 1] << ": " << e.what() << std::endl;
            return PlanReport::EXIT_BAD_INPUT;
        }
    }

    // 1. Read Input (Stdin)
    json input;
    try {
        std::cin >> input;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing JSON input: " << e.what() << std::endl;
        return PlanReport::EXIT_BAD_INPUT;
    }

    // 2. Parse Coils and Orders
    std::vector<Coil> coils;
    std::vector<Order> orders;

    try {
        if (input.contains("coils")) {
            coils = input["coils"].get<std::vector<Coil>>();
        }
        if (input.contains("orders")) {
            orders = input["orders"].get<std::vector<Order>>();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error extracting data from JSON: " << e.what() << std::endl;
        return PlanReport::EXIT_BAD_INPUT;
    }

    // 3. Run Plan Assembler
    Plan plan = PlanAssembler::assemble(coils, orders, options);

    // 4. Report Failures
    for (const auto& issue : plan.rejected_orders) {
        std::cerr << "Rejected " << issue.record << " " << issue.index << ": " << issue.reason << std::endl;
    }
    for (size_t i = 0; i < plan.entries.size(); ++i) {
        if (plan.entries[i].status == SlotStatus::FAILED) {
            std::cerr << "Coil " << i << " failed: " << plan.entries[i].message << std::endl;
        }
    }

    // 5. Output Plan (Stdout)
    if (table) {
        std::cout << PlanReport::tables(plan, coils);
    } else {
        json output_plan = plan;
        std::cout << output_plan.dump(4) << std::endl;
    }

    return PlanReport::exit_code(plan);
}
