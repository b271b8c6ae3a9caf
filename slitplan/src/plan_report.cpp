#include "plan_report.hpp"
#include <sstream>

namespace {

std::string format_coil(const Coil& coil) {
    return "(" + std::to_string(coil.width) + ", " + std::to_string(coil.length) + ")";
}

std::string format_cuts(const std::vector<int64_t>& cuts) {
    std::string out;
    for (size_t i = 0; i < cuts.size(); ++i) {
        if (i > 0) out += ' ';
        out += std::to_string(cuts[i]);
    }
    return out;
}

} // namespace

std::string PlanReport::tables(const Plan& plan, const std::vector<Coil>& coils) {
    std::ostringstream out;

    out << "Patterns Before Shear Adjustment\n";
    out << "Coil (Width(mm), Length(mm))\tPattern\n";
    for (size_t i = 0; i < plan.entries.size() && i < coils.size(); ++i) {
        const auto& entry = plan.entries[i];
        out << format_coil(coils[i]) << '\t'
            << (entry.pattern ? format_cuts(entry.pattern->cuts) : "FAILED: " + entry.message)
            << '\n';
    }

    out << "\nPatterns After Shear Adjustment\n";
    out << "Coil (Width(mm), Length(mm))\tPattern\n";
    for (size_t i = 0; i < plan.entries.size() && i < coils.size(); ++i) {
        const auto& entry = plan.entries[i];
        out << format_coil(coils[i]) << '\t'
            << (entry.adjusted ? format_cuts(entry.adjusted->cuts) : "FAILED: " + entry.message)
            << '\n';
    }

    return out.str();
}

int PlanReport::exit_code(const Plan& plan) {
    if (plan.status() != PlanStatus::OK || !plan.rejected_orders.empty()) {
        return EXIT_PARTIAL;
    }
    return EXIT_OK;
}
