#include "shear_sequencer.hpp"
#include <algorithm>
#include <cstdlib>

AdjustedPattern ShearSequencer::sequence(const Pattern& pattern) {
    AdjustedPattern adjusted{pattern.coil, pattern.cuts, 0};

    std::sort(adjusted.cuts.begin(), adjusted.cuts.end());
    adjusted.blade_travel = blade_travel(adjusted.cuts);

    return adjusted;
}

int64_t ShearSequencer::blade_travel(const std::vector<int64_t>& cuts) {
    int64_t travel = 0;
    for (size_t i = 1; i < cuts.size(); ++i) {
        travel += std::llabs(cuts[i] - cuts[i - 1]);
    }
    return travel;
}
