#pragma once

#include "types.hpp"
#include <vector>

class ShearSequencer {
public:
    // Order the pattern's cuts ascending. The cuts are only permuted; applying
    // this to an already adjusted pattern returns it unchanged.
    static AdjustedPattern sequence(const Pattern& pattern);

    // Sum of width changes between consecutive cuts. Ascending order is a
    // permutation with the smallest possible value.
    static int64_t blade_travel(const std::vector<int64_t>& cuts);
};
