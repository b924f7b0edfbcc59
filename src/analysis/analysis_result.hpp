#pragma once

#include "data/records.hpp"

#include <limits>

// PopulationStats — responder vs non-responder comparison for one population.
// Contains group sizes, raw/adjusted p-values, and the significance flag.
// p_value and p_value_adj are NaN when either group is empty.

struct PopulationStats {
    Population population = Population::B_CELL;
    int n_yes = 0;
    int n_no = 0;
    double u_statistic = std::numeric_limits<double>::quiet_NaN();
    double p_value = std::numeric_limits<double>::quiet_NaN();
    double p_value_adj = std::numeric_limits<double>::quiet_NaN();
    bool significant = false;
};
