#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <vector>

// Benjamini-Hochberg step-up FDR correction.
// Returns adjusted p-values in the SAME order as input.
//
// NaN entries (tests that were not run) are excluded from the hypothesis count
// and from ranking, and come back as NaN. Equal p-values keep input order.
inline std::vector<double> benjamini_hochberg_correct(const std::vector<double>& raw_pvals) {
    std::vector<double> adjusted(raw_pvals.size(), std::numeric_limits<double>::quiet_NaN());

    std::vector<size_t> order;
    order.reserve(raw_pvals.size());
    for (size_t i = 0; i < raw_pvals.size(); ++i) {
        if (!std::isnan(raw_pvals[i])) order.push_back(i);
    }
    size_t m = order.size();
    if (m == 0) return adjusted;

    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return raw_pvals[a] < raw_pvals[b];
    });

    // Running minimum from the largest rank down.
    double running_min = 1.0;
    double md = static_cast<double>(m);
    for (size_t rank = m; rank >= 1; --rank) {
        size_t idx = order[rank - 1];
        double candidate = raw_pvals[idx] * md / static_cast<double>(rank);
        if (rank == m) running_min = candidate;
        else running_min = std::min(running_min, candidate);
        adjusted[idx] = std::min(1.0, std::max(0.0, running_min));
    }

    return adjusted;
}

// A NaN adjusted p-value is never significant.
inline bool is_significant(double p_adj, double alpha) {
    return !std::isnan(p_adj) && p_adj < alpha;
}
