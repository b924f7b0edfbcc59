#pragma once

#include "analysis/analysis_result.hpp"
#include "analysis/cohort_selector.hpp"
#include "analysis/multiple_comparison.hpp"
#include "analysis/statistical_tests.hpp"
#include "data/records.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ResponderTestConfig
// ---------------------------------------------------------------------------
struct ResponderTestConfig {
    std::string group_a_response = response_label::YES;
    std::string group_b_response = response_label::NO;
    double alpha = 0.05;
    MannWhitneyMethod method = MannWhitneyMethod::ASYMPTOTIC;

    void validate() const {
        if (!(alpha > 0.0 && alpha < 1.0)) {
            throw std::invalid_argument("alpha must be in (0, 1), got " + std::to_string(alpha));
        }
        if (group_a_response == group_b_response) {
            throw std::invalid_argument("response groups must differ");
        }
    }

    std::string key() const {
        std::ostringstream ss;
        ss.precision(17);
        ss << "a=" << key_encoding::field(group_a_response)
           << ";b=" << key_encoding::field(group_b_response)
           << ";alpha=" << alpha << ";method=" << method_name(method);
        return ss.str();
    }

    bool operator==(const ResponderTestConfig&) const = default;
};

// ---------------------------------------------------------------------------
// Per-population Mann-Whitney U between the two response groups, followed by
// Benjamini-Hochberg across populations. One row per population, canonical order.
// ---------------------------------------------------------------------------
inline std::vector<PopulationStats> compute_responder_stats(
    const std::vector<ComparisonRow>& comparison,
    const ResponderTestConfig& config = {}) {

    config.validate();

    std::vector<std::vector<double>> group_a(NUM_POPULATIONS), group_b(NUM_POPULATIONS);
    for (const auto& row : comparison) {
        size_t idx = population_index(row.population);
        if (row.response == config.group_a_response) {
            group_a[idx].push_back(row.percentage);
        } else if (row.response == config.group_b_response) {
            group_b[idx].push_back(row.percentage);
        }
    }

    std::vector<PopulationStats> stats;
    stats.reserve(NUM_POPULATIONS);
    std::vector<double> raw;
    raw.reserve(NUM_POPULATIONS);

    for (Population p : ALL_POPULATIONS) {
        size_t idx = population_index(p);
        PopulationStats s;
        s.population = p;
        s.n_yes = static_cast<int>(group_a[idx].size());
        s.n_no = static_cast<int>(group_b[idx].size());

        auto mw = mann_whitney_u_test(group_a[idx], group_b[idx], config.method);
        s.u_statistic = mw.u_statistic;
        s.p_value = mw.p_value;

        raw.push_back(s.p_value);
        stats.push_back(s);
    }

    auto adjusted = benjamini_hochberg_correct(raw);
    for (size_t i = 0; i < stats.size(); ++i) {
        stats[i].p_value_adj = adjusted[i];
        stats[i].significant = is_significant(adjusted[i], config.alpha);
    }
    return stats;
}
