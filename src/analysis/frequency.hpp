#pragma once

#include "data/errors.hpp"
#include "data/records.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SummaryRow — one (sample, population) frequency
// ---------------------------------------------------------------------------
struct SummaryRow {
    std::string sample;
    int64_t total_count = 0;
    Population population = Population::B_CELL;
    int64_t count = 0;
    double percentage = 0.0;  // rounded to 3 decimals
};

// ---------------------------------------------------------------------------
// SampleCounts — the five counts of one sample, indexed by population
// ---------------------------------------------------------------------------
struct SampleCounts {
    std::array<int64_t, NUM_POPULATIONS> counts{};
    int64_t total = 0;
};

namespace frequency {

inline double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

inline double percentage(int64_t count, int64_t total) {
    return static_cast<double>(count) * 100.0 / static_cast<double>(total);
}

// Population order used for tabular output: lexicographic by name.
inline std::vector<Population> populations_by_name() {
    std::vector<Population> order(ALL_POPULATIONS.begin(), ALL_POPULATIONS.end());
    std::sort(order.begin(), order.end(), [](Population a, Population b) {
        return std::string(population_name(a)) < std::string(population_name(b));
    });
    return order;
}

}  // namespace frequency

// Group counts per sample and validate each one: exactly one row per
// population and a positive total. Throws DataIntegrityError otherwise.
inline std::map<std::string, SampleCounts> compute_sample_totals(
    const std::vector<PopulationCount>& counts) {

    std::map<std::string, SampleCounts> by_sample;
    std::map<std::string, std::array<int, NUM_POPULATIONS>> seen;

    for (const auto& c : counts) {
        if (c.count < 0) {
            throw DataIntegrityError("negative count for sample '" + c.sample_id +
                                     "', population " + population_name(c.population));
        }
        size_t idx = population_index(c.population);
        auto& hits = seen[c.sample_id];
        if (++hits[idx] > 1) {
            throw DataIntegrityError("duplicate " + std::string(population_name(c.population)) +
                                     " row for sample '" + c.sample_id + "'");
        }
        auto& sc = by_sample[c.sample_id];
        sc.counts[idx] = c.count;
        sc.total += c.count;
    }

    for (const auto& [sample_id, sc] : by_sample) {
        const auto& hits = seen[sample_id];
        for (Population p : ALL_POPULATIONS) {
            if (hits[population_index(p)] == 0) {
                throw DataIntegrityError("sample '" + sample_id + "' is missing population " +
                                         population_name(p));
            }
        }
        if (sc.total <= 0) {
            throw DataIntegrityError("sample '" + sample_id + "' has total count 0");
        }
    }
    return by_sample;
}

// Per-sample population frequencies, ordered by sample id then population name.
inline std::vector<SummaryRow> build_summary_table(const std::vector<PopulationCount>& counts) {
    auto by_sample = compute_sample_totals(counts);
    auto order = frequency::populations_by_name();

    std::vector<SummaryRow> rows;
    rows.reserve(by_sample.size() * NUM_POPULATIONS);
    for (const auto& [sample_id, sc] : by_sample) {
        for (Population p : order) {
            SummaryRow r;
            r.sample = sample_id;
            r.total_count = sc.total;
            r.population = p;
            r.count = sc.counts[population_index(p)];
            r.percentage = frequency::round_to(frequency::percentage(r.count, sc.total), 3);
            rows.push_back(r);
        }
    }
    return rows;
}
