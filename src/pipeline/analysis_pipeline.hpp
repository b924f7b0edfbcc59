#pragma once

#include "analysis/analysis_result.hpp"
#include "analysis/baseline.hpp"
#include "analysis/cohort_selector.hpp"
#include "analysis/frequency.hpp"
#include "analysis/responder_stats.hpp"
#include "store/record_store.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AnalysisConfig — everything a run depends on besides the store contents
// ---------------------------------------------------------------------------
struct AnalysisConfig {
    CohortDefinition cohort = CohortDefinition::melanoma_pbmc();
    ResponderTestConfig test;

    std::string key() const { return cohort.key() + "|" + test.key(); }
};

// ---------------------------------------------------------------------------
// AnalysisOutputs — the four derived tables, owned by the caller
// ---------------------------------------------------------------------------
struct AnalysisOutputs {
    std::vector<SummaryRow> summary;
    std::vector<ComparisonRow> comparison;
    std::vector<PopulationStats> stats;
    std::vector<BaselineRow> baseline;
    BaselineBreakdown breakdown;
};

// Reads the store once per record kind and derives every output.
inline AnalysisOutputs run_analysis(const RecordStore& store, const AnalysisConfig& config) {
    config.test.validate();

    auto subjects = store.subjects();
    auto samples = store.samples();
    auto counts = store.population_counts();

    AnalysisOutputs out;
    out.summary = build_summary_table(counts);
    out.comparison = select_cohort(subjects, samples, counts, config.cohort);
    out.stats = compute_responder_stats(out.comparison, config.test);
    out.baseline = select_baseline(subjects, samples, config.cohort);
    out.breakdown = summarize_baseline(out.baseline);
    return out;
}

// ---------------------------------------------------------------------------
// AnalysisCache — explicit memoization of run_analysis keyed by the store
// snapshot id and the analysis configuration. A changed snapshot id (new
// file contents, new memory tag) misses.
// ---------------------------------------------------------------------------
class AnalysisCache {
public:
    std::shared_ptr<const AnalysisOutputs> get_or_compute(const RecordStore& store,
                                                          const AnalysisConfig& config) {
        std::string key = key_encoding::field(store.snapshot_id()) + "#" + config.key();
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            ++hits_;
            return it->second;
        }
        ++misses_;
        auto outputs = std::make_shared<const AnalysisOutputs>(run_analysis(store, config));
        entries_.emplace(key, outputs);
        return outputs;
    }

    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }
    int hits() const { return hits_; }
    int misses() const { return misses_; }

private:
    std::map<std::string, std::shared_ptr<const AnalysisOutputs>> entries_;
    int hits_ = 0;
    int misses_ = 0;
};
