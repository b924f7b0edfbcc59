#pragma once

#include "analysis/frequency.hpp"
#include "data/records.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace key_encoding {

// "<length>:<value>", so a value can never run into the next field.
inline std::string field(const std::string& value) {
    return std::to_string(value.size()) + ":" + value;
}

// "-" when unset, "=<length>:<value>" when set.
inline std::string optional_field(const std::optional<std::string>& value) {
    return value ? "=" + field(*value) : std::string("-");
}

}  // namespace key_encoding

// ---------------------------------------------------------------------------
// CohortDefinition — equality / set-membership predicates over Subject and
// Sample attributes. An unset predicate does not restrict.
// ---------------------------------------------------------------------------
struct CohortDefinition {
    std::optional<std::string> condition;
    std::optional<std::string> treatment;
    std::optional<std::string> sample_type;
    std::optional<int> time_from_treatment_start;
    std::set<std::string> responses;  // empty: any response

    static CohortDefinition melanoma_pbmc(const std::string& treatment = "miraclib") {
        CohortDefinition c;
        c.condition = "melanoma";
        c.treatment = treatment;
        c.sample_type = "PBMC";
        c.responses = {response_label::YES, response_label::NO};
        return c;
    }

    bool matches(const Subject& subject, const Sample& sample) const {
        if (condition && subject.condition != *condition) return false;
        if (treatment && sample.treatment != *treatment) return false;
        if (sample_type && sample.sample_type != *sample_type) return false;
        if (time_from_treatment_start &&
            sample.time_from_treatment_start != *time_from_treatment_start) return false;
        if (!responses.empty() && responses.count(sample.response) == 0) return false;
        return true;
    }

    // Canonical text form; used as a memoization key and in log lines.
    // Distinct definitions always give distinct keys.
    std::string key() const {
        std::ostringstream ss;
        ss << "condition" << key_encoding::optional_field(condition)
           << ";treatment" << key_encoding::optional_field(treatment)
           << ";sample_type" << key_encoding::optional_field(sample_type)
           << ";time";
        if (time_from_treatment_start) ss << "=" << *time_from_treatment_start;
        else ss << "-";
        ss << ";responses=" << responses.size() << "[";
        for (const auto& r : responses) ss << key_encoding::field(r);
        ss << "]";
        return ss.str();
    }

    bool operator==(const CohortDefinition&) const = default;
};

// ---------------------------------------------------------------------------
// ComparisonRow — one (sample, population) frequency inside a cohort
// ---------------------------------------------------------------------------
struct ComparisonRow {
    std::string sample;
    std::string response;
    Population population = Population::B_CELL;
    int64_t count = 0;
    double percentage = 0.0;  // unrounded
};

namespace cohort {

// Samples joined to their subject and filtered by the cohort, in sample id order.
// Samples referencing an unknown subject do not join.
inline std::vector<const Sample*> matching_samples(const std::vector<Subject>& subjects,
                                                   const std::vector<Sample>& samples,
                                                   const CohortDefinition& def) {
    std::unordered_map<std::string, const Subject*> subject_index;
    subject_index.reserve(subjects.size());
    for (const auto& s : subjects) subject_index.emplace(s.subject_id, &s);

    std::map<std::string, const Sample*> selected;
    for (const auto& s : samples) {
        auto it = subject_index.find(s.subject_id);
        if (it == subject_index.end()) continue;
        if (!def.matches(*it->second, s)) continue;
        selected.emplace(s.sample_id, &s);
    }

    std::vector<const Sample*> out;
    out.reserve(selected.size());
    for (const auto& [id, ptr] : selected) out.push_back(ptr);
    return out;
}

}  // namespace cohort

// Comparison-ready table for one cohort: one row per (sample, population) with
// the unrounded percentage and the sample's response. Empty when nothing matches.
inline std::vector<ComparisonRow> select_cohort(const std::vector<Subject>& subjects,
                                                const std::vector<Sample>& samples,
                                                const std::vector<PopulationCount>& counts,
                                                const CohortDefinition& def) {
    auto selected = cohort::matching_samples(subjects, samples, def);
    if (selected.empty()) return {};

    std::set<std::string> wanted;
    for (const Sample* s : selected) wanted.insert(s->sample_id);

    std::vector<PopulationCount> cohort_counts;
    for (const auto& c : counts) {
        if (wanted.count(c.sample_id)) cohort_counts.push_back(c);
    }
    auto totals = compute_sample_totals(cohort_counts);
    auto order = frequency::populations_by_name();

    std::vector<ComparisonRow> rows;
    rows.reserve(selected.size() * NUM_POPULATIONS);
    for (const Sample* s : selected) {
        auto it = totals.find(s->sample_id);
        if (it == totals.end()) {
            throw DataIntegrityError("sample '" + s->sample_id + "' has no population counts");
        }
        const auto& sc = it->second;
        for (Population p : order) {
            ComparisonRow r;
            r.sample = s->sample_id;
            r.response = s->response;
            r.population = p;
            r.count = sc.counts[population_index(p)];
            r.percentage = frequency::percentage(r.count, sc.total);
            rows.push_back(r);
        }
    }
    return rows;
}
