#pragma once

#include "analysis/cohort_selector.hpp"
#include "data/records.hpp"

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BaselineRow — one baseline (time_from_treatment_start == 0) sample
// ---------------------------------------------------------------------------
struct BaselineRow {
    std::string sample_id;
    std::string project;
    std::string subject_id;
    std::string response;
    std::string sex;
    int time_from_treatment_start = 0;
};

// ---------------------------------------------------------------------------
// BaselineBreakdown — grouped counts over the baseline rows
// ---------------------------------------------------------------------------
struct BaselineBreakdown {
    std::map<std::string, int> samples_per_project;   // distinct samples
    std::map<std::string, int> subjects_by_response;  // one row per subject
    std::map<std::string, int> subjects_by_sex;       // one row per subject
};

// Baseline variant of a cohort: same predicates, any response, time 0.
inline CohortDefinition baseline_cohort(const CohortDefinition& def) {
    CohortDefinition b = def;
    b.responses.clear();
    b.time_from_treatment_start = 0;
    return b;
}

// Baseline rows of the cohort, ordered by sample id.
inline std::vector<BaselineRow> select_baseline(const std::vector<Subject>& subjects,
                                                const std::vector<Sample>& samples,
                                                const CohortDefinition& def) {
    auto bdef = baseline_cohort(def);

    std::unordered_map<std::string, const Subject*> subject_index;
    for (const auto& s : subjects) subject_index.emplace(s.subject_id, &s);

    std::vector<BaselineRow> rows;
    for (const Sample* s : cohort::matching_samples(subjects, samples, bdef)) {
        const Subject* subj = subject_index.at(s->subject_id);
        BaselineRow r;
        r.sample_id = s->sample_id;
        r.project = s->project;
        r.subject_id = s->subject_id;
        r.response = s->response;
        r.sex = subj->sex;
        r.time_from_treatment_start = s->time_from_treatment_start;
        rows.push_back(std::move(r));
    }
    return rows;
}

// Subjects are deduplicated to their first row in sample id order before the
// response and sex groupings; samples per project counts every distinct sample.
inline BaselineBreakdown summarize_baseline(const std::vector<BaselineRow>& rows) {
    BaselineBreakdown out;

    std::map<std::string, std::set<std::string>> project_samples;
    std::map<std::string, const BaselineRow*> first_by_subject;
    for (const auto& r : rows) {
        project_samples[r.project].insert(r.sample_id);
        auto it = first_by_subject.find(r.subject_id);
        if (it == first_by_subject.end() || r.sample_id < it->second->sample_id) {
            first_by_subject[r.subject_id] = &r;
        }
    }

    for (const auto& [project, ids] : project_samples) {
        out.samples_per_project[project] = static_cast<int>(ids.size());
    }
    for (const auto& [subject, row] : first_by_subject) {
        ++out.subjects_by_response[row->response];
        ++out.subjects_by_sex[row->sex];
    }
    return out;
}
