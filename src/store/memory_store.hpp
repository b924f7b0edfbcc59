#pragma once

#include "store/record_store.hpp"

#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// MemoryRecordStore — records already held in memory. The snapshot tag is
// supplied by the owner, who changes it whenever the content changes.
// ---------------------------------------------------------------------------
class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;
    MemoryRecordStore(std::vector<Subject> subjects, std::vector<Sample> samples,
                      std::vector<PopulationCount> counts, std::string snapshot_tag = "memory")
        : subjects_(std::move(subjects)),
          samples_(std::move(samples)),
          counts_(std::move(counts)),
          snapshot_tag_(std::move(snapshot_tag)) {}

    std::vector<Subject> subjects() const override { return subjects_; }
    std::vector<Sample> samples() const override { return samples_; }
    std::vector<PopulationCount> population_counts() const override { return counts_; }
    std::string snapshot_id() const override { return snapshot_tag_; }

private:
    std::vector<Subject> subjects_;
    std::vector<Sample> samples_;
    std::vector<PopulationCount> counts_;
    std::string snapshot_tag_ = "memory";
};
