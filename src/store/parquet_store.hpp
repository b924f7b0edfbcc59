#pragma once

#include "io/parquet_util.hpp"
#include "store/record_store.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ParquetRecordStore — a directory holding subjects.parquet, samples.parquet
// and counts.parquet with the same columns as the relational tables.
// Each call opens, reads and releases one file.
// ---------------------------------------------------------------------------
class ParquetRecordStore : public RecordStore {
public:
    static constexpr const char* SUBJECTS_FILE = "subjects.parquet";
    static constexpr const char* SAMPLES_FILE = "samples.parquet";
    static constexpr const char* COUNTS_FILE = "counts.parquet";

    explicit ParquetRecordStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

    std::vector<Subject> subjects() const override {
        auto path = file(SUBJECTS_FILE);
        auto table = parquet_util::read_table<StoreAccessError>(path);
        auto ids = strings(*table, "subject_id", path);
        auto conditions = strings(*table, "condition", path);
        auto ages = ints(*table, "age", path);
        auto sexes = strings(*table, "sex", path);

        std::vector<Subject> out(ids.size());
        for (size_t i = 0; i < out.size(); ++i) {
            out[i].subject_id = std::move(ids[i]);
            out[i].condition = std::move(conditions[i]);
            out[i].age = static_cast<int>(ages[i]);
            out[i].sex = std::move(sexes[i]);
        }
        return out;
    }

    std::vector<Sample> samples() const override {
        auto path = file(SAMPLES_FILE);
        auto table = parquet_util::read_table<StoreAccessError>(path);
        auto ids = strings(*table, "sample_id", path);
        auto projects = strings(*table, "project", path);
        auto subject_ids = strings(*table, "subject_id", path);
        auto treatments = strings(*table, "treatment", path);
        auto responses = strings(*table, "response", path);
        auto types = strings(*table, "sample_type", path);
        auto times = ints(*table, "time_from_treatment_start", path);

        std::vector<Sample> out(ids.size());
        for (size_t i = 0; i < out.size(); ++i) {
            out[i].sample_id = std::move(ids[i]);
            out[i].project = std::move(projects[i]);
            out[i].subject_id = std::move(subject_ids[i]);
            out[i].treatment = std::move(treatments[i]);
            out[i].response = std::move(responses[i]);
            out[i].sample_type = std::move(types[i]);
            out[i].time_from_treatment_start = static_cast<int>(times[i]);
        }
        return out;
    }

    std::vector<PopulationCount> population_counts() const override {
        auto path = file(COUNTS_FILE);
        auto table = parquet_util::read_table<StoreAccessError>(path);
        auto ids = strings(*table, "sample_id", path);
        auto populations = strings(*table, "population", path);
        auto counts = ints(*table, "count", path);

        std::vector<PopulationCount> out(ids.size());
        for (size_t i = 0; i < out.size(); ++i) {
            out[i].sample_id = std::move(ids[i]);
            out[i].population = parse_population(populations[i]);
            out[i].count = counts[i];
        }
        return out;
    }

    std::string snapshot_id() const override {
        return "parquet:" + store_util::file_fingerprint(file(SUBJECTS_FILE)) + "|" +
               store_util::file_fingerprint(file(SAMPLES_FILE)) + "|" +
               store_util::file_fingerprint(file(COUNTS_FILE));
    }

    const std::filesystem::path& directory() const { return dir_; }

private:
    std::filesystem::path dir_;

    std::string file(const char* name) const { return (dir_ / name).string(); }

    static std::vector<std::string> strings(const arrow::Table& table, const std::string& name,
                                            const std::string& source) {
        auto col = parquet_util::column<StoreAccessError>(table, name, source);
        return parquet_util::string_values<StoreAccessError>(*col, name);
    }

    static std::vector<int64_t> ints(const arrow::Table& table, const std::string& name,
                                     const std::string& source) {
        auto col = parquet_util::column<StoreAccessError>(table, name, source);
        return parquet_util::int_values<StoreAccessError>(*col, name);
    }
};
