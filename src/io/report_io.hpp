#pragma once

#include "io/parquet_util.hpp"
#include "pipeline/analysis_pipeline.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ReportConfig
// ---------------------------------------------------------------------------
struct ReportConfig {
    enum class Format { CSV, PARQUET };

    std::string output_dir;
    Format format = Format::CSV;
};

namespace report_io {

inline std::string format_double(double val) {
    if (std::isnan(val)) return "NaN";
    if (std::isinf(val)) return val > 0 ? "Inf" : "-Inf";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", val);
    return buf;
}

// Three-decimal values print without binary noise.
inline std::string format_rounded(double val) {
    if (std::isnan(val)) return "NaN";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", val);
    return buf;
}

inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            default:   result += c;
        }
    }
    return result;
}

inline std::string json_number(double val) {
    if (!std::isfinite(val)) return "null";
    return format_double(val);
}

// Stats table as a JSON array; missing p-values become null.
inline std::string stats_to_json(const std::vector<PopulationStats>& stats) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < stats.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& s = stats[i];
        ss << "{";
        ss << "\"population\":\"" << json_escape(population_name(s.population)) << "\"";
        ss << ",\"n_yes\":" << s.n_yes;
        ss << ",\"n_no\":" << s.n_no;
        ss << ",\"p_value\":" << json_number(s.p_value);
        ss << ",\"p_value_adj\":" << json_number(s.p_value_adj);
        ss << ",\"significant\":" << (s.significant ? "true" : "false");
        ss << "}";
    }
    ss << "]";
    return ss.str();
}

// ---------------------------------------------------------------------------
// CSV
// ---------------------------------------------------------------------------
// RFC 4180 quoting: fields holding a comma, quote or line break are wrapped
// in quotes with inner quotes doubled.
inline std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

inline std::ofstream open_csv(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    return file;
}

inline void write_summary_csv(const std::vector<SummaryRow>& rows, const std::string& path) {
    auto file = open_csv(path);
    file << "sample,total_count,population,count,percentage\n";
    for (const auto& r : rows) {
        file << csv_field(r.sample) << "," << r.total_count << ","
             << population_name(r.population) << ","
             << r.count << "," << format_rounded(r.percentage) << "\n";
    }
}

inline void write_comparison_csv(const std::vector<ComparisonRow>& rows, const std::string& path) {
    auto file = open_csv(path);
    file << "sample,response,population,count,percentage\n";
    for (const auto& r : rows) {
        file << csv_field(r.sample) << "," << csv_field(r.response) << ","
             << population_name(r.population) << ","
             << r.count << "," << format_double(r.percentage) << "\n";
    }
}

inline void write_stats_csv(const std::vector<PopulationStats>& stats, const std::string& path) {
    auto file = open_csv(path);
    file << "population,n_yes,n_no,p_value,p_value_adj,significant\n";
    for (const auto& s : stats) {
        file << population_name(s.population) << "," << s.n_yes << "," << s.n_no << ","
             << format_double(s.p_value) << "," << format_double(s.p_value_adj) << ","
             << (s.significant ? "true" : "false") << "\n";
    }
}

inline void write_baseline_csv(const std::vector<BaselineRow>& rows, const std::string& path) {
    auto file = open_csv(path);
    file << "sample_id,project,subject_id,response,sex,time_from_treatment_start\n";
    for (const auto& r : rows) {
        file << csv_field(r.sample_id) << "," << csv_field(r.project) << ","
             << csv_field(r.subject_id) << "," << csv_field(r.response) << ","
             << csv_field(r.sex) << "," << r.time_from_treatment_start << "\n";
    }
}

inline void write_grouping_csv(const std::map<std::string, int>& groups,
                               const std::string& key_column, const std::string& count_column,
                               const std::string& path) {
    auto file = open_csv(path);
    file << key_column << "," << count_column << "\n";
    for (const auto& [key, n] : groups) file << csv_field(key) << "," << n << "\n";
}

// ---------------------------------------------------------------------------
// Parquet
// ---------------------------------------------------------------------------
inline void write_summary_parquet(const std::vector<SummaryRow>& rows, const std::string& path) {
    std::vector<std::string> samples, populations;
    std::vector<int64_t> totals, counts;
    std::vector<double> percentages;
    for (const auto& r : rows) {
        samples.push_back(r.sample);
        totals.push_back(r.total_count);
        populations.push_back(population_name(r.population));
        counts.push_back(r.count);
        percentages.push_back(r.percentage);
    }
    auto schema = arrow::schema({arrow::field("sample", arrow::utf8()),
                                 arrow::field("total_count", arrow::int64()),
                                 arrow::field("population", arrow::utf8()),
                                 arrow::field("count", arrow::int64()),
                                 arrow::field("percentage", arrow::float64())});
    auto table = arrow::Table::Make(schema, {parquet_util::string_array(samples),
                                             parquet_util::int64_array(totals),
                                             parquet_util::string_array(populations),
                                             parquet_util::int64_array(counts),
                                             parquet_util::double_array(percentages)});
    parquet_util::write_table(*table, path);
}

inline void write_comparison_parquet(const std::vector<ComparisonRow>& rows,
                                     const std::string& path) {
    std::vector<std::string> samples, responses, populations;
    std::vector<int64_t> counts;
    std::vector<double> percentages;
    for (const auto& r : rows) {
        samples.push_back(r.sample);
        responses.push_back(r.response);
        populations.push_back(population_name(r.population));
        counts.push_back(r.count);
        percentages.push_back(r.percentage);
    }
    auto schema = arrow::schema({arrow::field("sample", arrow::utf8()),
                                 arrow::field("response", arrow::utf8()),
                                 arrow::field("population", arrow::utf8()),
                                 arrow::field("count", arrow::int64()),
                                 arrow::field("percentage", arrow::float64())});
    auto table = arrow::Table::Make(schema, {parquet_util::string_array(samples),
                                             parquet_util::string_array(responses),
                                             parquet_util::string_array(populations),
                                             parquet_util::int64_array(counts),
                                             parquet_util::double_array(percentages)});
    parquet_util::write_table(*table, path);
}

inline void write_stats_parquet(const std::vector<PopulationStats>& stats,
                                const std::string& path) {
    std::vector<std::string> populations;
    std::vector<int64_t> n_yes, n_no;
    std::vector<double> p, p_adj;
    std::vector<bool> significant;
    for (const auto& s : stats) {
        populations.push_back(population_name(s.population));
        n_yes.push_back(s.n_yes);
        n_no.push_back(s.n_no);
        p.push_back(s.p_value);
        p_adj.push_back(s.p_value_adj);
        significant.push_back(s.significant);
    }
    auto schema = arrow::schema({arrow::field("population", arrow::utf8()),
                                 arrow::field("n_yes", arrow::int64()),
                                 arrow::field("n_no", arrow::int64()),
                                 arrow::field("p_value", arrow::float64()),
                                 arrow::field("p_value_adj", arrow::float64()),
                                 arrow::field("significant", arrow::boolean())});
    auto table = arrow::Table::Make(schema, {parquet_util::string_array(populations),
                                             parquet_util::int64_array(n_yes),
                                             parquet_util::int64_array(n_no),
                                             parquet_util::double_array(p),
                                             parquet_util::double_array(p_adj),
                                             parquet_util::bool_array(significant)});
    parquet_util::write_table(*table, path);
}

inline void write_baseline_parquet(const std::vector<BaselineRow>& rows,
                                   const std::string& path) {
    std::vector<std::string> ids, projects, subjects, responses, sexes;
    std::vector<int64_t> times;
    for (const auto& r : rows) {
        ids.push_back(r.sample_id);
        projects.push_back(r.project);
        subjects.push_back(r.subject_id);
        responses.push_back(r.response);
        sexes.push_back(r.sex);
        times.push_back(r.time_from_treatment_start);
    }
    auto schema = arrow::schema({arrow::field("sample_id", arrow::utf8()),
                                 arrow::field("project", arrow::utf8()),
                                 arrow::field("subject_id", arrow::utf8()),
                                 arrow::field("response", arrow::utf8()),
                                 arrow::field("sex", arrow::utf8()),
                                 arrow::field("time_from_treatment_start", arrow::int64())});
    auto table = arrow::Table::Make(schema, {parquet_util::string_array(ids),
                                             parquet_util::string_array(projects),
                                             parquet_util::string_array(subjects),
                                             parquet_util::string_array(responses),
                                             parquet_util::string_array(sexes),
                                             parquet_util::int64_array(times)});
    parquet_util::write_table(*table, path);
}

inline void write_grouping_parquet(const std::map<std::string, int>& groups,
                                   const std::string& key_column,
                                   const std::string& count_column, const std::string& path) {
    std::vector<std::string> keys;
    std::vector<int64_t> counts;
    for (const auto& [key, n] : groups) {
        keys.push_back(key);
        counts.push_back(n);
    }
    auto schema = arrow::schema({arrow::field(key_column, arrow::utf8()),
                                 arrow::field(count_column, arrow::int64())});
    auto table = arrow::Table::Make(schema, {parquet_util::string_array(keys),
                                             parquet_util::int64_array(counts)});
    parquet_util::write_table(*table, path);
}

// ---------------------------------------------------------------------------
// Whole report. Returns the paths written, in write order.
// ---------------------------------------------------------------------------
inline std::vector<std::string> write_report(const AnalysisOutputs& out, const ReportConfig& cfg) {
    if (cfg.output_dir.empty() || !std::filesystem::is_directory(cfg.output_dir)) {
        throw std::runtime_error("Output directory does not exist: " + cfg.output_dir);
    }
    bool parquet = (cfg.format == ReportConfig::Format::PARQUET);
    const std::string ext = parquet ? ".parquet" : ".csv";
    auto path = [&](const std::string& name) {
        return (std::filesystem::path(cfg.output_dir) / (name + ext)).string();
    };

    std::vector<std::string> written;
    auto grouping = [&](const std::map<std::string, int>& g, const std::string& name,
                        const std::string& key_col, const std::string& count_col) {
        if (parquet) write_grouping_parquet(g, key_col, count_col, path(name));
        else write_grouping_csv(g, key_col, count_col, path(name));
        written.push_back(path(name));
    };

    if (parquet) {
        write_summary_parquet(out.summary, path("summary"));
        write_comparison_parquet(out.comparison, path("comparison"));
        write_stats_parquet(out.stats, path("stats"));
        write_baseline_parquet(out.baseline, path("baseline"));
    } else {
        write_summary_csv(out.summary, path("summary"));
        write_comparison_csv(out.comparison, path("comparison"));
        write_stats_csv(out.stats, path("stats"));
        write_baseline_csv(out.baseline, path("baseline"));
    }
    written.push_back(path("summary"));
    written.push_back(path("comparison"));
    written.push_back(path("stats"));
    written.push_back(path("baseline"));

    grouping(out.breakdown.samples_per_project, "baseline_samples_per_project",
             "project", "sample_count");
    grouping(out.breakdown.subjects_by_response, "baseline_subjects_by_response",
             "response", "subject_count");
    grouping(out.breakdown.subjects_by_sex, "baseline_subjects_by_sex",
             "sex", "subject_count");
    return written;
}

}  // namespace report_io
