// cohort_report.cpp — Immune Cell Cohort Report
// Reads subjects / samples / counts from a SQLite database or a directory of
// Parquet files, computes population frequencies, the responder vs
// non-responder comparison with BH correction, and the baseline breakdown,
// then writes every table to --output-dir and the stats as JSON to stdout.

#include "data/errors.hpp"
#include "io/report_io.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "store/parquet_store.hpp"
#include "store/sqlite_store.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_DATA_INTEGRITY = 2;
constexpr int EXIT_STORE_ACCESS = 3;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --store <path> --output-dir <dir> [options]\n"
              << "\n"
              << "  --store        SQLite database (.sqlite/.db) or directory of Parquet tables\n"
              << "  --output-dir   Directory receiving the report tables\n"
              << "  --format       csv (default) or parquet\n"
              << "  --condition    Cohort condition (default: melanoma)\n"
              << "  --treatment    Cohort treatment (default: miraclib)\n"
              << "  --sample-type  Cohort sample type (default: PBMC)\n"
              << "  --alpha        Significance threshold on adjusted p (default: 0.05)\n"
              << "  --method       asymptotic (default), exact, or auto\n"
              << "  --quiet        Only print the stats JSON\n";
}

std::unique_ptr<RecordStore> open_store(const std::string& path) {
    std::filesystem::path p(path);
    if (std::filesystem::is_directory(p)) {
        return std::make_unique<ParquetRecordStore>(p);
    }
    std::string ext = p.extension().string();
    if (ext == ".sqlite" || ext == ".db" || ext == ".sqlite3") {
        return std::make_unique<SqliteRecordStore>(path);
    }
    return nullptr;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string store_path;
    std::string output_dir;
    std::string format = "csv";
    std::string alpha_str;
    std::string method_str;
    bool quiet = false;

    AnalysisConfig config;

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--store" && i + 1 < argc) {
            store_path = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--condition" && i + 1 < argc) {
            config.cohort.condition = argv[++i];
        } else if (arg == "--treatment" && i + 1 < argc) {
            config.cohort.treatment = argv[++i];
        } else if (arg == "--sample-type" && i + 1 < argc) {
            config.cohort.sample_type = argv[++i];
        } else if (arg == "--alpha" && i + 1 < argc) {
            alpha_str = argv[++i];
        } else if (arg == "--method" && i + 1 < argc) {
            method_str = argv[++i];
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    // Validate required args
    if (store_path.empty()) {
        std::cerr << "Missing required argument: --store\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (output_dir.empty()) {
        std::cerr << "Missing required argument: --output-dir\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    ReportConfig report;
    report.output_dir = output_dir;
    if (format == "parquet") {
        report.format = ReportConfig::Format::PARQUET;
    } else if (format != "csv") {
        std::cerr << "Unsupported output format '" << format << "'. Use csv or parquet.\n";
        return EXIT_USAGE;
    }

    try {
        if (!alpha_str.empty()) config.test.alpha = std::stod(alpha_str);
        if (!method_str.empty()) config.test.method = parse_method(method_str);
        config.test.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid option: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    auto store = open_store(store_path);
    if (!store) {
        std::cerr << "Cannot determine store type for '" << store_path
                  << "' (expected .sqlite/.db file or Parquet directory)\n";
        return EXIT_USAGE;
    }

    if (!std::filesystem::is_directory(output_dir)) {
        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            std::cerr << "Cannot create output directory " << output_dir << ": "
                      << ec.message() << "\n";
            return EXIT_USAGE;
        }
    }

    try {
        if (!quiet) {
            std::cerr << "Store:  " << store_path << "\n";
            std::cerr << "Cohort: " << config.cohort.key() << "\n";
            std::cerr << "Test:   " << config.test.key() << "\n";
        }

        auto outputs = run_analysis(*store, config);

        if (!quiet) {
            std::cerr << "Summary rows:    " << outputs.summary.size() << "\n";
            std::cerr << "Cohort rows:     " << outputs.comparison.size() << "\n";
            std::cerr << "Baseline rows:   " << outputs.baseline.size() << "\n";
            if (outputs.comparison.empty()) {
                std::cerr << "No samples match the cohort; p-values are missing.\n";
            }
            for (const auto& s : outputs.stats) {
                std::cerr << "  " << population_name(s.population)
                          << "  n_yes=" << s.n_yes << " n_no=" << s.n_no
                          << "  p=" << report_io::format_double(s.p_value)
                          << "  p_adj=" << report_io::format_double(s.p_value_adj)
                          << (s.significant ? "  *" : "") << "\n";
            }
        }

        auto written = report_io::write_report(outputs, report);
        if (!quiet) {
            for (const auto& path : written) std::cerr << "Output: " << path << "\n";
        }

        std::cout << report_io::stats_to_json(outputs.stats) << "\n";
    } catch (const DataIntegrityError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_DATA_INTEGRITY;
    } catch (const StoreAccessError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_STORE_ACCESS;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    return 0;
}
