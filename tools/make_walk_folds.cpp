// make_walk_folds.cpp — Calendar walk-forward fold table
// Reads the timestamp column of a dataset, builds train/test folds by
// calendar month and writes walk_folds.csv with both the ISO-8601 bounds and
// the resolved half-open row ranges.

#include "cli_args.hpp"
#include "data/dataset_io.hpp"
#include "errors.hpp"
#include "time_utils.hpp"
#include "walkforward/fold_builder.hpp"
#include "walkforward/fold_io.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <path> --output <walk_folds.csv> [options]\n"
              << "\n"
              << "  --input              Dataset (.csv or .parquet)\n"
              << "  --output             Fold table path\n"
              << "  --timestamp-column   (default: timestamp)\n"
              << "  --train-months       Training window (default: 12)\n"
              << "  --test-months        Test window (default: 1)\n"
              << "  --step-months        Step between folds (default: 1)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_path;
    std::string ts_column = "timestamp";
    WalkForwardConfig cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--timestamp-column" && i + 1 < argc) {
                ts_column = argv[++i];
            } else if (arg == "--train-months" && i + 1 < argc) {
                cfg.train_window_months = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--test-months" && i + 1 < argc) {
                cfg.test_window_months = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--step-months" && i + 1 < argc) {
                cfg.step_months = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (input_path.empty() || output_path.empty()) {
            std::cerr << "Missing required argument: --input and --output\n";
            print_usage(argv[0]);
            return 1;
        }

        // Fails before any I/O on bad window parameters.
        FoldBuilder builder(cfg);

        TableReadOptions opts;
        opts.timestamp_column = ts_column;
        opts.skip_non_numeric = true;
        ColumnTable table = dataset_io::read_table(input_path, opts);
        std::vector<int64_t> ts = table.timestamps;
        std::sort(ts.begin(), ts.end());
        if (ts.empty()) {
            std::cout << "Loaded 0 rows from " << input_path << "\n";
        } else {
            std::cout << "Loaded " << ts.size() << " rows: "
                      << time_utils::format_iso8601(ts.front()) << " .. "
                      << time_utils::format_iso8601(ts.back()) << "\n";
        }

        auto folds = builder.build(ts);
        if (folds.empty()) {
            std::cout << "No folds produced (insufficient history for train="
                      << cfg.train_window_months << "m test=" << cfg.test_window_months << "m)\n";
        }
        for (const auto& f : folds) {
            std::printf("  fold %d: train %s..%s (%zu rows)  test %s..%s (%zu rows)\n",
                        f.fold_id,
                        time_utils::format_iso8601(f.train_start).c_str(),
                        time_utils::format_iso8601(f.train_end).c_str(),
                        f.train_rows.size(),
                        time_utils::format_iso8601(f.test_start).c_str(),
                        time_utils::format_iso8601(f.test_end).c_str(),
                        f.test_rows.size());
        }

        fold_io::write_folds_csv(output_path, folds);
        std::cout << "Wrote " << folds.size() << " folds to " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
