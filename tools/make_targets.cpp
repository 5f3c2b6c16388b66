// make_targets.cpp — Forward target builder
// Reads a minute-sampled feature table (CSV or Parquet), appends
// future_close_{N}m, future_ret_{N}m and the target_dir/up/down labels for
// each horizon, and writes the result (format chosen by output extension).

#include "cli_args.hpp"
#include "data/dataset_io.hpp"
#include "data/forward_targets.hpp"
#include "errors.hpp"
#include "time_utils.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <path> --output <path> [options]\n"
              << "\n"
              << "  --input            Input table (.csv or .parquet)\n"
              << "  --output           Output table (.csv or .parquet)\n"
              << "  --spot-column      Spot close column (default: nifty_close)\n"
              << "  --horizons         Comma-separated minutes (default: 1,3)\n"
              << "  --up-threshold     Return for target_up (default: 0.0002)\n"
              << "  --up-thresholds    Per-horizon overrides, e.g. 1=0.0002,3=0.0005\n"
              << "                     (default: 3=0.0005; 'none' clears them)\n"
              << "  --down-threshold   Return magnitude for target_down (default: 0.0002)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_path;
    ForwardTargetConfig cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--spot-column" && i + 1 < argc) {
                cfg.spot_column = argv[++i];
            } else if (arg == "--horizons" && i + 1 < argc) {
                cfg.horizons_min = cli_args::parse_int_list(arg, argv[++i]);
            } else if (arg == "--up-threshold" && i + 1 < argc) {
                cfg.up_threshold = cli_args::parse_double(arg, argv[++i]);
            } else if (arg == "--up-thresholds" && i + 1 < argc) {
                cfg.up_threshold_by_horizon = cli_args::parse_int_double_map(arg, argv[++i]);
            } else if (arg == "--down-threshold" && i + 1 < argc) {
                cfg.down_threshold = cli_args::parse_double(arg, argv[++i]);
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

        TableReadOptions opts;
        opts.skip_non_numeric = true;
        ColumnTable table = dataset_io::read_table(input_path, opts);
        if (!table.has_column(cfg.spot_column)) {
            throw SchemaError("Missing column: " + cfg.spot_column + " in " + input_path);
        }
        std::cout << "Loaded " << table.num_rows() << " rows, " << table.num_columns()
                  << " numeric columns from " << input_path << "\n";

        auto summary = add_forward_targets(table, cfg);

        for (const auto& [name, pos] : summary.positives) {
            double frac = summary.rows > 0
                ? static_cast<double>(pos) / static_cast<double>(summary.rows) : 0.0;
            std::printf("  %-18s positives=%zu (%.2f%%)\n", name.c_str(), pos, frac * 100.0);
        }
        std::cout << "  " << summary.tail_rows_without_forward
                  << " tail rows have no forward value\n";

        dataset_io::write_table(output_path, table);
        std::cout << "Wrote " << table.num_rows() << " rows, " << table.num_columns()
                  << " columns to " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
