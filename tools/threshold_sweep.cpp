// threshold_sweep.cpp — Threshold sweep and calibration
// Joins out-of-sample predictions with the price columns of the dataset,
// prices every signal at each (cost profile, horizon, threshold, SL, TP)
// cell, and writes the sweep table plus probability calibration bins.
//
// Outputs under --output-dir:
//   sweep_results.csv, thresholds_analysis.csv, bin_stats.csv, sweep_summary.json

#include "analysis/calibration.hpp"
#include "backtest/execution_costs.hpp"
#include "backtest/outcome_pricer.hpp"
#include "backtest/threshold_sweep.hpp"
#include "backtest/trade_selector.hpp"
#include "cli_args.hpp"
#include "data/dataset_io.hpp"
#include "errors.hpp"
#include "report/prediction_io.hpp"
#include "report/report_io.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <dataset> --predictions <path> --output-dir <dir> [options]\n"
              << "\n"
              << "  --input            Dataset with spot and future_close_{N}m columns\n"
              << "  --predictions      predictions.csv or .parquet\n"
              << "  --output-dir       Output directory\n"
              << "  --spot-column      (default: nifty_close)\n"
              << "  --horizons         Comma-separated minutes (default: 1,3)\n"
              << "  --thresholds       Explicit comma-separated thresholds\n"
              << "  --threshold-min    Grid start (default: 0.50)\n"
              << "  --threshold-max    Grid end, inclusive (default: 0.90)\n"
              << "  --threshold-step   Grid step (default: 0.02)\n"
              << "  --sl               Stop-loss fractions, 'none' allowed (default: none)\n"
              << "  --tp               Take-profit fractions, 'none' allowed (default: none)\n"
              << "  --slippage         Round-trip slippage fraction (default: 0.00015)\n"
              << "  --lot-multiplier   P&L per index point (default: 1)\n"
              << "  --cost-profile     name=commission, repeatable\n"
              << "                     (default: current_broker=40 futures_like=12)\n"
              << "  --mode             terminal or path (default: terminal)\n"
              << "  --bins             Calibration bin edges\n"
              << "  --tolerance-sec    Timestamp join tolerance (default: 30)\n";
}

CostProfile parse_cost_profile(const std::string& value) {
    auto eq = value.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw ConfigurationError("--cost-profile: expected name=commission, got '" + value + "'");
    }
    return {value.substr(0, eq), cli_args::parse_double("--cost-profile", value.substr(eq + 1))};
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::string predictions_path;
    std::string output_dir;
    std::string spot_column = "nifty_close";
    std::string thresholds_arg;
    double thr_min = 0.50, thr_max = 0.90, thr_step = 0.02;
    std::vector<CostProfile> profiles;
    SweepConfig sweep;
    CalibrationConfig calib;
    JoinConfig join_cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--predictions" && i + 1 < argc) {
                predictions_path = argv[++i];
            } else if (arg == "--output-dir" && i + 1 < argc) {
                output_dir = argv[++i];
            } else if (arg == "--spot-column" && i + 1 < argc) {
                spot_column = argv[++i];
            } else if (arg == "--horizons" && i + 1 < argc) {
                sweep.horizons_min = cli_args::parse_int_list(arg, argv[++i]);
            } else if (arg == "--thresholds" && i + 1 < argc) {
                thresholds_arg = argv[++i];
            } else if (arg == "--threshold-min" && i + 1 < argc) {
                thr_min = cli_args::parse_double(arg, argv[++i]);
            } else if (arg == "--threshold-max" && i + 1 < argc) {
                thr_max = cli_args::parse_double(arg, argv[++i]);
            } else if (arg == "--threshold-step" && i + 1 < argc) {
                thr_step = cli_args::parse_double(arg, argv[++i]);
            } else if (arg == "--sl" && i + 1 < argc) {
                sweep.sl_options = cli_args::parse_optional_list(arg, argv[++i]);
            } else if (arg == "--tp" && i + 1 < argc) {
                sweep.tp_options = cli_args::parse_optional_list(arg, argv[++i]);
            } else if (arg == "--slippage" && i + 1 < argc) {
                sweep.slippage_fraction = cli_args::parse_double(arg, argv[++i]);
            } else if (arg == "--lot-multiplier" && i + 1 < argc) {
                sweep.lot_multiplier = cli_args::parse_double(arg, argv[++i]);
            } else if (arg == "--cost-profile" && i + 1 < argc) {
                profiles.push_back(parse_cost_profile(argv[++i]));
            } else if (arg == "--mode" && i + 1 < argc) {
                sweep.mode = parse_pricing_mode(argv[++i]);
            } else if (arg == "--bins" && i + 1 < argc) {
                calib.edges = cli_args::parse_double_list(arg, argv[++i]);
            } else if (arg == "--tolerance-sec" && i + 1 < argc) {
                join_cfg.tolerance_ns = selector_util::tolerance_from_seconds(
                    cli_args::parse_double(arg, argv[++i]));
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (input_path.empty() || predictions_path.empty() || output_dir.empty()) {
            std::cerr << "Missing required argument: --input, --predictions and --output-dir\n";
            print_usage(argv[0]);
            return 1;
        }

        sweep.thresholds = thresholds_arg.empty()
            ? make_threshold_grid(thr_min, thr_max, thr_step)
            : cli_args::parse_double_list("--thresholds", thresholds_arg);
        if (!profiles.empty()) sweep.cost_profiles = profiles;
        calib.horizons_min = sweep.horizons_min;
        ThresholdSweep sweeper(sweep);
        CalibrationAnalyzer calibration(calib);

        DatasetSchema schema;
        schema.label_column.clear();
        schema.spot_column = spot_column;
        schema.horizons_min = sweep.horizons_min;
        TimeSeriesDataset data = dataset_io::load_dataset(input_path, schema);

        auto preds = prediction_io::read_predictions(predictions_path);
        auto join = join_predictions(preds, data, join_cfg);

        std::cout << "=== Threshold sweep (" << pricing_mode_str(sweep.mode) << " pricing) ===\n"
                  << "Dataset rows: " << data.size() << "\n"
                  << "Predictions: " << preds.size() << " (joined " << join.rows.size()
                  << ": " << join.matched_by_index << " by row, " << join.matched_by_time
                  << " by time; unmatched " << join.unmatched << ")\n";
        if (join.unmatched > 0) {
            std::cerr << "WARNING: " << join.unmatched
                      << " predictions had no dataset row within tolerance\n";
        }

        auto report = sweeper.run(join.rows, data);
        auto labels = sweeper.label_analysis(join.rows, data);
        auto bins = calibration.compute(join.rows, &data);

        std::cout << "Calendar days: " << report.calendar_days
                  << ", sweep rows: " << report.results.size() << "\n";
        for (const auto& [h, n] : report.unpriceable) {
            if (n > 0) std::cout << "  " << h << "m: " << n << " rows without forward price\n";
        }

        // Best cell per cost profile / horizon by total P&L.
        std::cout << "\nBest cells by total P&L:\n";
        for (const auto& profile : sweep.cost_profiles) {
            for (int h : sweep.horizons_min) {
                const ThresholdResult* best = nullptr;
                for (const auto& r : report.results) {
                    if (r.cost_profile != profile.name || r.horizon_min != h || r.trades == 0) continue;
                    if (!best || r.total_pnl > best->total_pnl) best = &r;
                }
                if (!best) {
                    std::printf("  %-16s %dm: no trades\n", profile.name.c_str(), h);
                    continue;
                }
                std::printf("  %-16s %dm: thr=%.2f sl=%s tp=%s trades=%zu prec=%.3f "
                            "avg=%.2f total=%.2f (%.2f/day)\n",
                            profile.name.c_str(), h, best->threshold,
                            best->sl_fraction ? std::to_string(*best->sl_fraction).c_str() : "none",
                            best->tp_fraction ? std::to_string(*best->tp_fraction).c_str() : "none",
                            best->trades, best->precision, best->avg_pnl, best->total_pnl,
                            best->trades_per_day);
            }
        }

        // Label precision next to net-of-cost expectancy, first cost profile only.
        std::cout << "\nLabel precision by threshold (" << sweep.cost_profiles.front().name
                  << ", " << sweep.horizons_min.front() << "m expectancy):\n";
        for (const auto& r : labels) {
            if (r.cost_profile != sweep.cost_profiles.front().name || r.trades == 0) continue;
            std::printf("  thr=%.2f trades=%zu label_prec=%.3f exp/trade=%.2f (%.2f/day)\n",
                        r.threshold, r.trades, r.label_precision, r.expected_pnl_per_trade,
                        r.trades_per_day);
        }

        std::cout << "\nCalibration:\n";
        for (const auto& b : bins) {
            if (b.empty()) {
                std::printf("  (%.2f, %.2f]: empty\n", b.lower, b.upper);
            } else {
                std::printf("  (%.2f, %.2f]: n=%zu mean_pred=%.4f empirical=%.4f\n",
                            b.lower, b.upper, b.count, b.mean_pred, b.empirical_prob);
            }
        }
        if (calibration.out_of_range() > 0) {
            std::cerr << "WARNING: " << calibration.out_of_range()
                      << " predictions outside the calibration edges\n";
        }

        std::filesystem::create_directories(output_dir);
        const std::filesystem::path out(output_dir);
        report_io::write_sweep_csv((out / "sweep_results.csv").string(), report.results);
        report_io::write_label_analysis_csv((out / "thresholds_analysis.csv").string(), labels,
                                            sweep.horizons_min);
        report_io::write_calibration_csv((out / "bin_stats.csv").string(), bins, calib.horizons_min);
        report_io::write_text((out / "sweep_summary.json").string(),
                              report_io::to_json(report, sweep, join));
        std::cout << "\nWrote sweep_results.csv, thresholds_analysis.csv, bin_stats.csv, "
                     "sweep_summary.json to "
                  << output_dir << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
