// walkforward_train.cpp — Walk-forward GBT training
// Builds (or reads) calendar folds, trains one XGBoost classifier per fold
// with early stopping on the fold's test slice, and writes the out-of-sample
// predictions plus per-fold diagnostics.
//
// Outputs under --output-dir:
//   walk_folds.csv, predictions.csv|.parquet, fold_metrics.csv,
//   feature_importance.csv, run_summary.json, models/fold_{id}.json (optional)

#include "cli_args.hpp"
#include "data/dataset_io.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"
#include "model/fold_trainer.hpp"
#include "report/prediction_io.hpp"
#include "report/report_io.hpp"
#include "time_utils.hpp"
#include "walkforward/fold_io.hpp"
#include "walkforward/walk_forward_runner.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <path> --output-dir <dir> [options]\n"
              << "\n"
              << "  --input               Dataset with targets (.csv or .parquet)\n"
              << "  --output-dir          Output directory\n"
              << "  --label               Label column (default: target_dir_1m)\n"
              << "  --features            Comma-separated feature columns\n"
              << "                        (default: every column except future_*/target_*)\n"
              << "  --folds               Existing walk_folds.csv (default: build folds)\n"
              << "  --train-months        (default: 12)\n"
              << "  --test-months         (default: 1)\n"
              << "  --step-months         (default: 1)\n"
              << "  --min-train-rows      (default: 50)\n"
              << "  --min-test-rows       (default: 10)\n"
              << "  --max-rounds          (default: 2000)\n"
              << "  --early-stopping      Patience in rounds (default: 50)\n"
              << "  --learning-rate       (default: 0.05)\n"
              << "  --max-depth           (default: 6)\n"
              << "  --seed                (default: 42)\n"
              << "  --nthread             (default: 1)\n"
              << "  --predictions-format  csv or parquet (default: csv)\n"
              << "  --save-models         Save fold boosters under <output-dir>/models\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string input_path;
    std::string output_dir;
    std::string folds_path;
    std::string features_arg;
    std::string pred_format = "csv";
    bool save_models = false;
    DatasetSchema schema;
    WalkForwardConfig wf;
    FoldTrainerConfig trainer;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--output-dir" && i + 1 < argc) {
                output_dir = argv[++i];
            } else if (arg == "--label" && i + 1 < argc) {
                schema.label_column = argv[++i];
            } else if (arg == "--features" && i + 1 < argc) {
                features_arg = argv[++i];
            } else if (arg == "--folds" && i + 1 < argc) {
                folds_path = argv[++i];
            } else if (arg == "--train-months" && i + 1 < argc) {
                wf.train_window_months = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--test-months" && i + 1 < argc) {
                wf.test_window_months = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--step-months" && i + 1 < argc) {
                wf.step_months = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--min-train-rows" && i + 1 < argc) {
                trainer.min_train_rows = static_cast<size_t>(cli_args::parse_int(arg, argv[++i]));
            } else if (arg == "--min-test-rows" && i + 1 < argc) {
                trainer.min_test_rows = static_cast<size_t>(cli_args::parse_int(arg, argv[++i]));
            } else if (arg == "--max-rounds" && i + 1 < argc) {
                trainer.gbt.max_rounds = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--early-stopping" && i + 1 < argc) {
                trainer.gbt.early_stopping_rounds = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--learning-rate" && i + 1 < argc) {
                trainer.gbt.learning_rate = cli_args::parse_double(arg, argv[++i]);
            } else if (arg == "--max-depth" && i + 1 < argc) {
                trainer.gbt.max_depth = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                trainer.gbt.seed = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--nthread" && i + 1 < argc) {
                trainer.gbt.nthread = cli_args::parse_int(arg, argv[++i]);
            } else if (arg == "--predictions-format" && i + 1 < argc) {
                pred_format = argv[++i];
            } else if (arg == "--save-models") {
                save_models = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (input_path.empty() || output_dir.empty()) {
            std::cerr << "Missing required argument: --input and --output-dir\n";
            print_usage(argv[0]);
            return 1;
        }
        if (pred_format != "csv" && pred_format != "parquet") {
            throw ConfigurationError("--predictions-format must be csv or parquet");
        }
        if (trainer.gbt.max_rounds <= 0 || trainer.gbt.early_stopping_rounds <= 0) {
            throw ConfigurationError("--max-rounds and --early-stopping must be > 0");
        }

        // Fails before any I/O on bad window parameters.
        wf.validate();

        // Training needs only label + features; pricing columns are not required.
        schema.spot_column.clear();
        schema.horizons_min.clear();

        TableReadOptions opts;
        opts.timestamp_column = schema.timestamp_column;
        opts.skip_non_numeric = true;
        ColumnTable table = dataset_io::read_table(input_path, opts);
        schema.feature_columns = features_arg.empty()
            ? dataset_io::infer_feature_columns(table, schema)
            : cli_args::split_list(features_arg);
        if (schema.feature_columns.empty()) throw SchemaError("No feature columns in " + input_path);

        std::filesystem::create_directories(output_dir);
        const std::filesystem::path out(output_dir);
        if (save_models) trainer.model_dir = (out / "models").string();
        WalkForwardRunner runner(wf, trainer);

        TimeSeriesDataset data(std::move(table), schema);
        std::cout << "=== Walk-forward training ===\n"
                  << "Rows: " << data.size() << ", features: " << data.num_features()
                  << ", label: " << schema.label_column << "\n";
        if (!data.empty()) {
            std::cout << "Range: " << time_utils::format_iso8601(data.timestamp(0)) << " .. "
                      << time_utils::format_iso8601(data.timestamp(data.size() - 1)) << "\n";
        }

        std::vector<Fold> folds = folds_path.empty()
            ? runner.build_folds(data)
            : fold_io::read_folds_csv(folds_path, data.timestamps());
        fold_io::write_folds_csv((out / "walk_folds.csv").string(), folds);

        if (folds.empty()) {
            std::cout << "No folds produced (insufficient history for train="
                      << wf.train_window_months << "m test=" << wf.test_window_months << "m)\n";
        } else {
            std::cout << "Folds: " << folds.size() << "\n\n";
        }

        auto report = runner.run(data, folds, [](const FoldOutcome& o) {
            if (o.skipped) {
                std::cerr << "WARNING: fold " << o.fold.fold_id << " skipped ("
                          << o.skip.reason << "): " << o.skip.message << "\n";
                return;
            }
            const auto& m = o.metrics;
            std::printf("  fold %d [%s]: train=%zu test=%zu iters=%d%s auc=%.4f acc=%.4f "
                        "prec=%.4f rec=%.4f\n",
                        m.fold_id, time_utils::format_iso8601(o.fold.test_start).substr(0, 7).c_str(),
                        m.n_train, m.n_test, m.iterations_used,
                        m.early_stopped ? " (early)" : "",
                        m.metrics.auc, m.metrics.accuracy, m.metrics.precision, m.metrics.recall);
        });

        const std::string pred_path =
            (out / (pred_format == "parquet" ? "predictions.parquet" : "predictions.csv")).string();
        prediction_io::write_predictions(pred_path, report.predictions);
        report_io::write_fold_metrics_csv((out / "fold_metrics.csv").string(), report);
        report_io::write_importance_csv((out / "feature_importance.csv").string(),
                                        report.importances);
        report_io::write_text((out / "run_summary.json").string(), report_io::to_json(report, wf));

        std::cout << "\nFolds built: " << report.folds_built()
                  << ", trained: " << report.folds_trained()
                  << ", skipped: " << report.folds_skipped() << "\n";
        if (!report.complete()) {
            std::cerr << "WARNING: report covers " << report.folds_trained() << " of "
                      << report.folds_built() << " folds\n";
        }
        std::cout << "Predictions: " << report.predictions.size() << " -> " << pred_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
