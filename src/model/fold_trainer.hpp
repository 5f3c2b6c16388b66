#pragma once

#include "analysis/classification_metrics.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"
#include "model/gbt_classifier.hpp"
#include "walkforward/fold_builder.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// FoldTrainerConfig
// ---------------------------------------------------------------------------
struct FoldTrainerConfig {
    size_t min_train_rows = 50;
    size_t min_test_rows = 10;
    double decision_cutoff = 0.5;   // summary metrics only
    GBTParams gbt;
    std::string model_dir;          // save fold_{id}.json here when set
};

// ---------------------------------------------------------------------------
// FoldPrediction — one out-of-sample test row
// ---------------------------------------------------------------------------
struct FoldPrediction {
    int fold_id = 0;
    size_t row_index = 0;
    int64_t timestamp = 0;
    int y_true = 0;
    double y_pred = 0.0;
};

struct FeatureImportance {
    int fold_id = 0;
    std::string feature;
    double importance = 0.0;
};

// ---------------------------------------------------------------------------
// FoldMetrics — scalar diagnostics of one trained fold
// ---------------------------------------------------------------------------
struct FoldMetrics {
    int fold_id = 0;
    size_t n_train = 0;
    size_t n_test = 0;
    size_t n_train_dropped = 0;
    size_t n_test_dropped = 0;
    double scale_pos_weight = 1.0;
    std::string eval_metric;
    int rounds_trained = 0;
    int best_iteration = -1;
    int iterations_used = 0;
    bool early_stopped = false;
    BinaryMetrics metrics;
};

struct FoldTrainResult {
    FoldMetrics metrics;
    std::vector<FoldPrediction> predictions;
    std::vector<FeatureImportance> importances;
};

// negatives / positives on the training labels; 1.0 without positives.
inline double compute_scale_pos_weight(const std::vector<int>& labels) {
    size_t pos = 0;
    for (int y : labels) if (y == 1) ++pos;
    if (pos == 0) return 1.0;
    return static_cast<double>(labels.size() - pos) / static_cast<double>(pos);
}

// ---------------------------------------------------------------------------
// FoldTrainer — trains one classifier on a fold's training rows and scores
// its test rows
// ---------------------------------------------------------------------------
class FoldTrainer {
public:
    FoldTrainer() = default;
    explicit FoldTrainer(const FoldTrainerConfig& config) : config_(config) {}

    const FoldTrainerConfig& config() const { return config_; }

    // Throws InsufficientDataError when either slice is below its floor after
    // invalid rows are dropped, TrainingFailure when the booster fails.
    FoldTrainResult train(const Fold& fold, const TimeSeriesDataset& data) const {
        if (!data.has_label()) throw SchemaError("Dataset has no label column bound");
        if (data.num_features() == 0) throw SchemaError("Dataset has no feature columns bound");

        Slice train_slice = collect(fold.train_rows, data);
        Slice test_slice = collect(fold.test_rows, data);

        if (train_slice.rows.size() < config_.min_train_rows ||
            test_slice.rows.size() < config_.min_test_rows) {
            throw InsufficientDataError(
                "Fold " + std::to_string(fold.fold_id) + " has too few rows after drop: train=" +
                std::to_string(train_slice.rows.size()) + " (min " +
                std::to_string(config_.min_train_rows) + "), test=" +
                std::to_string(test_slice.rows.size()) + " (min " +
                std::to_string(config_.min_test_rows) + ")");
        }

        FoldTrainResult result;
        FoldMetrics& m = result.metrics;
        m.fold_id = fold.fold_id;
        m.n_train = train_slice.rows.size();
        m.n_test = test_slice.rows.size();
        m.n_train_dropped = train_slice.dropped;
        m.n_test_dropped = test_slice.dropped;
        m.scale_pos_weight = compute_scale_pos_weight(train_slice.labels);

        std::vector<double> proba;
        try {
            GBTClassifier model(config_.gbt);
            auto fit = model.fit(train_slice.features, train_slice.labels,
                                 test_slice.features, test_slice.labels,
                                 m.scale_pos_weight, data.feature_names());
            m.eval_metric = fit.eval_metric;
            m.rounds_trained = fit.rounds_trained;
            m.best_iteration = fit.best_iteration;
            m.iterations_used = fit.iterations_used;
            m.early_stopped = fit.early_stopped;

            proba = model.predict_proba(test_slice.features);

            auto gains = model.feature_importance(data.feature_names());
            for (size_t f = 0; f < gains.size(); ++f) {
                result.importances.push_back({fold.fold_id, data.feature_names()[f], gains[f]});
            }

            if (!config_.model_dir.empty()) {
                std::filesystem::create_directories(config_.model_dir);
                auto path = std::filesystem::path(config_.model_dir) /
                            ("fold_" + std::to_string(fold.fold_id) + ".json");
                model.save(path.string());
            }
        } catch (const std::exception& e) {
            throw TrainingFailure("Fold " + std::to_string(fold.fold_id) +
                                  " training failed: " + e.what());
        }

        m.metrics = binary_metrics(test_slice.labels, proba, config_.decision_cutoff);

        result.predictions.reserve(test_slice.rows.size());
        for (size_t i = 0; i < test_slice.rows.size(); ++i) {
            size_t row = test_slice.rows[i];
            result.predictions.push_back(
                {fold.fold_id, row, data.timestamp(row), test_slice.labels[i], proba[i]});
        }
        return result;
    }

private:
    FoldTrainerConfig config_;

    struct Slice {
        std::vector<size_t> rows;
        std::vector<int> labels;
        FeatureMatrix features;
        size_t dropped = 0;
    };

    static Slice collect(const IndexRange& range, const TimeSeriesDataset& data) {
        Slice s;
        size_t end = std::min(range.end, data.size());
        size_t n_features = data.num_features();
        s.features.cols = n_features;
        for (size_t r = range.begin; r < end; ++r) {
            if (!data.is_trainable(r)) {
                ++s.dropped;
                continue;
            }
            s.rows.push_back(r);
            s.labels.push_back(data.label(r) == 1.0 ? 1 : 0);
            for (size_t f = 0; f < n_features; ++f) {
                s.features.values.push_back(static_cast<float>(data.feature(r, f)));
            }
        }
        s.features.rows = s.rows.size();
        return s;
    }
};
