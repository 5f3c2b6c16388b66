#pragma once

#include "data/time_series_dataset.hpp"
#include "errors.hpp"
#include "model/fold_trainer.hpp"
#include "walkforward/fold_builder.hpp"

#include <functional>
#include <string>
#include <vector>

namespace skip_reason {
    constexpr const char* INSUFFICIENT_DATA = "insufficient_data";
    constexpr const char* TRAINING_FAILURE  = "training_failure";
}  // namespace skip_reason

// ---------------------------------------------------------------------------
// FoldSkip — a fold excluded from the prediction table, and why
// ---------------------------------------------------------------------------
struct FoldSkip {
    int fold_id = 0;
    std::string reason;
    std::string message;
};

// ---------------------------------------------------------------------------
// FoldOutcome — per-fold progress record handed to the caller's callback
// ---------------------------------------------------------------------------
struct FoldOutcome {
    Fold fold;
    bool skipped = false;
    FoldSkip skip;
    FoldMetrics metrics;
};

// ---------------------------------------------------------------------------
// WalkForwardReport — union of the surviving folds plus the skip list
// ---------------------------------------------------------------------------
struct WalkForwardReport {
    std::vector<Fold> folds;
    std::vector<FoldMetrics> fold_metrics;
    std::vector<FoldSkip> skips;
    std::vector<FoldPrediction> predictions;
    std::vector<FeatureImportance> importances;

    int folds_built() const { return static_cast<int>(folds.size()); }
    int folds_trained() const { return static_cast<int>(fold_metrics.size()); }
    int folds_skipped() const { return static_cast<int>(skips.size()); }
    bool complete() const { return skips.empty(); }
};

// ---------------------------------------------------------------------------
// WalkForwardRunner — builds folds and trains each one in order.
// Per-fold InsufficientDataError / TrainingFailure are caught here and
// recorded; configuration and schema errors propagate.
// ---------------------------------------------------------------------------
class WalkForwardRunner {
public:
    using FoldCallback = std::function<void(const FoldOutcome&)>;

    WalkForwardRunner(const WalkForwardConfig& wf_config, const FoldTrainerConfig& trainer_config)
        : builder_(wf_config), trainer_(trainer_config) {}

    std::vector<Fold> build_folds(const TimeSeriesDataset& data) const {
        return builder_.build(data.timestamps());
    }

    WalkForwardReport run(const TimeSeriesDataset& data,
                          const FoldCallback& on_fold = FoldCallback()) const {
        return run(data, build_folds(data), on_fold);
    }

    WalkForwardReport run(const TimeSeriesDataset& data, const std::vector<Fold>& folds,
                          const FoldCallback& on_fold = FoldCallback()) const {
        WalkForwardReport report;
        report.folds = folds;

        for (const auto& fold : folds) {
            FoldOutcome outcome;
            outcome.fold = fold;
            try {
                auto result = trainer_.train(fold, data);
                outcome.metrics = result.metrics;
                report.fold_metrics.push_back(result.metrics);
                report.predictions.insert(report.predictions.end(),
                                          result.predictions.begin(), result.predictions.end());
                report.importances.insert(report.importances.end(),
                                          result.importances.begin(), result.importances.end());
            } catch (const InsufficientDataError& e) {
                outcome.skipped = true;
                outcome.skip = {fold.fold_id, skip_reason::INSUFFICIENT_DATA, e.what()};
                report.skips.push_back(outcome.skip);
            } catch (const TrainingFailure& e) {
                outcome.skipped = true;
                outcome.skip = {fold.fold_id, skip_reason::TRAINING_FAILURE, e.what()};
                report.skips.push_back(outcome.skip);
            }
            if (on_fold) on_fold(outcome);
        }
        return report;
    }

private:
    FoldBuilder builder_;
    FoldTrainer trainer_;
};
