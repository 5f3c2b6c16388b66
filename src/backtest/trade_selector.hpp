#pragma once

#include "data/time_series_dataset.hpp"
#include "errors.hpp"
#include "model/fold_trainer.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

// Sentinel for predictions that carry no source row (e.g. loaded from a file
// written without a row_index column).
constexpr size_t NO_ROW = std::numeric_limits<size_t>::max();

// ---------------------------------------------------------------------------
// JoinedPrediction — one out-of-sample probability bound to a dataset row
// ---------------------------------------------------------------------------
struct JoinedPrediction {
    int fold_id = 0;
    size_t row = 0;          // dataset row
    int64_t timestamp = 0;   // dataset timestamp of `row`
    int y_true = 0;
    double y_pred = 0.0;
};

struct JoinConfig {
    int64_t tolerance_ns = 30 * time_utils::NS_PER_SEC;
};

struct JoinResult {
    std::vector<JoinedPrediction> rows;
    size_t matched_by_index = 0;
    size_t matched_by_time = 0;
    size_t unmatched = 0;
};

namespace selector_util {

// Nearest row to ts within tolerance, or NO_ROW.
inline size_t nearest_row(const std::vector<int64_t>& ts, int64_t target, int64_t tolerance_ns) {
    auto it = std::lower_bound(ts.begin(), ts.end(), target);
    size_t best = NO_ROW;
    int64_t best_dist = std::numeric_limits<int64_t>::max();
    if (it != ts.end()) {
        best = static_cast<size_t>(it - ts.begin());
        best_dist = *it - target;
    }
    if (it != ts.begin()) {
        auto prev = std::prev(it);
        int64_t d = target - *prev;
        if (d <= best_dist) {
            best = static_cast<size_t>(prev - ts.begin());
            best_dist = d;
        }
    }
    if (best == NO_ROW || best_dist > tolerance_ns) return NO_ROW;
    return best;
}

// Join tolerance from a seconds value given on the command line.
inline int64_t tolerance_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw ConfigurationError("Join tolerance must be >= 0 seconds, got " +
                                 std::to_string(seconds));
    }
    // Beyond a day a nearest-row match is meaningless for minute bars.
    if (seconds > 86400.0) {
        throw ConfigurationError("Join tolerance above one day: " + std::to_string(seconds));
    }
    return static_cast<int64_t>(std::llround(seconds * time_utils::NS_PER_SEC));
}

}  // namespace selector_util

// Bind predictions to dataset rows. A prediction whose row_index is valid and
// whose timestamp matches that row is used as is; otherwise the nearest row
// by timestamp within the tolerance. Unmatched predictions are dropped.
inline JoinResult join_predictions(const std::vector<FoldPrediction>& preds,
                                   const TimeSeriesDataset& data,
                                   const JoinConfig& cfg = JoinConfig()) {
    if (cfg.tolerance_ns < 0) throw ConfigurationError("Join tolerance must be >= 0");
    JoinResult out;
    out.rows.reserve(preds.size());
    for (const auto& p : preds) {
        size_t row = NO_ROW;
        if (p.row_index < data.size() && data.timestamp(p.row_index) == p.timestamp) {
            row = p.row_index;
            ++out.matched_by_index;
        } else {
            row = selector_util::nearest_row(data.timestamps(), p.timestamp, cfg.tolerance_ns);
            if (row != NO_ROW) ++out.matched_by_time;
        }
        if (row == NO_ROW) {
            ++out.unmatched;
            continue;
        }
        out.rows.push_back({p.fold_id, row, data.timestamp(row), p.y_true, p.y_pred});
    }
    return out;
}

// ---------------------------------------------------------------------------
// Threshold grid
// ---------------------------------------------------------------------------
inline void validate_thresholds(const std::vector<double>& thresholds) {
    if (thresholds.empty()) throw ConfigurationError("Threshold list is empty");
    for (size_t i = 0; i < thresholds.size(); ++i) {
        double t = thresholds[i];
        if (!std::isfinite(t) || t < 0.0 || t > 1.0) {
            throw ConfigurationError("Threshold out of [0,1]: " + std::to_string(t));
        }
        if (i > 0 && !(t > thresholds[i - 1])) {
            throw ConfigurationError("Thresholds must be strictly increasing at index " +
                                     std::to_string(i));
        }
    }
}

constexpr int MAX_THRESHOLD_GRID = 10000;

// Inclusive grid lo, lo+step, ..., hi, each rounded to 1e-6.
inline std::vector<double> make_threshold_grid(double lo = 0.50, double hi = 0.90,
                                               double step = 0.02) {
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        throw ConfigurationError("Threshold grid bounds must be finite");
    }
    if (!(step > 0.0) || !std::isfinite(step)) throw ConfigurationError("Threshold step must be > 0");
    if (hi < lo) throw ConfigurationError("Threshold grid upper bound below lower bound");
    double count = std::floor((hi - lo) / step + 1e-9);
    if (count >= MAX_THRESHOLD_GRID) {
        throw ConfigurationError("Threshold step " + std::to_string(step) + " gives more than " +
                                 std::to_string(MAX_THRESHOLD_GRID) + " thresholds");
    }
    std::vector<double> grid;
    int n = static_cast<int>(count);
    for (int i = 0; i <= n; ++i) {
        grid.push_back(std::round((lo + i * step) * 1e6) / 1e6);
    }
    validate_thresholds(grid);
    return grid;
}

// Indices into `rows` with y_pred >= threshold.
inline std::vector<size_t> select_signals(const std::vector<JoinedPrediction>& rows,
                                          double threshold) {
    std::vector<size_t> picked;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].y_pred >= threshold) picked.push_back(i);
    }
    return picked;
}
