#pragma once

#include "errors.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// WalkForwardConfig — calendar windowing of the walk-forward split
// ---------------------------------------------------------------------------
struct WalkForwardConfig {
    int train_window_months = 12;
    int test_window_months = 1;
    int step_months = 1;
    int64_t sampling_unit_ns = time_utils::NS_PER_MINUTE;

    void validate() const {
        if (train_window_months <= 0) {
            throw ConfigurationError("train_window_months must be > 0, got " +
                                     std::to_string(train_window_months));
        }
        if (test_window_months <= 0) {
            throw ConfigurationError("test_window_months must be > 0, got " +
                                     std::to_string(test_window_months));
        }
        if (step_months <= 0) {
            throw ConfigurationError("step_months must be > 0, got " +
                                     std::to_string(step_months));
        }
        if (sampling_unit_ns <= 0) {
            throw ConfigurationError("sampling_unit_ns must be > 0");
        }
    }
};

// ---------------------------------------------------------------------------
// IndexRange — half-open [begin, end) row interval
// ---------------------------------------------------------------------------
struct IndexRange {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end > begin ? end - begin : 0; }
    bool empty() const { return end <= begin; }
    bool contains(size_t i) const { return i >= begin && i < end; }

    bool operator==(const IndexRange& o) const { return begin == o.begin && end == o.end; }
};

// ---------------------------------------------------------------------------
// Fold — one walk-forward split. Calendar bounds are inclusive instants.
// ---------------------------------------------------------------------------
struct Fold {
    int fold_id = 0;
    int64_t train_start = 0;
    int64_t train_end = 0;
    int64_t test_start = 0;
    int64_t test_end = 0;
    IndexRange train_rows;
    IndexRange test_rows;
};

namespace fold_util {

// First index with ts >= t.
inline size_t search_left(const std::vector<int64_t>& ts, int64_t t) {
    return static_cast<size_t>(std::lower_bound(ts.begin(), ts.end(), t) - ts.begin());
}

// First index with ts > t.
inline size_t search_right(const std::vector<int64_t>& ts, int64_t t) {
    return static_cast<size_t>(std::upper_bound(ts.begin(), ts.end(), t) - ts.begin());
}

// Rows whose timestamp lies in the inclusive window [start, end].
inline IndexRange resolve_window(const std::vector<int64_t>& ts, int64_t start, int64_t end) {
    IndexRange r;
    r.begin = search_left(ts, start);
    r.end = std::max(r.begin, search_right(ts, end));
    return r;
}

// Fill train_rows / test_rows from the fold's calendar bounds.
inline void resolve_fold(Fold& fold, const std::vector<int64_t>& ts) {
    fold.train_rows = resolve_window(ts, fold.train_start, fold.train_end);
    fold.test_rows = resolve_window(ts, fold.test_start, fold.test_end);
}

}  // namespace fold_util

// ---------------------------------------------------------------------------
// FoldBuilder — calendar-stepped walk-forward folds over sorted timestamps
// ---------------------------------------------------------------------------
class FoldBuilder {
public:
    explicit FoldBuilder(const WalkForwardConfig& config) : config_(config) {
        config_.validate();
    }

    const WalkForwardConfig& config() const { return config_; }

    // Calendar bounds only; an empty fold list means insufficient history.
    std::vector<Fold> calendar_folds(int64_t min_ts, int64_t max_ts) const {
        std::vector<Fold> folds;
        if (max_ts < min_ts) return folds;

        const int64_t start_month = time_utils::month_floor(min_ts);
        const int64_t end_month = time_utils::month_floor(max_ts);
        const int64_t limit = time_utils::add_months(end_month, 1);

        int64_t test_start = time_utils::add_months(start_month, config_.train_window_months);
        int fold_id = 0;
        while (time_utils::add_months(test_start, config_.test_window_months) <= limit) {
            Fold fold;
            fold.fold_id = fold_id++;
            fold.train_start = time_utils::add_months(test_start, -config_.train_window_months);
            fold.train_end = test_start - config_.sampling_unit_ns;
            fold.test_start = test_start;
            fold.test_end = time_utils::add_months(test_start, config_.test_window_months)
                            - config_.sampling_unit_ns;
            folds.push_back(fold);

            test_start = time_utils::add_months(test_start, config_.step_months);
        }
        return folds;
    }

    // Folds with row ranges resolved against `timestamps` (must be sorted).
    std::vector<Fold> build(const std::vector<int64_t>& timestamps) const {
        if (timestamps.empty()) return {};
        if (!std::is_sorted(timestamps.begin(), timestamps.end())) {
            throw std::invalid_argument("FoldBuilder::build requires sorted timestamps");
        }
        auto folds = calendar_folds(timestamps.front(), timestamps.back());
        for (auto& fold : folds) {
            fold_util::resolve_fold(fold, timestamps);
        }
        return folds;
    }

private:
    WalkForwardConfig config_;
};
