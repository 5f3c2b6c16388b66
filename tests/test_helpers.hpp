#pragma once

// test_helpers.hpp — synthetic minute-bar datasets shared by the tests

#include "data/column_table.hpp"
#include "data/forward_targets.hpp"
#include "data/time_series_dataset.hpp"
#include "model/gbt_classifier.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace test_helpers {

// `rows_per_day` one-minute rows from 09:15 on days 2..(1 + days_per_month)
// of each of `months` consecutive calendar months.
inline std::vector<int64_t> monthly_timestamps(int year, int month, int months,
                                               int days_per_month = 4, int rows_per_day = 3) {
    std::vector<int64_t> ts;
    for (int k = 0; k < months; ++k) {
        int total = (year * 12 + (month - 1)) + k;
        int y = total / 12;
        int m = total % 12 + 1;
        for (int d = 2; d < 2 + days_per_month; ++d) {
            for (int r = 0; r < rows_per_day; ++r) {
                ts.push_back(time_utils::make_timestamp(y, m, d, 9, 15 + r));
            }
        }
    }
    return ts;
}

// n consecutive one-minute timestamps.
inline std::vector<int64_t> minute_timestamps(int64_t start, size_t n) {
    std::vector<int64_t> ts(n);
    for (size_t i = 0; i < n; ++i) {
        ts[i] = start + static_cast<int64_t>(i) * time_utils::NS_PER_MINUTE;
    }
    return ts;
}

// Deterministic wavy spot series in a "nifty_close" column.
inline ColumnTable make_price_table(const std::vector<int64_t>& ts, double base = 20000.0) {
    ColumnTable table;
    table.timestamps = ts;
    std::vector<double> close(ts.size());
    for (size_t i = 0; i < ts.size(); ++i) {
        close[i] = base + 10.0 * std::sin(static_cast<double>(i) * 0.37) +
                   0.05 * static_cast<double>(i);
    }
    table.add_column("nifty_close", close);
    return table;
}

// Price table plus forward targets (1m, 3m) and two features: f_signal leaks
// the 1-minute direction so a booster can learn it, f_noise does not.
inline ColumnTable make_learnable_table(const std::vector<int64_t>& ts) {
    ColumnTable table = make_price_table(ts);
    ForwardTargetConfig cfg;
    add_forward_targets(table, cfg);

    const auto& dir = table.column("target_dir_1m");
    std::vector<double> signal(ts.size()), noise(ts.size());
    for (size_t i = 0; i < ts.size(); ++i) {
        signal[i] = std::isfinite(dir[i]) ? dir[i] + 0.1 * std::cos(static_cast<double>(i)) : 0.5;
        noise[i] = static_cast<double>((i * 7919) % 101) / 101.0;
    }
    table.add_column("f_signal", signal);
    table.add_column("f_noise", noise);
    return table;
}

inline DatasetSchema training_schema() {
    DatasetSchema schema;
    schema.label_column = "target_dir_1m";
    schema.spot_column = "nifty_close";
    schema.horizons_min = {1, 3};
    schema.feature_columns = {"f_signal", "f_noise"};
    return schema;
}

// Pricing-only dataset: one-minute rows with the given entry and 1-minute
// forward closes. No label, no features.
inline TimeSeriesDataset make_pricing_dataset(const std::vector<double>& entries,
                                              const std::vector<double>& forward_1m,
                                              int64_t start = time_utils::make_timestamp(2024, 1, 2, 9, 15)) {
    ColumnTable table;
    table.timestamps = minute_timestamps(start, entries.size());
    table.add_column("nifty_close", entries);
    table.add_column("future_close_1m", forward_1m);
    DatasetSchema schema;
    schema.label_column.clear();
    schema.horizons_min = {1};
    return TimeSeriesDataset(table, schema);
}

// Small, fast booster settings for unit tests.
inline GBTParams fast_gbt_params() {
    GBTParams p;
    p.max_rounds = 30;
    p.early_stopping_rounds = 5;
    p.max_depth = 3;
    p.learning_rate = 0.3;
    p.subsample = 1.0;
    p.colsample_bytree = 1.0;
    p.nthread = 1;
    return p;
}

inline std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("walkforward_test_" + name)).string();
}

}  // namespace test_helpers
