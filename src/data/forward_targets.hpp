#pragma once

#include "data/column_table.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ForwardTargetConfig
// ---------------------------------------------------------------------------
struct ForwardTargetConfig {
    std::string spot_column = "nifty_close";
    std::vector<int> horizons_min = {1, 3};
    double up_threshold = 0.0002;    // 0.02% move
    double down_threshold = 0.0002;
    // Per-horizon overrides of up_threshold (minutes -> return).
    std::map<int, double> up_threshold_by_horizon = {{3, 0.0005}};

    double up_threshold_for(int horizon) const {
        auto it = up_threshold_by_horizon.find(horizon);
        return it == up_threshold_by_horizon.end() ? up_threshold : it->second;
    }
};

// ---------------------------------------------------------------------------
// ForwardTargetSummary — class balance per derived label column
// ---------------------------------------------------------------------------
struct ForwardTargetSummary {
    size_t rows = 0;
    std::vector<std::string> columns_added;
    std::vector<std::pair<std::string, size_t>> positives;
    size_t tail_rows_without_forward = 0;
};

// Appends future_close_{N}m, future_ret_{N}m, target_dir_{N}m, target_up_{N}m
// and target_down_{N}m for every horizon. Rows are one minute apart, so the
// forward close is a plain N-row shift. Tail rows with no forward value get
// NaN in every derived column (label included) so the validity predicates
// drop them downstream.
inline ForwardTargetSummary add_forward_targets(ColumnTable& table,
                                                const ForwardTargetConfig& cfg) {
    for (int h : cfg.horizons_min) {
        if (h <= 0) throw ConfigurationError("Forward horizon must be > 0, got " + std::to_string(h));
    }
    if (cfg.up_threshold < 0.0 || cfg.down_threshold < 0.0) {
        throw ConfigurationError("Target thresholds must be >= 0");
    }
    for (const auto& [h, t] : cfg.up_threshold_by_horizon) {
        if (!(t >= 0.0)) {
            throw ConfigurationError("Target threshold for " + std::to_string(h) +
                                     "m must be >= 0");
        }
    }
    table.sort_by_timestamp();
    const std::vector<double> close = table.column(cfg.spot_column);
    const size_t n = close.size();
    const double nan = std::nan("");

    ForwardTargetSummary summary;
    summary.rows = n;

    size_t max_h = 0;
    for (int h : cfg.horizons_min) {
        const size_t shift = static_cast<size_t>(h);
        const double up_threshold = cfg.up_threshold_for(h);
        max_h = std::max(max_h, shift);

        std::vector<double> fwd_close(n, nan), fwd_ret(n, nan);
        std::vector<double> dir(n, nan), up(n, nan), down(n, nan);
        for (size_t i = 0; i + shift < n; ++i) {
            double c0 = close[i];
            double c1 = close[i + shift];
            fwd_close[i] = c1;
            if (!std::isfinite(c0) || !std::isfinite(c1) || c0 == 0.0) continue;
            double r = (c1 - c0) / c0;
            fwd_ret[i] = r;
            dir[i] = r > 0.0 ? 1.0 : 0.0;
            up[i] = r >= up_threshold ? 1.0 : 0.0;
            down[i] = r <= -cfg.down_threshold ? 1.0 : 0.0;
        }

        const std::string suffix = std::to_string(h) + "m";
        auto add = [&](const std::string& name, std::vector<double> values, bool is_label) {
            if (is_label) {
                size_t pos = 0;
                for (double v : values) if (v == 1.0) ++pos;
                summary.positives.emplace_back(name, pos);
            }
            table.add_column(name, std::move(values));
            summary.columns_added.push_back(name);
        };
        add(DatasetSchema::forward_close_column(h), std::move(fwd_close), false);
        add(DatasetSchema::forward_return_column(h), std::move(fwd_ret), false);
        add("target_dir_" + suffix, std::move(dir), true);
        add("target_up_" + suffix, std::move(up), true);
        add("target_down_" + suffix, std::move(down), true);
    }
    summary.tail_rows_without_forward = std::min(max_h, n);
    return summary;
}
