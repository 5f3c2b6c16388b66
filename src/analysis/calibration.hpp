#pragma once

#include "backtest/trade_selector.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"

#include <cmath>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CalibrationBin — predicted probability vs. observed outcome in one range
// ---------------------------------------------------------------------------
struct CalibrationBin {
    double lower = 0.0;
    double upper = 0.0;
    size_t count = 0;
    double mean_pred = std::nan("");
    double empirical_prob = std::nan("");
    std::map<int, double> avg_forward_return;   // horizon -> mean (fwd/entry - 1)

    bool empty() const { return count == 0; }
};

struct CalibrationConfig {
    std::vector<double> edges = {0.0, 0.5, 0.55, 0.6, 0.62, 0.64, 0.66, 0.68, 0.70, 0.75, 1.0};
    std::vector<int> horizons_min = {1, 3};

    void validate() const {
        if (edges.size() < 2) throw ConfigurationError("Calibration needs at least two bin edges");
        for (size_t i = 1; i < edges.size(); ++i) {
            if (!(edges[i] > edges[i - 1])) {
                throw ConfigurationError("Calibration edges must be strictly increasing");
            }
        }
    }
};

// ---------------------------------------------------------------------------
// CalibrationAnalyzer
//
// Bins are right-closed (lo, hi]; the first bin also takes its lower edge.
// Probabilities outside [edges.front(), edges.back()] are counted as
// out of range and ignored.
// ---------------------------------------------------------------------------
class CalibrationAnalyzer {
public:
    explicit CalibrationAnalyzer(const CalibrationConfig& config = CalibrationConfig())
        : config_(config) {
        config_.validate();
    }

    // Bin index for p, or -1.
    int bin_of(double p) const {
        const auto& e = config_.edges;
        if (!std::isfinite(p) || p < e.front() || p > e.back()) return -1;
        if (p == e.front()) return 0;
        for (size_t i = 1; i < e.size(); ++i) {
            if (p <= e[i]) return static_cast<int>(i - 1);
        }
        return -1;
    }

    // Without a dataset the forward-return columns are left empty.
    std::vector<CalibrationBin> compute(const std::vector<JoinedPrediction>& rows,
                                        const TimeSeriesDataset* data = nullptr) {
        const auto& e = config_.edges;
        size_t n_bins = e.size() - 1;
        std::vector<CalibrationBin> bins(n_bins);
        std::vector<double> pred_sum(n_bins, 0.0);
        std::vector<size_t> pos(n_bins, 0);
        std::vector<std::map<int, double>> ret_sum(n_bins);
        std::vector<std::map<int, size_t>> ret_n(n_bins);

        bool with_returns = data != nullptr && data->has_spot();
        out_of_range_ = 0;

        for (const auto& r : rows) {
            int b = bin_of(r.y_pred);
            if (b < 0) {
                ++out_of_range_;
                continue;
            }
            bins[b].count++;
            pred_sum[b] += r.y_pred;
            if (r.y_true == 1) ++pos[b];

            if (!with_returns) continue;
            for (int h : config_.horizons_min) {
                if (!data->has_horizon(h) || !data->is_priceable(r.row, h)) continue;
                double entry = data->spot_close(r.row);
                ret_sum[b][h] += data->forward_close(r.row, h) / entry - 1.0;
                ret_n[b][h]++;
            }
        }

        for (size_t b = 0; b < n_bins; ++b) {
            auto& bin = bins[b];
            bin.lower = e[b];
            bin.upper = e[b + 1];
            if (bin.count > 0) {
                bin.mean_pred = pred_sum[b] / static_cast<double>(bin.count);
                bin.empirical_prob = static_cast<double>(pos[b]) / static_cast<double>(bin.count);
            }
            for (int h : config_.horizons_min) {
                auto it = ret_n[b].find(h);
                bin.avg_forward_return[h] = (it != ret_n[b].end() && it->second > 0)
                    ? ret_sum[b][h] / static_cast<double>(it->second)
                    : std::nan("");
            }
        }
        return bins;
    }

    size_t out_of_range() const { return out_of_range_; }
    const CalibrationConfig& config() const { return config_; }

private:
    CalibrationConfig config_;
    size_t out_of_range_ = 0;
};
