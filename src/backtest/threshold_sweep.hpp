#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/outcome_pricer.hpp"
#include "backtest/trade_record.hpp"
#include "backtest/trade_selector.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ThresholdResult — aggregate over the trades of one sweep cell
// ---------------------------------------------------------------------------
struct ThresholdResult {
    std::string cost_profile;
    int horizon_min = 0;
    double threshold = 0.0;
    std::optional<double> sl_fraction;
    std::optional<double> tp_fraction;

    size_t trades = 0;
    size_t wins = 0;
    double precision = 0.0;
    double trades_per_day = 0.0;
    double avg_pnl = 0.0;
    double total_pnl = 0.0;
};

// count, wins (net_pnl > 0), precision, avg/total P&L and trades per day.
// Empty input yields zeros, never NaN.
inline ThresholdResult aggregate_trades(const std::vector<SimulatedTrade>& trades,
                                        int64_t calendar_days) {
    ThresholdResult r;
    r.trades = trades.size();
    for (const auto& t : trades) {
        r.total_pnl += t.net_pnl;
        if (t.net_pnl > 0.0) ++r.wins;
    }
    if (r.trades > 0) {
        r.precision = static_cast<double>(r.wins) / static_cast<double>(r.trades);
        r.avg_pnl = r.total_pnl / static_cast<double>(r.trades);
    }
    if (calendar_days > 0) {
        r.trades_per_day = static_cast<double>(r.trades) / static_cast<double>(calendar_days);
    }
    return r;
}

// ---------------------------------------------------------------------------
// LabelThresholdResult — what a cutoff selects before any trade simulation:
// label precision, mean forward return per horizon, and the expected net P&L
// per trade at the average spot level.
// ---------------------------------------------------------------------------
struct LabelThresholdResult {
    std::string cost_profile;
    double threshold = 0.0;

    size_t trades = 0;
    size_t label_wins = 0;                  // selected rows with y_true == 1
    double label_precision = 0.0;
    std::map<int, double> avg_forward_return;   // NaN when nothing to average
    double trades_per_day = 0.0;
    double expected_pnl_per_trade = std::nan("");
};

inline std::vector<CostProfile> default_cost_profiles() {
    return {{"current_broker", 40.0}, {"futures_like", 12.0}};
}

// ---------------------------------------------------------------------------
// SweepConfig
// ---------------------------------------------------------------------------
struct SweepConfig {
    std::vector<double> thresholds = make_threshold_grid();
    std::vector<int> horizons_min = {1, 3};
    std::vector<std::optional<double>> sl_options = {std::nullopt};
    std::vector<std::optional<double>> tp_options = {std::nullopt};
    std::vector<CostProfile> cost_profiles = default_cost_profiles();
    double slippage_fraction = 0.00015;
    double lot_multiplier = 1.0;
    PricingMode mode = PricingMode::TERMINAL;

    void validate() const {
        validate_thresholds(thresholds);
        if (horizons_min.empty()) throw ConfigurationError("No horizons configured");
        for (int h : horizons_min) {
            if (h <= 0) throw ConfigurationError("Horizon must be > 0, got " + std::to_string(h));
        }
        if (sl_options.empty() || tp_options.empty()) {
            throw ConfigurationError("SL/TP option lists must not be empty (use none)");
        }
        for (const auto& sl : sl_options) BarrierConfig{std::nullopt, sl}.validate();
        for (const auto& tp : tp_options) BarrierConfig{tp, std::nullopt}.validate();
        if (cost_profiles.empty()) throw ConfigurationError("No cost profiles configured");
        if (slippage_fraction < 0.0) throw ConfigurationError("slippage_fraction must be >= 0");
    }
};

struct SweepReport {
    std::vector<ThresholdResult> results;
    int64_t calendar_days = 0;
    size_t predictions = 0;
    std::map<int, size_t> unpriceable;   // horizon -> joined rows dropped
};

// ---------------------------------------------------------------------------
// ThresholdSweep — cost profile x horizon x threshold x SL x TP.
// Every cell produces one ThresholdResult, including zero-trade cells.
// ---------------------------------------------------------------------------
class ThresholdSweep {
public:
    explicit ThresholdSweep(const SweepConfig& config) : config_(config) {
        config_.validate();
    }

    const SweepConfig& config() const { return config_; }

    SweepReport run(const std::vector<JoinedPrediction>& joined,
                    const TimeSeriesDataset& data) const {
        if (!data.has_spot()) throw SchemaError("Dataset has no spot column bound");
        for (int h : config_.horizons_min) {
            if (!data.has_horizon(h)) {
                throw SchemaError("Dataset has no column " + DatasetSchema::forward_close_column(h));
            }
        }

        SweepReport report;
        report.predictions = joined.size();
        report.calendar_days = prediction_days(joined);

        for (const auto& profile : config_.cost_profiles) {
            ExecutionCosts costs;
            costs.slippage_fraction = config_.slippage_fraction;
            costs.commission = profile.commission;
            costs.lot_multiplier = config_.lot_multiplier;
            OutcomePricer pricer(config_.mode, costs);

            for (int h : config_.horizons_min) {
                std::vector<JoinedPrediction> priceable;
                for (const auto& p : joined) {
                    if (data.is_priceable(p.row, h)) priceable.push_back(p);
                }
                report.unpriceable[h] = joined.size() - priceable.size();

                for (double thr : config_.thresholds) {
                    auto picked = select_signals(priceable, thr);
                    for (const auto& sl : config_.sl_options) {
                        for (const auto& tp : config_.tp_options) {
                            BarrierConfig barriers{tp, sl};
                            std::vector<SimulatedTrade> trades;
                            trades.reserve(picked.size());
                            for (size_t i : picked) {
                                trades.push_back(pricer.price(data, priceable[i].row, h, barriers));
                            }
                            ThresholdResult r = aggregate_trades(trades, report.calendar_days);
                            r.cost_profile = profile.name;
                            r.horizon_min = h;
                            r.threshold = thr;
                            r.sl_fraction = sl;
                            r.tp_fraction = tp;
                            report.results.push_back(r);
                        }
                    }
                }
            }
        }
        return report;
    }

    // One row per cost profile x threshold over every joined prediction.
    // Expected P&L uses the first horizon's mean return times the mean spot
    // close of all joined rows, less slippage and commission at that level.
    std::vector<LabelThresholdResult> label_analysis(const std::vector<JoinedPrediction>& joined,
                                                     const TimeSeriesDataset& data) const {
        if (!data.has_spot()) throw SchemaError("Dataset has no spot column bound");
        for (int h : config_.horizons_min) {
            if (!data.has_horizon(h)) {
                throw SchemaError("Dataset has no column " + DatasetSchema::forward_close_column(h));
            }
        }

        const int64_t days = prediction_days(joined);
        double close_sum = 0.0;
        size_t close_n = 0;
        for (const auto& p : joined) {
            double c = data.spot_close(p.row);
            if (std::isfinite(c)) {
                close_sum += c;
                ++close_n;
            }
        }
        const double avg_close = close_n > 0 ? close_sum / static_cast<double>(close_n)
                                             : std::nan("");
        const int lead_horizon = config_.horizons_min.front();

        std::vector<LabelThresholdResult> base;
        for (double thr : config_.thresholds) {
            LabelThresholdResult r;
            r.threshold = thr;
            auto picked = select_signals(joined, thr);
            r.trades = picked.size();
            for (size_t i : picked) {
                if (joined[i].y_true == 1) ++r.label_wins;
            }
            if (r.trades > 0) {
                r.label_precision = static_cast<double>(r.label_wins) / static_cast<double>(r.trades);
            }
            if (days > 0) r.trades_per_day = static_cast<double>(r.trades) / static_cast<double>(days);

            for (int h : config_.horizons_min) {
                double sum = 0.0;
                size_t n = 0;
                for (size_t i : picked) {
                    double c0 = data.spot_close(joined[i].row);
                    double c1 = data.forward_close(joined[i].row, h);
                    if (!std::isfinite(c0) || !std::isfinite(c1) || c0 <= 0.0) continue;
                    sum += (c1 - c0) / c0;
                    ++n;
                }
                r.avg_forward_return[h] = n > 0 ? sum / static_cast<double>(n) : std::nan("");
            }
            base.push_back(r);
        }

        std::vector<LabelThresholdResult> out;
        out.reserve(base.size() * config_.cost_profiles.size());
        for (const auto& profile : config_.cost_profiles) {
            ExecutionCosts costs;
            costs.slippage_fraction = config_.slippage_fraction;
            costs.commission = profile.commission;
            costs.lot_multiplier = config_.lot_multiplier;
            for (LabelThresholdResult r : base) {
                r.cost_profile = profile.name;
                double ret = r.avg_forward_return.at(lead_horizon);
                if (std::isfinite(ret) && std::isfinite(avg_close)) {
                    r.expected_pnl_per_trade =
                        ret * avg_close * costs.lot_multiplier - costs.trade_cost(avg_close);
                }
                out.push_back(r);
            }
        }
        return out;
    }

    // Calendar days spanned by the joined predictions, first to last inclusive.
    static int64_t prediction_days(const std::vector<JoinedPrediction>& joined) {
        if (joined.empty()) return 0;
        auto [lo, hi] = std::minmax_element(
            joined.begin(), joined.end(),
            [](const JoinedPrediction& a, const JoinedPrediction& b) { return a.timestamp < b.timestamp; });
        return time_utils::calendar_days_spanned(lo->timestamp, hi->timestamp);
    }

private:
    SweepConfig config_;
};
