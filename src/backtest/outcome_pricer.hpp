#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/trade_record.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Take-profit / stop-loss as fractions of entry price. Either may be absent.
struct BarrierConfig {
    std::optional<double> tp_fraction;
    std::optional<double> sl_fraction;

    void validate() const {
        if (tp_fraction && !(*tp_fraction > 0.0)) {
            throw ConfigurationError("tp_fraction must be > 0, got " + std::to_string(*tp_fraction));
        }
        if (sl_fraction && !(*sl_fraction > 0.0)) {
            throw ConfigurationError("sl_fraction must be > 0, got " + std::to_string(*sl_fraction));
        }
    }
};

enum class PricingMode {
    TERMINAL,   // horizon close only, barriers applied retroactively
    PATH        // bar-by-bar walk to the horizon, first barrier touched wins
};

inline std::string pricing_mode_str(PricingMode mode) {
    return mode == PricingMode::PATH ? "path" : "terminal";
}

inline PricingMode parse_pricing_mode(const std::string& s) {
    if (s == "terminal") return PricingMode::TERMINAL;
    if (s == "path") return PricingMode::PATH;
    throw ConfigurationError("Unknown pricing mode: " + s + " (expected terminal|path)");
}

namespace pricing {

inline void finish(SimulatedTrade& t, const ExecutionCosts& costs) {
    t.cost = costs.trade_cost(t.entry_price);
    t.net_pnl = t.capped_delta * costs.lot_multiplier - t.cost;
}

// Terminal pricer. Only the horizon close is inspected: take-profit caps the
// upside first, then stop-loss caps the (possibly capped) downside. A path
// that touches the stop and recovers is still priced as a take-profit.
inline SimulatedTrade price_terminal(double entry_price, double forward_close,
                                     const BarrierConfig& barriers,
                                     const ExecutionCosts& costs) {
    SimulatedTrade t;
    t.entry_price = entry_price;
    t.exit_price = forward_close;
    t.raw_delta = forward_close - entry_price;
    t.capped_delta = t.raw_delta;

    if (barriers.tp_fraction) {
        double tp_points = entry_price * *barriers.tp_fraction;
        if (t.raw_delta >= tp_points) {
            t.capped_delta = tp_points;
            t.exit_reason = exit_reason::TAKE_PROFIT;
        }
    }
    if (barriers.sl_fraction) {
        double sl_points = entry_price * *barriers.sl_fraction;
        if (t.capped_delta <= -sl_points) {
            t.capped_delta = -sl_points;
            t.exit_reason = exit_reason::STOP;
        }
    }
    finish(t, costs);
    return t;
}

// Bar-by-bar pricer. `path` holds the closes after entry in time order; its
// last element is the horizon close. The first close at or beyond a barrier
// exits there; otherwise the horizon delta is used.
inline SimulatedTrade price_path(double entry_price, const std::vector<double>& path,
                                 const BarrierConfig& barriers,
                                 const ExecutionCosts& costs) {
    if (path.empty()) throw std::invalid_argument("price_path: empty price path");

    SimulatedTrade t;
    t.entry_price = entry_price;
    t.exit_price = path.back();
    t.raw_delta = path.back() - entry_price;
    t.capped_delta = t.raw_delta;
    t.bars_held = static_cast<int>(path.size());

    for (size_t j = 0; j < path.size(); ++j) {
        if (!std::isfinite(path[j])) continue;
        double delta = path[j] - entry_price;
        if (barriers.tp_fraction) {
            double tp_points = entry_price * *barriers.tp_fraction;
            if (delta >= tp_points) {
                t.capped_delta = tp_points;
                t.exit_price = path[j];
                t.exit_reason = exit_reason::TAKE_PROFIT;
                t.bars_held = static_cast<int>(j + 1);
                break;
            }
        }
        if (barriers.sl_fraction) {
            double sl_points = entry_price * *barriers.sl_fraction;
            if (delta <= -sl_points) {
                t.capped_delta = -sl_points;
                t.exit_price = path[j];
                t.exit_reason = exit_reason::STOP;
                t.bars_held = static_cast<int>(j + 1);
                break;
            }
        }
    }
    finish(t, costs);
    return t;
}

}  // namespace pricing

// ---------------------------------------------------------------------------
// OutcomePricer — prices a dataset row at a horizon under one pricing mode
// ---------------------------------------------------------------------------
class OutcomePricer {
public:
    explicit OutcomePricer(PricingMode mode = PricingMode::TERMINAL,
                           const ExecutionCosts& costs = ExecutionCosts())
        : mode_(mode), costs_(costs) {}

    PricingMode mode() const { return mode_; }
    const ExecutionCosts& costs() const { return costs_; }

    // Caller checks data.is_priceable(row, horizon_min) first.
    SimulatedTrade price(const TimeSeriesDataset& data, size_t row, int horizon_min,
                         const BarrierConfig& barriers) const {
        double entry = data.spot_close(row);
        double fwd = data.forward_close(row, horizon_min);

        SimulatedTrade t = (mode_ == PricingMode::PATH)
            ? pricing::price_path(entry, path_closes(data, row, horizon_min), barriers, costs_)
            : pricing::price_terminal(entry, fwd, barriers, costs_);
        t.row_index = row;
        t.entry_ts = data.timestamp(row);
        t.horizon_min = horizon_min;
        return t;
    }

private:
    PricingMode mode_;
    ExecutionCosts costs_;

    // Spot closes strictly inside (entry, entry + horizon), followed by the
    // precomputed horizon close so both modes agree when no barrier is hit.
    static std::vector<double> path_closes(const TimeSeriesDataset& data, size_t row,
                                           int horizon_min) {
        std::vector<double> path;
        int64_t horizon_ts = data.timestamp(row) +
                             static_cast<int64_t>(horizon_min) * time_utils::NS_PER_MINUTE;
        for (size_t j = row + 1; j < data.size() && data.timestamp(j) < horizon_ts; ++j) {
            path.push_back(data.spot_close(j));
        }
        path.push_back(data.forward_close(row, horizon_min));
        return path;
    }
};
