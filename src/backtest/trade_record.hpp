#pragma once

#include <cstddef>
#include <cstdint>

namespace exit_reason {
    constexpr int HORIZON     = 0;
    constexpr int TAKE_PROFIT = 1;
    constexpr int STOP        = 2;
}  // namespace exit_reason

struct SimulatedTrade {
    size_t row_index = 0;
    int64_t entry_ts = 0;
    double entry_price = 0.0;
    int horizon_min = 0;
    double exit_price = 0.0;     // price at the exit point (horizon close for HORIZON exits)
    double raw_delta = 0.0;      // horizon close - entry, uncapped
    double capped_delta = 0.0;   // after take-profit / stop-loss
    double cost = 0.0;
    double net_pnl = 0.0;
    int exit_reason = exit_reason::HORIZON;
    int bars_held = 0;           // bar-by-bar pricer only
};
