#pragma once

#include <string>

struct ExecutionCosts {
    double slippage_fraction = 0.00015;  // round trip, fraction of entry price
    double commission = 40.0;            // fixed round-trip commission per trade
    double lot_multiplier = 1.0;         // P&L per index point

    // Round-trip cost: entry_price * slippage_fraction + commission.
    double trade_cost(double entry_price) const {
        return entry_price * slippage_fraction + commission;
    }
};

// Named commission scenario for the threshold sweep.
struct CostProfile {
    std::string name;
    double commission = 40.0;
};
