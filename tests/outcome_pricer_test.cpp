// outcome_pricer_test.cpp — Tests for terminal and bar-by-bar trade pricing
//
// Take-profit / stop-loss capping order, the cost model applied to every
// trade, path pricing where the first barrier touched wins, and barrier
// validation.

#include <gtest/gtest.h>

#include "backtest/outcome_pricer.hpp"
#include "data/column_table.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <vector>

namespace {

BarrierConfig barriers(std::optional<double> tp, std::optional<double> sl) {
    BarrierConfig b;
    b.tp_fraction = tp;
    b.sl_fraction = sl;
    return b;
}

// Five one-minute rows with a 3-minute forward close on row 0:
// entry 100, then 104, 95, and 103 at the horizon.
TimeSeriesDataset make_path_dataset() {
    ColumnTable t;
    t.timestamps = test_helpers::minute_timestamps(time_utils::make_timestamp(2024, 1, 2, 9, 15), 5);
    const double nan = std::nan("");
    t.add_column("nifty_close", {100.0, 104.0, 95.0, 103.0, 101.0});
    t.add_column("future_close_3m", {103.0, 101.0, nan, nan, nan});
    DatasetSchema s;
    s.label_column.clear();
    s.horizons_min = {3};
    return TimeSeriesDataset(t, s);
}

}  // namespace

// ===========================================================================
// 1. Terminal pricer
// ===========================================================================

TEST(TerminalPricerTest, NoBarriersUsesRawDelta) {
    ExecutionCosts costs;
    auto t = pricing::price_terminal(100.0, 103.0, BarrierConfig{}, costs);
    EXPECT_DOUBLE_EQ(t.raw_delta, 3.0);
    EXPECT_DOUBLE_EQ(t.capped_delta, 3.0);
    EXPECT_EQ(t.exit_reason, exit_reason::HORIZON);
}

TEST(TerminalPricerTest, TakeProfitCapsUpside) {
    ExecutionCosts costs;
    auto t = pricing::price_terminal(100.0, 112.0, barriers(0.06, std::nullopt), costs);
    EXPECT_DOUBLE_EQ(t.raw_delta, 12.0);
    EXPECT_NEAR(t.capped_delta, 6.0, 1e-12);
    EXPECT_EQ(t.exit_reason, exit_reason::TAKE_PROFIT);
}

TEST(TerminalPricerTest, TakeProfitWinsWhenBothBarriersConfigured) {
    ExecutionCosts costs;
    auto t = pricing::price_terminal(100.0, 112.0, barriers(0.06, 0.05), costs);
    EXPECT_NEAR(t.capped_delta, 6.0, 1e-12);
    EXPECT_EQ(t.exit_reason, exit_reason::TAKE_PROFIT);
}

TEST(TerminalPricerTest, StopLossCapsDownside) {
    ExecutionCosts costs;
    auto t = pricing::price_terminal(100.0, 91.0, barriers(std::nullopt, 0.05), costs);
    EXPECT_DOUBLE_EQ(t.raw_delta, -9.0);
    EXPECT_NEAR(t.capped_delta, -5.0, 1e-12);
    EXPECT_EQ(t.exit_reason, exit_reason::STOP);
}

TEST(TerminalPricerTest, MoveInsideBarriersIsUntouched) {
    ExecutionCosts costs;
    auto t = pricing::price_terminal(100.0, 98.0, barriers(0.06, 0.05), costs);
    EXPECT_DOUBLE_EQ(t.capped_delta, -2.0);
    EXPECT_EQ(t.exit_reason, exit_reason::HORIZON);
}

TEST(TerminalPricerTest, MoveExactlyAtBarrierIsCapped) {
    ExecutionCosts costs;
    auto t = pricing::price_terminal(200.0, 150.0, barriers(std::nullopt, 0.25), costs);
    EXPECT_EQ(t.exit_reason, exit_reason::STOP);
    EXPECT_DOUBLE_EQ(t.capped_delta, -50.0);
}

TEST(TerminalPricerTest, NetIsCappedDeltaMinusCost) {
    ExecutionCosts costs;
    auto t = pricing::price_terminal(100.0, 112.0, barriers(0.06, std::nullopt), costs);
    EXPECT_NEAR(t.cost, 100.0 * 0.00015 + 40.0, 1e-12);
    EXPECT_NEAR(t.net_pnl, 6.0 - t.cost, 1e-9);
}

TEST(TerminalPricerTest, PricingIsDeterministic) {
    ExecutionCosts costs;
    auto a = pricing::price_terminal(20000.0, 20013.5, barriers(0.0005, 0.0004), costs);
    auto b = pricing::price_terminal(20000.0, 20013.5, barriers(0.0005, 0.0004), costs);
    EXPECT_EQ(a.capped_delta, b.capped_delta);
    EXPECT_EQ(a.net_pnl, b.net_pnl);
}

// ===========================================================================
// 2. Path pricer
// ===========================================================================

TEST(PathPricerTest, FirstBarrierTouchedWins) {
    ExecutionCosts costs;
    // Touches -6 before +8: stopped even though the horizon close is a win.
    auto t = pricing::price_path(100.0, {99.0, 94.0, 108.0, 107.0}, barriers(0.05, 0.05), costs);
    EXPECT_EQ(t.exit_reason, exit_reason::STOP);
    EXPECT_NEAR(t.capped_delta, -5.0, 1e-12);
    EXPECT_EQ(t.bars_held, 2);
    EXPECT_DOUBLE_EQ(t.exit_price, 94.0);
    EXPECT_DOUBLE_EQ(t.raw_delta, 7.0);
}

TEST(PathPricerTest, NoTouchMatchesTerminal) {
    ExecutionCosts costs;
    auto b = barriers(0.05, 0.05);
    auto path = pricing::price_path(100.0, {101.0, 99.0, 102.0}, b, costs);
    auto term = pricing::price_terminal(100.0, 102.0, b, costs);
    EXPECT_EQ(path.exit_reason, exit_reason::HORIZON);
    EXPECT_DOUBLE_EQ(path.capped_delta, term.capped_delta);
    EXPECT_DOUBLE_EQ(path.net_pnl, term.net_pnl);
    EXPECT_EQ(path.bars_held, 3);
}

TEST(PathPricerTest, MissingBarsAreSkipped) {
    ExecutionCosts costs;
    auto t = pricing::price_path(100.0, {std::nan(""), 106.0}, barriers(0.05, std::nullopt), costs);
    EXPECT_EQ(t.exit_reason, exit_reason::TAKE_PROFIT);
    EXPECT_EQ(t.bars_held, 2);
}

TEST(PathPricerTest, EmptyPathThrows) {
    EXPECT_THROW(pricing::price_path(100.0, {}, BarrierConfig{}, ExecutionCosts{}),
                 std::invalid_argument);
}

// ===========================================================================
// 3. OutcomePricer over a dataset
// ===========================================================================

TEST(OutcomePricerTest, TerminalModeReadsForwardColumn) {
    auto data = make_path_dataset();
    OutcomePricer pricer(PricingMode::TERMINAL);
    auto t = pricer.price(data, 0, 3, barriers(std::nullopt, 0.04));
    EXPECT_EQ(t.row_index, 0u);
    EXPECT_EQ(t.entry_ts, data.timestamp(0));
    EXPECT_EQ(t.horizon_min, 3);
    EXPECT_DOUBLE_EQ(t.capped_delta, 3.0);   // the dip to 95 is invisible
    EXPECT_EQ(t.exit_reason, exit_reason::HORIZON);
}

TEST(OutcomePricerTest, PathModeSeesIntermediateBars) {
    auto data = make_path_dataset();
    OutcomePricer pricer(PricingMode::PATH);

    auto stop = pricer.price(data, 0, 3, barriers(std::nullopt, 0.04));
    EXPECT_EQ(stop.exit_reason, exit_reason::STOP);
    EXPECT_NEAR(stop.capped_delta, -4.0, 1e-12);
    EXPECT_EQ(stop.bars_held, 2);

    auto tp = pricer.price(data, 0, 3, barriers(0.03, 0.04));
    EXPECT_EQ(tp.exit_reason, exit_reason::TAKE_PROFIT);
    EXPECT_NEAR(tp.capped_delta, 3.0, 1e-12);
    EXPECT_EQ(tp.bars_held, 1);
}

TEST(OutcomePricerTest, PathModeWithoutBarriersEqualsTerminal) {
    auto data = make_path_dataset();
    auto path = OutcomePricer(PricingMode::PATH).price(data, 1, 3, BarrierConfig{});
    auto term = OutcomePricer(PricingMode::TERMINAL).price(data, 1, 3, BarrierConfig{});
    EXPECT_DOUBLE_EQ(path.net_pnl, term.net_pnl);
    EXPECT_DOUBLE_EQ(path.capped_delta, -3.0);
}

// ===========================================================================
// 4. Configuration
// ===========================================================================

TEST(BarrierConfigTest, NonPositiveFractionThrows) {
    EXPECT_THROW(barriers(0.0, std::nullopt).validate(), ConfigurationError);
    EXPECT_THROW(barriers(std::nullopt, -0.01).validate(), ConfigurationError);
    EXPECT_NO_THROW(barriers(0.01, 0.02).validate());
    EXPECT_NO_THROW(BarrierConfig{}.validate());
}

TEST(PricingModeTest, ParseRoundTrip) {
    EXPECT_EQ(parse_pricing_mode("terminal"), PricingMode::TERMINAL);
    EXPECT_EQ(parse_pricing_mode("path"), PricingMode::PATH);
    EXPECT_EQ(pricing_mode_str(PricingMode::PATH), "path");
    EXPECT_THROW(parse_pricing_mode("bar"), ConfigurationError);
}
