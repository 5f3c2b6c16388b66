// forward_targets_test.cpp — Tests for the forward-close / label builder

#include <gtest/gtest.h>

#include "data/column_table.hpp"
#include "data/forward_targets.hpp"
#include "errors.hpp"
#include "time_utils.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <vector>

namespace {

ColumnTable closes(const std::vector<double>& c) {
    ColumnTable t;
    t.timestamps = test_helpers::minute_timestamps(time_utils::make_timestamp(2024, 1, 2, 9, 15),
                                                   c.size());
    t.add_column("nifty_close", c);
    return t;
}

}  // namespace

// ===========================================================================
// 1. Columns and values
// ===========================================================================

TEST(ForwardTargetsTest, AddsFiveColumnsPerHorizon) {
    ColumnTable t = closes({100, 101, 102, 103, 104});
    auto summary = add_forward_targets(t, ForwardTargetConfig{});
    EXPECT_EQ(summary.columns_added.size(), 10u);
    for (const char* name : {"future_close_1m", "future_ret_1m", "target_dir_1m",
                             "target_up_1m", "target_down_1m", "future_close_3m",
                             "future_ret_3m", "target_dir_3m", "target_up_3m",
                             "target_down_3m"}) {
        EXPECT_TRUE(t.has_column(name)) << name;
    }
}

TEST(ForwardTargetsTest, ForwardCloseIsRowShift) {
    ColumnTable t = closes({100, 101, 99, 103, 104});
    add_forward_targets(t, ForwardTargetConfig{});
    const auto& f1 = t.column("future_close_1m");
    const auto& f3 = t.column("future_close_3m");
    EXPECT_DOUBLE_EQ(f1[0], 101.0);
    EXPECT_DOUBLE_EQ(f1[2], 103.0);
    EXPECT_DOUBLE_EQ(f3[0], 103.0);
    EXPECT_DOUBLE_EQ(f3[1], 104.0);
}

TEST(ForwardTargetsTest, TailRowsAreNaN) {
    ColumnTable t = closes({100, 101, 102, 103, 104});
    auto summary = add_forward_targets(t, ForwardTargetConfig{});
    EXPECT_TRUE(std::isnan(t.column("future_close_1m")[4]));
    EXPECT_TRUE(std::isnan(t.column("target_dir_1m")[4]));
    for (size_t i = 2; i < 5; ++i) {
        EXPECT_TRUE(std::isnan(t.column("future_close_3m")[i])) << i;
        EXPECT_TRUE(std::isnan(t.column("target_up_3m")[i])) << i;
    }
    EXPECT_EQ(summary.tail_rows_without_forward, 3u);
}

TEST(ForwardTargetsTest, LabelsFollowReturnThresholds) {
    ForwardTargetConfig cfg;
    cfg.horizons_min = {1};
    cfg.up_threshold = 0.01;
    cfg.down_threshold = 0.01;
    // returns: +0.5%, +2%, -3%, 0
    ColumnTable t = closes({100.0, 100.5, 102.51, 99.4347, 99.4347});
    add_forward_targets(t, cfg);
    const auto& dir = t.column("target_dir_1m");
    const auto& up = t.column("target_up_1m");
    const auto& down = t.column("target_down_1m");
    EXPECT_DOUBLE_EQ(dir[0], 1.0);
    EXPECT_DOUBLE_EQ(up[0], 0.0);
    EXPECT_DOUBLE_EQ(up[1], 1.0);
    EXPECT_DOUBLE_EQ(dir[2], 0.0);
    EXPECT_DOUBLE_EQ(down[2], 1.0);
    EXPECT_DOUBLE_EQ(dir[3], 0.0);   // flat is not up
    EXPECT_DOUBLE_EQ(down[3], 0.0);
}

TEST(ForwardTargetsTest, ThreeMinuteUpLabelUsesItsOwnThreshold) {
    // +0.03% over both one and three minutes: above 0.02%, below 0.05%.
    ColumnTable t = closes({100.0, 100.03, 100.03, 100.03, 100.03});
    ForwardTargetConfig cfg;
    add_forward_targets(t, cfg);
    EXPECT_DOUBLE_EQ(cfg.up_threshold_for(1), 0.0002);
    EXPECT_DOUBLE_EQ(cfg.up_threshold_for(3), 0.0005);
    EXPECT_DOUBLE_EQ(t.column("target_up_1m")[0], 1.0);
    EXPECT_DOUBLE_EQ(t.column("target_up_3m")[0], 0.0);
}

TEST(ForwardTargetsTest, HorizonOverridesCanBeCleared) {
    ColumnTable t = closes({100.0, 100.03, 100.03, 100.03, 100.03});
    ForwardTargetConfig cfg;
    cfg.up_threshold_by_horizon.clear();
    add_forward_targets(t, cfg);
    EXPECT_DOUBLE_EQ(t.column("target_up_3m")[0], 1.0);
}

TEST(ForwardTargetsTest, PositivesCountedPerLabel) {
    ForwardTargetConfig cfg;
    cfg.horizons_min = {1};
    ColumnTable t = closes({100, 101, 100, 101, 100});
    auto summary = add_forward_targets(t, cfg);
    ASSERT_EQ(summary.positives.size(), 3u);
    EXPECT_EQ(summary.positives[0].first, "target_dir_1m");
    EXPECT_EQ(summary.positives[0].second, 2u);
}

TEST(ForwardTargetsTest, UnsortedInputIsSortedFirst) {
    ColumnTable t = closes({100, 101, 102});
    std::swap(t.timestamps[0], t.timestamps[2]);   // 102 is now first
    ForwardTargetConfig cfg;
    cfg.horizons_min = {1};
    add_forward_targets(t, cfg);
    EXPECT_TRUE(t.is_sorted());
    EXPECT_DOUBLE_EQ(t.column("nifty_close")[0], 102.0);
    EXPECT_DOUBLE_EQ(t.column("future_close_1m")[0], 101.0);
}

// ===========================================================================
// 2. Errors
// ===========================================================================

TEST(ForwardTargetsTest, NonPositiveHorizonThrows) {
    ColumnTable t = closes({100, 101});
    ForwardTargetConfig cfg;
    cfg.horizons_min = {0};
    EXPECT_THROW(add_forward_targets(t, cfg), ConfigurationError);
}

TEST(ForwardTargetsTest, NegativeThresholdThrows) {
    ColumnTable t = closes({100, 101});
    ForwardTargetConfig cfg;
    cfg.up_threshold = -0.1;
    EXPECT_THROW(add_forward_targets(t, cfg), ConfigurationError);
}

TEST(ForwardTargetsTest, NegativeHorizonThresholdThrows) {
    ColumnTable t = closes({100, 101});
    ForwardTargetConfig cfg;
    cfg.up_threshold_by_horizon[1] = -0.001;
    EXPECT_THROW(add_forward_targets(t, cfg), ConfigurationError);
}

TEST(ForwardTargetsTest, MissingSpotColumnThrowsSchemaError) {
    ColumnTable t = closes({100, 101});
    ForwardTargetConfig cfg;
    cfg.spot_column = "close";
    EXPECT_THROW(add_forward_targets(t, cfg), SchemaError);
}
