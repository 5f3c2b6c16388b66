// report_io_test.cpp — Tests for prediction files, CSV artifacts and JSON summaries

#include <gtest/gtest.h>

#include "backtest/trade_selector.hpp"
#include "errors.hpp"
#include "report/prediction_io.hpp"
#include "report/report_io.hpp"

#include "test_helpers.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using time_utils::make_timestamp;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::vector<FoldPrediction> sample_predictions() {
    int64_t t0 = make_timestamp(2024, 1, 2, 9, 15);
    return {
        {0, 10, t0, 1, 0.73125},
        {0, 11, t0 + time_utils::NS_PER_MINUTE, 0, 0.1},
        {1, NO_ROW, t0 + 2 * time_utils::NS_PER_MINUTE, 1, 0.5},
    };
}

}  // namespace

// ===========================================================================
// Fixture
// ===========================================================================
class ReportIoTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& p : paths) std::remove(p.c_str());
    }

    std::string temp(const std::string& name) {
        paths.push_back(test_helpers::temp_path(name));
        return paths.back();
    }

    std::vector<std::string> paths;
};

// ===========================================================================
// 1. Prediction files
// ===========================================================================

TEST_F(ReportIoTest, PredictionCsvReadsBack) {
    std::string path = temp("preds.csv");
    auto preds = sample_predictions();
    prediction_io::write_predictions(path, preds);

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "timestamp,fold_id,row_index,y_true,y_pred");

    auto back = prediction_io::read_predictions(path);
    ASSERT_EQ(back.size(), preds.size());
    for (size_t i = 0; i < preds.size(); ++i) {
        EXPECT_EQ(back[i].timestamp, preds[i].timestamp) << i;
        EXPECT_EQ(back[i].fold_id, preds[i].fold_id) << i;
        EXPECT_EQ(back[i].row_index, preds[i].row_index) << i;
        EXPECT_EQ(back[i].y_true, preds[i].y_true) << i;
        EXPECT_DOUBLE_EQ(back[i].y_pred, preds[i].y_pred) << i;
    }
}

TEST_F(ReportIoTest, PredictionParquetReadsBack) {
    std::string path = temp("preds.parquet");
    auto preds = sample_predictions();
    prediction_io::write_predictions(path, preds);

    auto back = prediction_io::read_predictions(path);
    ASSERT_EQ(back.size(), preds.size());
    EXPECT_EQ(back[0].row_index, 10u);
    EXPECT_EQ(back[2].row_index, NO_ROW);
    EXPECT_EQ(back[2].fold_id, 1);
    EXPECT_EQ(back[1].timestamp, preds[1].timestamp);
    EXPECT_DOUBLE_EQ(back[0].y_pred, 0.73125);
}

TEST_F(ReportIoTest, PredictionFileWithoutRowIndexJoinsByTime) {
    std::string path = temp("preds_no_index.csv");
    {
        std::ofstream out(path);
        out << "timestamp,fold_id,y_true,y_pred\n"
            << "2024-01-02 09:15:00,0,1,0.8\n";
    }
    auto back = prediction_io::read_predictions(path);
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0].row_index, NO_ROW);
    EXPECT_EQ(back[0].timestamp, make_timestamp(2024, 1, 2, 9, 15));
}

TEST_F(ReportIoTest, PredictionFileMissingColumnThrows) {
    std::string path = temp("preds_bad.csv");
    {
        std::ofstream out(path);
        out << "timestamp,fold_id,y_true\n2024-01-02 09:15:00,0,1\n";
    }
    EXPECT_THROW(prediction_io::read_predictions(path), SchemaError);
}

TEST_F(ReportIoTest, PredictionFileIncompleteRowThrows) {
    std::string path = temp("preds_blank.csv");
    {
        std::ofstream out(path);
        out << "timestamp,fold_id,y_true,y_pred\n2024-01-02 09:15:00,0,1,\n";
    }
    EXPECT_THROW(prediction_io::read_predictions(path), SchemaError);
}

// ===========================================================================
// 2. Sweep and calibration CSV
// ===========================================================================

TEST_F(ReportIoTest, SweepCsvLeavesAbsentBarriersBlank) {
    std::string path = temp("sweep.csv");
    ThresholdResult a;
    a.cost_profile = "flat";
    a.horizon_min = 1;
    a.threshold = 0.5;
    a.trades = 4;
    a.wins = 1;
    a.precision = 0.25;
    ThresholdResult b = a;
    b.sl_fraction = 0.25;
    report_io::write_sweep_csv(path, {a, b});

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "cost_profile,horizon_min,threshold,sl_frac,tp_frac,trades,wins,precision,"
                        "trades_per_day,avg_pnl,total_pnl");
    EXPECT_EQ(lines[1].rfind("flat,1,0.5,,,4,1,0.25,", 0), 0u) << lines[1];
    EXPECT_EQ(lines[2].rfind("flat,1,0.5,0.25,,4,1,", 0), 0u) << lines[2];
}

TEST_F(ReportIoTest, ThresholdsAnalysisCsvHasReturnPerHorizon) {
    std::string path = temp("thresholds_analysis.csv");
    LabelThresholdResult a;
    a.cost_profile = "flat";
    a.threshold = 0.5;
    a.trades = 4;
    a.label_wins = 2;
    a.label_precision = 0.5;
    a.avg_forward_return = {{1, 0.25}, {3, std::nan("")}};
    a.trades_per_day = 2.0;
    a.expected_pnl_per_trade = 1.5;
    LabelThresholdResult empty;
    empty.cost_profile = "flat";
    empty.threshold = 0.9;
    report_io::write_label_analysis_csv(path, {a, empty}, {1, 3});

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "cost_profile,threshold,trades,label_wins,label_precision,"
                        "avg_ret_1m,avg_ret_3m,trades_per_day,exp_pnl_per_trade");
    EXPECT_EQ(lines[1], "flat,0.5,4,2,0.5,0.25,,2,1.5");
    EXPECT_EQ(lines[2], "flat,0.90000000000000002,0,0,0,,,0,");
}

TEST_F(ReportIoTest, CalibrationCsvHasColumnPerHorizon) {
    std::string path = temp("bins.csv");
    CalibrationAnalyzer analyzer;
    std::vector<JoinedPrediction> rows = {{0, 0, 0, 1, 0.25}};
    auto bins = analyzer.compute(rows);
    report_io::write_calibration_csv(path, bins, {1, 3});

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 11u);
    EXPECT_EQ(lines[0], "bin_lower,bin_upper,count,mean_pred,empirical_prob,avg_ret_1m,avg_ret_3m");
    EXPECT_EQ(lines[1], "0,0.5,1,0.25,1,,");
    EXPECT_EQ(lines[10], "0.75,1,0,,,,");
}

// ===========================================================================
// 3. Walk-forward artifacts
// ===========================================================================

namespace {

WalkForwardReport sample_report() {
    WalkForwardReport r;
    Fold f0;
    f0.fold_id = 0;
    f0.test_start = make_timestamp(2024, 1, 1);
    f0.test_end = make_timestamp(2024, 1, 31, 23, 59);
    Fold f1 = f0;
    f1.fold_id = 1;
    r.folds = {f0, f1};

    FoldMetrics m;
    m.fold_id = 0;
    m.n_train = 144;
    m.n_test = 12;
    m.eval_metric = "auc";
    m.iterations_used = 7;
    m.metrics.accuracy = 0.75;
    r.fold_metrics.push_back(m);
    r.skips.push_back({1, skip_reason::INSUFFICIENT_DATA, "Fold 1 has \"too few\" rows"});
    return r;
}

}  // namespace

TEST_F(ReportIoTest, FoldMetricsCsvHasRowPerTrainedFold) {
    std::string path = temp("fold_metrics.csv");
    report_io::write_fold_metrics_csv(path, sample_report());
    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].rfind("0,2024-01-01T00:00:00,", 0), 0u) << lines[1];
}

TEST_F(ReportIoTest, RunSummaryJsonListsSkips) {
    WalkForwardConfig cfg;
    std::string json = report_io::to_json(sample_report(), cfg);
    EXPECT_NE(json.find("\"folds_built\":2"), std::string::npos);
    EXPECT_NE(json.find("\"folds_skipped\":1"), std::string::npos);
    EXPECT_NE(json.find("\"complete\":false"), std::string::npos);
    EXPECT_NE(json.find("\"reason\":\"insufficient_data\""), std::string::npos);
    EXPECT_NE(json.find("\\\"too few\\\""), std::string::npos);
    EXPECT_NE(json.find("\"auc\":null"), std::string::npos);
}

TEST_F(ReportIoTest, SweepSummaryJsonEchoesJoinCounts) {
    SweepConfig cfg;
    SweepReport report;
    report.calendar_days = 5;
    report.unpriceable[1] = 2;
    JoinResult join;
    join.matched_by_index = 7;
    join.unmatched = 3;
    std::string json = report_io::to_json(report, cfg, join);
    EXPECT_NE(json.find("\"pricing_mode\":\"terminal\""), std::string::npos);
    EXPECT_NE(json.find("\"matched_by_index\":7"), std::string::npos);
    EXPECT_NE(json.find("\"unmatched\":3"), std::string::npos);
    EXPECT_NE(json.find("\"unpriceable\":{\"1\":2}"), std::string::npos);
    EXPECT_NE(json.find("\"name\":\"futures_like\""), std::string::npos);
}

TEST(JsonEscapeTest, EscapesQuotesAndControlCharacters) {
    EXPECT_EQ(report_io::json_escape("a\"b\\c\nd"), "a\\\"b\\\\c\\nd");
    EXPECT_EQ(report_io::json_number(std::nan("")), "null");
    EXPECT_EQ(report_io::json_number(1.5), "1.5");
}
