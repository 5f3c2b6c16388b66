#pragma once

#include "analysis/calibration.hpp"
#include "backtest/outcome_pricer.hpp"
#include "backtest/threshold_sweep.hpp"
#include "data/dataset_io.hpp"
#include "time_utils.hpp"
#include "walkforward/walk_forward_runner.hpp"

#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace report_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

// JSON has no NaN; emit null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    return dataset_io::format_double(v);
}

inline std::string optional_str(const std::optional<double>& v) {
    return v ? dataset_io::format_double(*v) : "";
}

inline std::ofstream open_output(const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot open output file: " + path);
    return out;
}

inline void finish_output(std::ofstream& out, const std::string& path) {
    out.flush();
    if (!out) throw std::runtime_error("Failed writing: " + path);
}

// ---------------------------------------------------------------------------
// CSV artifacts
// ---------------------------------------------------------------------------
inline void write_fold_metrics_csv(const std::string& path, const WalkForwardReport& report) {
    auto out = open_output(path);
    out << "fold_id,test_start,test_end,n_train,n_test,n_train_dropped,n_test_dropped,"
           "scale_pos_weight,eval_metric,rounds_trained,best_iteration,iterations_used,"
           "early_stopped,auc,accuracy,precision,recall,tp,fp,tn,fn\n";
    for (const auto& m : report.fold_metrics) {
        int64_t test_start = 0, test_end = 0;
        for (const auto& f : report.folds) {
            if (f.fold_id == m.fold_id) {
                test_start = f.test_start;
                test_end = f.test_end;
                break;
            }
        }
        out << m.fold_id << ","
            << time_utils::format_iso8601(test_start) << ","
            << time_utils::format_iso8601(test_end) << ","
            << m.n_train << "," << m.n_test << ","
            << m.n_train_dropped << "," << m.n_test_dropped << ","
            << dataset_io::format_double(m.scale_pos_weight) << ","
            << m.eval_metric << ","
            << m.rounds_trained << "," << m.best_iteration << "," << m.iterations_used << ","
            << (m.early_stopped ? 1 : 0) << ","
            << dataset_io::format_double(m.metrics.auc) << ","
            << dataset_io::format_double(m.metrics.accuracy) << ","
            << dataset_io::format_double(m.metrics.precision) << ","
            << dataset_io::format_double(m.metrics.recall) << ","
            << m.metrics.true_positives << "," << m.metrics.false_positives << ","
            << m.metrics.true_negatives << "," << m.metrics.false_negatives << "\n";
    }
    finish_output(out, path);
}

inline void write_importance_csv(const std::string& path,
                                 const std::vector<FeatureImportance>& importances) {
    auto out = open_output(path);
    out << "fold_id,feature,importance\n";
    for (const auto& fi : importances) {
        out << fi.fold_id << "," << fi.feature << ","
            << dataset_io::format_double(fi.importance) << "\n";
    }
    finish_output(out, path);
}

// Absent SL/TP options are written as empty cells.
inline void write_sweep_csv(const std::string& path, const std::vector<ThresholdResult>& rows) {
    auto out = open_output(path);
    out << "cost_profile,horizon_min,threshold,sl_frac,tp_frac,trades,wins,precision,"
           "trades_per_day,avg_pnl,total_pnl\n";
    for (const auto& r : rows) {
        out << r.cost_profile << "," << r.horizon_min << ","
            << dataset_io::format_double(r.threshold) << ","
            << optional_str(r.sl_fraction) << "," << optional_str(r.tp_fraction) << ","
            << r.trades << "," << r.wins << ","
            << dataset_io::format_double(r.precision) << ","
            << dataset_io::format_double(r.trades_per_day) << ","
            << dataset_io::format_double(r.avg_pnl) << ","
            << dataset_io::format_double(r.total_pnl) << "\n";
    }
    finish_output(out, path);
}

// thresholds_analysis.csv: label precision and forward returns per cutoff.
inline void write_label_analysis_csv(const std::string& path,
                                     const std::vector<LabelThresholdResult>& rows,
                                     const std::vector<int>& horizons_min) {
    auto out = open_output(path);
    out << "cost_profile,threshold,trades,label_wins,label_precision";
    for (int h : horizons_min) out << ",avg_ret_" << h << "m";
    out << ",trades_per_day,exp_pnl_per_trade\n";
    for (const auto& r : rows) {
        out << r.cost_profile << ","
            << dataset_io::format_double(r.threshold) << ","
            << r.trades << "," << r.label_wins << ","
            << dataset_io::format_double(r.label_precision);
        for (int h : horizons_min) {
            auto it = r.avg_forward_return.find(h);
            out << "," << (it == r.avg_forward_return.end() ? ""
                                                              : dataset_io::format_double(it->second));
        }
        out << "," << dataset_io::format_double(r.trades_per_day) << ","
            << dataset_io::format_double(r.expected_pnl_per_trade) << "\n";
    }
    finish_output(out, path);
}

// Empty bins leave mean_pred, empirical_prob and returns blank.
inline void write_calibration_csv(const std::string& path,
                                  const std::vector<CalibrationBin>& bins,
                                  const std::vector<int>& horizons_min) {
    auto out = open_output(path);
    out << "bin_lower,bin_upper,count,mean_pred,empirical_prob";
    for (int h : horizons_min) out << ",avg_ret_" << h << "m";
    out << "\n";
    for (const auto& b : bins) {
        out << dataset_io::format_double(b.lower) << ","
            << dataset_io::format_double(b.upper) << ","
            << b.count << ","
            << dataset_io::format_double(b.mean_pred) << ","
            << dataset_io::format_double(b.empirical_prob);
        for (int h : horizons_min) {
            auto it = b.avg_forward_return.find(h);
            out << "," << (it == b.avg_forward_return.end()
                               ? std::string()
                               : dataset_io::format_double(it->second));
        }
        out << "\n";
    }
    finish_output(out, path);
}

// ---------------------------------------------------------------------------
// JSON summaries
// ---------------------------------------------------------------------------

// Walk-forward run: fold counts, skip list with reasons, per-fold metrics.
inline std::string to_json(const WalkForwardReport& report, const WalkForwardConfig& cfg) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"train_window_months\":" << cfg.train_window_months;
    ss << ",\"test_window_months\":" << cfg.test_window_months;
    ss << ",\"step_months\":" << cfg.step_months;
    ss << ",\"folds_built\":" << report.folds_built();
    ss << ",\"folds_trained\":" << report.folds_trained();
    ss << ",\"folds_skipped\":" << report.folds_skipped();
    ss << ",\"complete\":" << (report.complete() ? "true" : "false");
    ss << ",\"predictions\":" << report.predictions.size();

    ss << ",\"skips\":[";
    for (size_t i = 0; i < report.skips.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& s = report.skips[i];
        ss << "{";
        ss << "\"fold_id\":" << s.fold_id;
        ss << ",\"reason\":\"" << json_escape(s.reason) << "\"";
        ss << ",\"message\":\"" << json_escape(s.message) << "\"";
        ss << "}";
    }
    ss << "]";

    ss << ",\"folds\":[";
    for (size_t i = 0; i < report.fold_metrics.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& m = report.fold_metrics[i];
        ss << "{";
        ss << "\"fold_id\":" << m.fold_id;
        ss << ",\"n_train\":" << m.n_train;
        ss << ",\"n_test\":" << m.n_test;
        ss << ",\"eval_metric\":\"" << json_escape(m.eval_metric) << "\"";
        ss << ",\"iterations_used\":" << m.iterations_used;
        ss << ",\"early_stopped\":" << (m.early_stopped ? "true" : "false");
        ss << ",\"auc\":" << json_number(m.metrics.auc);
        ss << ",\"accuracy\":" << json_number(m.metrics.accuracy);
        ss << ",\"precision\":" << json_number(m.metrics.precision);
        ss << ",\"recall\":" << json_number(m.metrics.recall);
        ss << "}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

// Sweep run: configuration echo and join statistics.
inline std::string to_json(const SweepReport& report, const SweepConfig& cfg,
                           const JoinResult& join) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"pricing_mode\":\"" << pricing_mode_str(cfg.mode) << "\"";
    ss << ",\"slippage_fraction\":" << json_number(cfg.slippage_fraction);
    ss << ",\"lot_multiplier\":" << json_number(cfg.lot_multiplier);
    ss << ",\"predictions_joined\":" << join.rows.size();
    ss << ",\"matched_by_index\":" << join.matched_by_index;
    ss << ",\"matched_by_time\":" << join.matched_by_time;
    ss << ",\"unmatched\":" << join.unmatched;
    ss << ",\"calendar_days\":" << report.calendar_days;
    ss << ",\"rows\":" << report.results.size();

    ss << ",\"cost_profiles\":[";
    for (size_t i = 0; i < cfg.cost_profiles.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"name\":\"" << json_escape(cfg.cost_profiles[i].name) << "\""
           << ",\"commission\":" << json_number(cfg.cost_profiles[i].commission) << "}";
    }
    ss << "]";

    ss << ",\"unpriceable\":{";
    bool first = true;
    for (const auto& [h, n] : report.unpriceable) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << h << "\":" << n;
    }
    ss << "}";

    ss << "}";
    return ss.str();
}

inline void write_text(const std::string& path, const std::string& text) {
    auto out = open_output(path);
    out << text << "\n";
    finish_output(out, path);
}

}  // namespace report_io
