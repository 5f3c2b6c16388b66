#pragma once

#include "data/column_table.hpp"
#include "errors.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DatasetSchema — the single canonical column layout of the input dataset.
// Empty fields are not required (e.g. a pricing-only run leaves
// feature_columns empty).
// ---------------------------------------------------------------------------
struct DatasetSchema {
    std::string timestamp_column = "timestamp";
    std::string label_column = "target_dir_1m";
    std::string spot_column = "nifty_close";
    std::vector<int> horizons_min = {1, 3};
    std::vector<std::string> feature_columns;

    static std::string forward_close_column(int horizon_min) {
        return "future_close_" + std::to_string(horizon_min) + "m";
    }

    static std::string forward_return_column(int horizon_min) {
        return "future_ret_" + std::to_string(horizon_min) + "m";
    }

    // Every data column (timestamp excluded) a bound dataset needs.
    std::vector<std::string> required_columns() const {
        std::vector<std::string> cols;
        if (!label_column.empty()) cols.push_back(label_column);
        if (!spot_column.empty()) cols.push_back(spot_column);
        for (int h : horizons_min) cols.push_back(forward_close_column(h));
        cols.insert(cols.end(), feature_columns.begin(), feature_columns.end());
        return cols;
    }
};

// ---------------------------------------------------------------------------
// TimeSeriesRow — one sampled instant, materialized for inspection
// ---------------------------------------------------------------------------
struct TimeSeriesRow {
    int64_t timestamp = 0;
    std::vector<double> features;
    double label = std::nan("");
    double spot_close = std::nan("");
    std::map<int, double> forward_close;
};

// ---------------------------------------------------------------------------
// TimeSeriesDataset — a ColumnTable bound to a DatasetSchema.
//
// Construction validates the schema (SchemaError listing every missing
// column), checks the label is binary, and sorts rows by timestamp. The
// dataset is immutable afterwards; all access is const.
// ---------------------------------------------------------------------------
class TimeSeriesDataset {
public:
    TimeSeriesDataset(ColumnTable table, DatasetSchema schema)
        : table_(std::move(table)), schema_(std::move(schema)) {
        std::vector<std::string> missing;
        for (const auto& name : schema_.required_columns()) {
            if (!table_.has_column(name)) missing.push_back(name);
        }
        if (!missing.empty()) {
            std::string msg = "Dataset is missing required columns:";
            for (const auto& m : missing) msg += " " + m;
            throw SchemaError(msg);
        }

        table_.sort_by_timestamp();

        for (const auto& name : schema_.feature_columns) {
            feature_idx_.push_back(static_cast<size_t>(table_.column_index(name)));
        }
        if (!schema_.label_column.empty()) {
            label_idx_ = table_.column_index(schema_.label_column);
            const auto& labels = table_.columns[label_idx_];
            for (size_t i = 0; i < labels.size(); ++i) {
                double v = labels[i];
                if (std::isfinite(v) && v != 0.0 && v != 1.0) {
                    throw SchemaError("Label column '" + schema_.label_column +
                                      "' is not binary at row " + std::to_string(i) +
                                      " (value " + std::to_string(v) + ")");
                }
            }
        }
        if (!schema_.spot_column.empty()) {
            spot_idx_ = table_.column_index(schema_.spot_column);
        }
        for (int h : schema_.horizons_min) {
            forward_idx_[h] = table_.column_index(DatasetSchema::forward_close_column(h));
        }
    }

    size_t size() const { return table_.num_rows(); }
    bool empty() const { return table_.num_rows() == 0; }

    const DatasetSchema& schema() const { return schema_; }
    const ColumnTable& table() const { return table_; }
    const std::vector<int64_t>& timestamps() const { return table_.timestamps; }
    int64_t timestamp(size_t row) const { return table_.timestamps[row]; }

    const std::vector<std::string>& feature_names() const { return schema_.feature_columns; }
    size_t num_features() const { return feature_idx_.size(); }

    double feature(size_t row, size_t f) const {
        return table_.columns[feature_idx_[f]][row];
    }

    bool has_label() const { return label_idx_ >= 0; }
    bool has_spot() const { return spot_idx_ >= 0; }
    bool has_horizon(int h) const { return forward_idx_.count(h) > 0; }

    double label(size_t row) const {
        if (label_idx_ < 0) throw SchemaError("Dataset has no label column bound");
        return table_.columns[label_idx_][row];
    }

    double spot_close(size_t row) const {
        if (spot_idx_ < 0) throw SchemaError("Dataset has no spot column bound");
        return table_.columns[spot_idx_][row];
    }

    double forward_close(size_t row, int horizon_min) const {
        auto it = forward_idx_.find(horizon_min);
        if (it == forward_idx_.end()) {
            throw SchemaError("Dataset has no column " +
                              DatasetSchema::forward_close_column(horizon_min));
        }
        return table_.columns[it->second][row];
    }

    // Row validity for training/testing: label and every feature present.
    bool is_trainable(size_t row) const {
        if (!std::isfinite(label(row))) return false;
        for (size_t f = 0; f < feature_idx_.size(); ++f) {
            if (!std::isfinite(feature(row, f))) return false;
        }
        return true;
    }

    // Row validity for pricing at a horizon: entry and forward prices present.
    bool is_priceable(size_t row, int horizon_min) const {
        double entry = spot_close(row);
        double fwd = forward_close(row, horizon_min);
        return std::isfinite(entry) && entry > 0.0 && std::isfinite(fwd);
    }

    TimeSeriesRow row(size_t i) const {
        TimeSeriesRow r;
        r.timestamp = timestamp(i);
        r.features.reserve(feature_idx_.size());
        for (size_t f = 0; f < feature_idx_.size(); ++f) r.features.push_back(feature(i, f));
        if (has_label()) r.label = label(i);
        if (has_spot()) r.spot_close = spot_close(i);
        for (const auto& [h, idx] : forward_idx_) r.forward_close[h] = table_.columns[idx][i];
        return r;
    }

private:
    ColumnTable table_;
    DatasetSchema schema_;
    std::vector<size_t> feature_idx_;
    int label_idx_ = -1;
    int spot_idx_ = -1;
    std::map<int, int> forward_idx_;
};
