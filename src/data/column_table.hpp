#pragma once

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ColumnTable — timestamp column plus named double columns.
// A missing cell is stored as NaN.
// ---------------------------------------------------------------------------
struct ColumnTable {
    std::vector<int64_t> timestamps;
    std::vector<std::string> column_names;
    std::vector<std::vector<double>> columns;

    size_t num_rows() const { return timestamps.size(); }
    size_t num_columns() const { return columns.size(); }

    int column_index(const std::string& name) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }

    bool has_column(const std::string& name) const {
        return column_index(name) >= 0;
    }

    const std::vector<double>& column(const std::string& name) const {
        int idx = column_index(name);
        if (idx < 0) throw SchemaError("Missing column: " + name);
        return columns[idx];
    }

    void add_column(const std::string& name, std::vector<double> values) {
        if (values.size() != timestamps.size()) {
            throw std::invalid_argument("Column '" + name + "' has " +
                                        std::to_string(values.size()) + " values, table has " +
                                        std::to_string(timestamps.size()) + " rows");
        }
        int idx = column_index(name);
        if (idx >= 0) {
            columns[idx] = std::move(values);
        } else {
            column_names.push_back(name);
            columns.push_back(std::move(values));
        }
    }

    bool is_sorted() const {
        return std::is_sorted(timestamps.begin(), timestamps.end());
    }

    // Stable sort of every column by timestamp.
    void sort_by_timestamp() {
        if (is_sorted()) return;
        std::vector<size_t> order(timestamps.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return timestamps[a] < timestamps[b];
        });

        std::vector<int64_t> ts(order.size());
        for (size_t i = 0; i < order.size(); ++i) ts[i] = timestamps[order[i]];
        timestamps = std::move(ts);

        for (auto& col : columns) {
            std::vector<double> sorted(order.size());
            for (size_t i = 0; i < order.size(); ++i) sorted[i] = col[order[i]];
            col = std::move(sorted);
        }
    }
};
