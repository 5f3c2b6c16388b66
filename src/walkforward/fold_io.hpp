#pragma once

#include "data/dataset_io.hpp"
#include "errors.hpp"
#include "time_utils.hpp"
#include "walkforward/fold_builder.hpp"

#include <fstream>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Fold table artifact
//
//   fold_id,train_start,train_end,test_start,test_end,
//   train_idx_begin,train_idx_end,test_idx_begin,test_idx_end
//
// Timestamps are ISO-8601, index bounds are half-open. A reader accepts a
// table carrying either representation; integer bounds win when present.
// ---------------------------------------------------------------------------
namespace fold_io {

inline void write_folds_csv(const std::string& path, const std::vector<Fold>& folds) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot open output file: " + path);

    out << "fold_id,train_start,train_end,test_start,test_end,"
        << "train_idx_begin,train_idx_end,test_idx_begin,test_idx_end\n";
    for (const auto& f : folds) {
        out << f.fold_id
            << "," << time_utils::format_iso8601(f.train_start)
            << "," << time_utils::format_iso8601(f.train_end)
            << "," << time_utils::format_iso8601(f.test_start)
            << "," << time_utils::format_iso8601(f.test_end)
            << "," << f.train_rows.begin << "," << f.train_rows.end
            << "," << f.test_rows.begin << "," << f.test_rows.end
            << "\n";
    }
    if (!out) throw std::runtime_error("Failed writing: " + path);
}

namespace detail {

inline size_t parse_index(const std::string& cell, const std::string& what) {
    std::string s = dataset_io::trim(cell);
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::exception&) {
        throw SchemaError("Fold table: bad integer in " + what + ": '" + cell + "'");
    }
    if (used != s.size() || v < 0) {
        throw SchemaError("Fold table: bad integer in " + what + ": '" + cell + "'");
    }
    return static_cast<size_t>(v);
}

}  // namespace detail

// Read a fold table. `timestamps` is the sorted timestamp column of the
// dataset the folds refer to; it is used only for rows without index bounds.
inline std::vector<Fold> read_folds_csv(const std::string& path,
                                        const std::vector<int64_t>& timestamps) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot open fold table: " + path);

    std::string line;
    if (!std::getline(in, line)) throw SchemaError("Empty fold table: " + path);
    auto header = dataset_io::split_csv_line(line);
    std::map<std::string, size_t> col;
    for (size_t i = 0; i < header.size(); ++i) col[dataset_io::trim(header[i])] = i;

    if (!col.count("fold_id")) throw SchemaError("Fold table missing column: fold_id");

    const char* idx_cols[] = {"train_idx_begin", "train_idx_end", "test_idx_begin", "test_idx_end"};
    const char* ts_cols[] = {"train_start", "train_end", "test_start", "test_end"};
    bool has_idx = true, has_ts = true;
    for (const char* c : idx_cols) has_idx = has_idx && col.count(c);
    for (const char* c : ts_cols) has_ts = has_ts && col.count(c);
    if (!has_idx && !has_ts) {
        throw SchemaError("Fold table " + path +
                          " carries neither index bounds nor timestamp bounds");
    }

    std::vector<Fold> folds;
    while (std::getline(in, line)) {
        if (dataset_io::trim(line).empty()) continue;
        auto cells = dataset_io::split_csv_line(line);
        if (cells.size() != header.size()) {
            throw SchemaError("Fold table row has " + std::to_string(cells.size()) +
                              " fields, header has " + std::to_string(header.size()));
        }
        auto cell = [&](const char* name) { return dataset_io::trim(cells[col.at(name)]); };

        Fold f;
        f.fold_id = static_cast<int>(detail::parse_index(cell("fold_id"), "fold_id"));

        if (has_ts) {
            f.train_start = time_utils::parse_iso8601(cell("train_start"));
            f.train_end = time_utils::parse_iso8601(cell("train_end"));
            f.test_start = time_utils::parse_iso8601(cell("test_start"));
            f.test_end = time_utils::parse_iso8601(cell("test_end"));
        }

        bool row_has_idx = has_idx;
        if (row_has_idx) {
            for (const char* c : idx_cols) row_has_idx = row_has_idx && !cell(c).empty();
        }

        if (row_has_idx) {
            f.train_rows.begin = detail::parse_index(cell("train_idx_begin"), "train_idx_begin");
            f.train_rows.end = detail::parse_index(cell("train_idx_end"), "train_idx_end");
            f.test_rows.begin = detail::parse_index(cell("test_idx_begin"), "test_idx_begin");
            f.test_rows.end = detail::parse_index(cell("test_idx_end"), "test_idx_end");
            if (f.train_rows.end > timestamps.size() || f.test_rows.end > timestamps.size()) {
                throw SchemaError("Fold " + std::to_string(f.fold_id) +
                                  " index bounds exceed dataset size " +
                                  std::to_string(timestamps.size()));
            }
            if (!has_ts) {
                // Index-only table: recover calendar bounds from the rows themselves.
                if (!f.train_rows.empty()) {
                    f.train_start = timestamps[f.train_rows.begin];
                    f.train_end = timestamps[f.train_rows.end - 1];
                }
                if (!f.test_rows.empty()) {
                    f.test_start = timestamps[f.test_rows.begin];
                    f.test_end = timestamps[f.test_rows.end - 1];
                }
            }
        } else if (has_ts) {
            fold_util::resolve_fold(f, timestamps);
        } else {
            throw SchemaError("Fold " + std::to_string(f.fold_id) +
                              " has empty index bounds and no timestamp bounds");
        }
        folds.push_back(f);
    }
    return folds;
}

}  // namespace fold_io
