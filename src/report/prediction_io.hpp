#pragma once

#include "backtest/trade_selector.hpp"
#include "data/dataset_io.hpp"
#include "errors.hpp"
#include "model/fold_trainer.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Out-of-sample prediction artifact: timestamp, fold_id, row_index, y_true, y_pred.
namespace prediction_io {

inline void write_predictions_csv(const std::string& path,
                                  const std::vector<FoldPrediction>& preds) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot open output file: " + path);
    out << "timestamp,fold_id,row_index,y_true,y_pred\n";
    for (const auto& p : preds) {
        out << time_utils::format_iso8601(p.timestamp) << "," << p.fold_id << ",";
        if (p.row_index != NO_ROW) out << p.row_index;
        out << "," << p.y_true << "," << dataset_io::format_double(p.y_pred) << "\n";
    }
    if (!out) throw std::runtime_error("Failed writing: " + path);
}

namespace detail {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
}

}  // namespace detail

// Timestamps are stored as INT64 nanoseconds.
inline void write_predictions_parquet(const std::string& path,
                                      const std::vector<FoldPrediction>& preds) {
    arrow::FieldVector fields;
    fields.push_back(arrow::field("timestamp", arrow::int64()));
    fields.push_back(arrow::field("fold_id", arrow::int64()));
    fields.push_back(arrow::field("row_index", arrow::int64()));
    fields.push_back(arrow::field("y_true", arrow::int64()));
    fields.push_back(arrow::field("y_pred", arrow::float64()));
    auto schema = arrow::schema(fields);

    arrow::Int64Builder ts_b, fold_b, row_b, y_b;
    arrow::DoubleBuilder pred_b;
    for (const auto& p : preds) {
        detail::check(ts_b.Append(p.timestamp), "Append timestamp");
        detail::check(fold_b.Append(p.fold_id), "Append fold_id");
        if (p.row_index == NO_ROW) {
            detail::check(row_b.AppendNull(), "Append row_index");
        } else {
            detail::check(row_b.Append(static_cast<int64_t>(p.row_index)), "Append row_index");
        }
        detail::check(y_b.Append(p.y_true), "Append y_true");
        detail::check(pred_b.Append(p.y_pred), "Append y_pred");
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(5);
    detail::check(ts_b.Finish(&arrays[0]), "Finish timestamp");
    detail::check(fold_b.Finish(&arrays[1]), "Finish fold_id");
    detail::check(row_b.Finish(&arrays[2]), "Finish row_index");
    detail::check(y_b.Finish(&arrays[3]), "Finish y_true");
    detail::check(pred_b.Finish(&arrays[4]), "Finish y_pred");

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path + ": " +
                                 outfile_result.status().ToString());
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, static_cast<int64_t>(preds.size()));
    detail::check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                             chunk, props),
                  "Failed to write Parquet");
    detail::check(outfile->Close(), "Failed to close Parquet output");
}

inline void write_predictions(const std::string& path, const std::vector<FoldPrediction>& preds) {
    if (dataset_io::is_parquet_path(path)) {
        write_predictions_parquet(path, preds);
    } else {
        write_predictions_csv(path, preds);
    }
}

// CSV or Parquet by extension. row_index is optional; rows without it get
// NO_ROW and are joined by timestamp.
inline std::vector<FoldPrediction> read_predictions(const std::string& path) {
    TableReadOptions opts;
    opts.timestamp_column = "timestamp";
    opts.skip_non_numeric = true;
    ColumnTable table = dataset_io::read_table(path, opts);

    for (const char* name : {"fold_id", "y_true", "y_pred"}) {
        if (!table.has_column(name)) {
            throw SchemaError(std::string("Prediction file missing column: ") + name + " in " + path);
        }
    }
    const auto& fold = table.column("fold_id");
    const auto& y_true = table.column("y_true");
    const auto& y_pred = table.column("y_pred");
    const std::vector<double>* row_index =
        table.has_column("row_index") ? &table.column("row_index") : nullptr;

    std::vector<FoldPrediction> preds;
    preds.reserve(table.num_rows());
    for (size_t r = 0; r < table.num_rows(); ++r) {
        if (!std::isfinite(fold[r]) || !std::isfinite(y_true[r]) || !std::isfinite(y_pred[r])) {
            throw SchemaError("Prediction file has an incomplete row " +
                              std::to_string(r) + " in " + path);
        }
        FoldPrediction p;
        p.timestamp = table.timestamps[r];
        p.fold_id = static_cast<int>(fold[r]);
        p.y_true = y_true[r] == 1.0 ? 1 : 0;
        p.y_pred = y_pred[r];
        p.row_index = (row_index && std::isfinite((*row_index)[r]) && (*row_index)[r] >= 0.0)
            ? static_cast<size_t>((*row_index)[r])
            : NO_ROW;
        preds.push_back(p);
    }
    return preds;
}

}  // namespace prediction_io
