#pragma once

#include "data/column_table.hpp"
#include "data/time_series_dataset.hpp"
#include "errors.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TableReadOptions
// ---------------------------------------------------------------------------
struct TableReadOptions {
    std::string timestamp_column = "timestamp";
    std::vector<std::string> columns;   // empty = every column
    bool skip_non_numeric = false;      // drop text columns instead of failing
};

namespace dataset_io {

inline std::string format_double(double val) {
    if (std::isnan(val)) return "";
    if (std::isinf(val)) return val > 0 ? "inf" : "-inf";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", val);
    return buf;
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Split one CSV line. Double-quoted fields may contain commas and "" escapes.
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cur += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            out.push_back(cur);
            cur.clear();
        } else if (c != '\r' && c != '\n') {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

// Parse a numeric cell. Returns false for text that is neither a number,
// a boolean, nor a recognised missing marker.
inline bool parse_cell(const std::string& raw, double& out) {
    std::string s = trim(raw);
    if (s.empty() || s == "nan" || s == "NaN" || s == "NAN" || s == "None" ||
        s == "null" || s == "NULL" || s == "NA" || s == "NaT") {
        out = std::nan("");
        return true;
    }
    if (s == "True" || s == "true") { out = 1.0; return true; }
    if (s == "False" || s == "false") { out = 0.0; return true; }
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

// ---------------------------------------------------------------------------
// CSV
// ---------------------------------------------------------------------------
inline ColumnTable read_csv_table(const std::string& path, const TableReadOptions& opts) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot open input file: " + path);

    std::string line;
    if (!std::getline(in, line)) throw SchemaError("Empty CSV file: " + path);
    auto header = split_csv_line(line);
    for (auto& h : header) h = trim(h);

    int ts_col = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == opts.timestamp_column) ts_col = static_cast<int>(i);
    }
    if (ts_col < 0) {
        throw SchemaError("Missing column: " + opts.timestamp_column + " in " + path);
    }

    std::set<std::string> wanted(opts.columns.begin(), opts.columns.end());
    std::vector<int> src_idx;
    ColumnTable table;
    for (size_t i = 0; i < header.size(); ++i) {
        if (static_cast<int>(i) == ts_col) continue;
        if (!wanted.empty() && wanted.count(header[i]) == 0) continue;
        src_idx.push_back(static_cast<int>(i));
        table.column_names.push_back(header[i]);
    }
    table.columns.resize(src_idx.size());
    std::vector<bool> numeric(src_idx.size(), true);

    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto cells = split_csv_line(line);
        if (cells.size() != header.size()) {
            throw SchemaError(path + ":" + std::to_string(line_no) + ": expected " +
                              std::to_string(header.size()) + " fields, got " +
                              std::to_string(cells.size()));
        }
        table.timestamps.push_back(time_utils::parse_iso8601(cells[ts_col]));
        for (size_t c = 0; c < src_idx.size(); ++c) {
            double v = std::nan("");
            if (numeric[c] && !parse_cell(cells[src_idx[c]], v)) {
                if (!opts.skip_non_numeric) {
                    throw SchemaError(path + ":" + std::to_string(line_no) + ": column '" +
                                      table.column_names[c] + "' holds non-numeric value '" +
                                      cells[src_idx[c]] + "'");
                }
                numeric[c] = false;
            }
            table.columns[c].push_back(v);
        }
    }

    if (opts.skip_non_numeric) {
        ColumnTable kept;
        kept.timestamps = std::move(table.timestamps);
        for (size_t c = 0; c < numeric.size(); ++c) {
            if (!numeric[c]) continue;
            kept.column_names.push_back(table.column_names[c]);
            kept.columns.push_back(std::move(table.columns[c]));
        }
        table = std::move(kept);
    }

    for (const auto& name : opts.columns) {
        if (!table.has_column(name)) throw SchemaError("Missing column: " + name + " in " + path);
    }
    return table;
}

inline void write_csv_table(const std::string& path, const ColumnTable& table,
                            const std::string& timestamp_column = "timestamp") {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot open output file: " + path);

    out << timestamp_column;
    for (const auto& name : table.column_names) out << "," << name;
    out << "\n";
    for (size_t r = 0; r < table.num_rows(); ++r) {
        out << time_utils::format_iso8601(table.timestamps[r]);
        for (const auto& col : table.columns) out << "," << format_double(col[r]);
        out << "\n";
    }
    if (!out) throw std::runtime_error("Failed writing: " + path);
}

// ---------------------------------------------------------------------------
// Parquet (Apache Arrow)
// ---------------------------------------------------------------------------
namespace detail {

template <typename ArrayT>
void append_numeric(const arrow::Array& arr, std::vector<double>& out) {
    const auto& typed = static_cast<const ArrayT&>(arr);
    for (int64_t i = 0; i < typed.length(); ++i) {
        out.push_back(typed.IsNull(i) ? std::nan("") : static_cast<double>(typed.Value(i)));
    }
}

// Returns false when the column type is not numeric.
inline bool append_numeric_chunk(const arrow::Array& arr, std::vector<double>& out) {
    switch (arr.type_id()) {
        case arrow::Type::DOUBLE: append_numeric<arrow::DoubleArray>(arr, out); return true;
        case arrow::Type::FLOAT:  append_numeric<arrow::FloatArray>(arr, out); return true;
        case arrow::Type::INT8:   append_numeric<arrow::Int8Array>(arr, out); return true;
        case arrow::Type::INT16:  append_numeric<arrow::Int16Array>(arr, out); return true;
        case arrow::Type::INT32:  append_numeric<arrow::Int32Array>(arr, out); return true;
        case arrow::Type::INT64:  append_numeric<arrow::Int64Array>(arr, out); return true;
        case arrow::Type::UINT8:  append_numeric<arrow::UInt8Array>(arr, out); return true;
        case arrow::Type::UINT16: append_numeric<arrow::UInt16Array>(arr, out); return true;
        case arrow::Type::UINT32: append_numeric<arrow::UInt32Array>(arr, out); return true;
        case arrow::Type::UINT64: append_numeric<arrow::UInt64Array>(arr, out); return true;
        case arrow::Type::BOOL:   append_numeric<arrow::BooleanArray>(arr, out); return true;
        default: return false;
    }
}

inline int64_t unit_to_ns(arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND: return time_utils::NS_PER_SEC;
        case arrow::TimeUnit::MILLI:  return 1'000'000LL;
        case arrow::TimeUnit::MICRO:  return 1'000LL;
        case arrow::TimeUnit::NANO:   return 1LL;
    }
    return 1LL;
}

inline void append_timestamps(const arrow::ChunkedArray& col, std::vector<int64_t>& out) {
    for (int c = 0; c < col.num_chunks(); ++c) {
        const auto& chunk = *col.chunk(c);
        switch (chunk.type_id()) {
            case arrow::Type::TIMESTAMP: {
                const auto& arr = static_cast<const arrow::TimestampArray&>(chunk);
                auto type = std::static_pointer_cast<arrow::TimestampType>(arr.type());
                int64_t scale = unit_to_ns(type->unit());
                // Zone-aware columns hold UTC instants; rows live on the market wall clock.
                const std::string& tz = type->timezone();
                for (int64_t i = 0; i < arr.length(); ++i) {
                    if (arr.IsNull(i)) throw SchemaError("Null timestamp in Parquet input");
                    int64_t ts = arr.Value(i) * scale;
                    out.push_back(tz.empty() ? ts : time_utils::utc_to_local(ts, tz));
                }
                break;
            }
            case arrow::Type::INT64: {
                const auto& arr = static_cast<const arrow::Int64Array&>(chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    if (arr.IsNull(i)) throw SchemaError("Null timestamp in Parquet input");
                    out.push_back(arr.Value(i));
                }
                break;
            }
            case arrow::Type::STRING: {
                const auto& arr = static_cast<const arrow::StringArray&>(chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    if (arr.IsNull(i)) throw SchemaError("Null timestamp in Parquet input");
                    out.push_back(time_utils::parse_iso8601(arr.GetString(i)));
                }
                break;
            }
            default:
                throw SchemaError("Unsupported timestamp column type: " + chunk.type()->ToString());
        }
    }
}

}  // namespace detail

inline ColumnTable read_parquet_table(const std::string& path, const TableReadOptions& opts) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet input: " + path + ": " +
                                 open_result.status().ToString());
    }
    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) {
        throw std::runtime_error("Cannot read Parquet file: " + path + ": " +
                                 file_reader_result.status().ToString());
    }
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> arrow_table;
    auto status = reader->ReadTable(&arrow_table);
    if (!status.ok()) {
        throw std::runtime_error("Failed to read Parquet table: " + status.ToString());
    }

    auto ts_col = arrow_table->GetColumnByName(opts.timestamp_column);
    if (!ts_col) throw SchemaError("Missing column: " + opts.timestamp_column + " in " + path);

    ColumnTable table;
    detail::append_timestamps(*ts_col, table.timestamps);

    std::set<std::string> wanted(opts.columns.begin(), opts.columns.end());
    const auto& schema = arrow_table->schema();
    for (int f = 0; f < schema->num_fields(); ++f) {
        const std::string& name = schema->field(f)->name();
        if (name == opts.timestamp_column) continue;
        if (!wanted.empty() && wanted.count(name) == 0) continue;

        auto col = arrow_table->column(f);
        std::vector<double> values;
        values.reserve(static_cast<size_t>(col->length()));
        bool numeric = true;
        for (int c = 0; c < col->num_chunks() && numeric; ++c) {
            numeric = detail::append_numeric_chunk(*col->chunk(c), values);
        }
        if (!numeric) {
            if (opts.skip_non_numeric) continue;
            throw SchemaError("Column '" + name + "' has non-numeric type " +
                              schema->field(f)->type()->ToString());
        }
        table.column_names.push_back(name);
        table.columns.push_back(std::move(values));
    }

    for (const auto& name : opts.columns) {
        if (!table.has_column(name)) throw SchemaError("Missing column: " + name + " in " + path);
    }
    return table;
}

// Timestamps as INT64 nanoseconds, every data column as DOUBLE (NaN -> null).
inline void write_parquet_table(const std::string& path, const ColumnTable& table,
                                const std::string& timestamp_column = "timestamp") {
    auto check = [](const arrow::Status& status, const std::string& what) {
        if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
    };

    arrow::FieldVector fields;
    fields.push_back(arrow::field(timestamp_column, arrow::int64()));
    for (const auto& name : table.column_names) fields.push_back(arrow::field(name, arrow::float64()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;
    {
        arrow::Int64Builder b;
        check(b.AppendValues(table.timestamps), "Append timestamps");
        check(b.Finish(&arr), "Finish timestamps");
        arrays.push_back(arr);
    }
    for (const auto& col : table.columns) {
        arrow::DoubleBuilder b;
        std::vector<bool> valid(col.size());
        for (size_t i = 0; i < col.size(); ++i) valid[i] = !std::isnan(col[i]);
        check(b.AppendValues(col, valid), "Append column");
        check(b.Finish(&arr), "Finish column");
        arrays.push_back(arr);
    }
    auto arrow_table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path + ": " +
                                 outfile_result.status().ToString());
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(1, static_cast<int64_t>(table.num_rows()));
    check(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), outfile,
                                     chunk, props),
          "Failed to write Parquet");
    check(outfile->Close(), "Failed to close Parquet output");
}

// ---------------------------------------------------------------------------
// Dispatch by extension
// ---------------------------------------------------------------------------
inline bool is_parquet_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    return ext == ".parquet" || ext == ".pq";
}

inline ColumnTable read_table(const std::string& path, const TableReadOptions& opts) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Input file not found: " + path);
    }
    return is_parquet_path(path) ? read_parquet_table(path, opts) : read_csv_table(path, opts);
}

inline void write_table(const std::string& path, const ColumnTable& table,
                        const std::string& timestamp_column = "timestamp") {
    if (is_parquet_path(path)) {
        write_parquet_table(path, table, timestamp_column);
    } else {
        write_csv_table(path, table, timestamp_column);
    }
}

// Every column that is not the label, a forward price/return or a derived
// target. Used when no explicit feature list is given.
inline std::vector<std::string> infer_feature_columns(const ColumnTable& table,
                                                      const DatasetSchema& schema) {
    std::vector<std::string> features;
    for (const auto& name : table.column_names) {
        if (name == schema.label_column) continue;
        if (name.rfind("future_", 0) == 0 || name.rfind("target_", 0) == 0) continue;
        features.push_back(name);
    }
    return features;
}

// Load only the columns the schema needs and bind them.
inline TimeSeriesDataset load_dataset(const std::string& path, const DatasetSchema& schema) {
    TableReadOptions opts;
    opts.timestamp_column = schema.timestamp_column;
    opts.columns = schema.required_columns();
    return TimeSeriesDataset(read_table(path, opts), schema);
}

}  // namespace dataset_io
