#pragma once

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace parquet_util {

// Arrow reports failures through Status; surface them as exceptions.
template <typename Error = std::runtime_error>
inline void check(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) throw Error(context + ": " + status.ToString());
}

template <typename Error = std::runtime_error>
inline std::shared_ptr<arrow::Table> read_table(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    check<Error>(open_result.status(), "cannot open " + path);

    auto reader_result = parquet::arrow::OpenFile(*open_result, arrow::default_memory_pool());
    check<Error>(reader_result.status(), "cannot read Parquet " + path);
    auto reader = reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    check<Error>(reader->ReadTable(&table), "cannot read table from " + path);
    return table;
}

inline void write_table(const arrow::Table& table, const std::string& path) {
    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    check(outfile_result.status(), "cannot open Parquet output file " + path);
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk_size = std::max<int64_t>(table.num_rows(), 1);
    check(parquet::arrow::WriteTable(table, arrow::default_memory_pool(), outfile,
                                     chunk_size, props),
          "failed to write Parquet " + path);
    check(outfile->Close(), "failed to close " + path);
}

// Column lookup by name; throws Error when the column is absent.
template <typename Error = std::runtime_error>
inline std::shared_ptr<arrow::ChunkedArray> column(const arrow::Table& table,
                                                   const std::string& name,
                                                   const std::string& source) {
    auto col = table.GetColumnByName(name);
    if (!col) throw Error(source + " has no column '" + name + "'");
    return col;
}

// Strings of a utf8 / large_utf8 column; nulls read as empty strings.
template <typename Error = std::runtime_error>
inline std::vector<std::string> string_values(const arrow::ChunkedArray& col,
                                              const std::string& name) {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(col.length()));
    for (const auto& chunk : col.chunks()) {
        if (chunk->type_id() == arrow::Type::STRING) {
            auto arr = std::static_pointer_cast<arrow::StringArray>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) {
                out.push_back(arr->IsNull(i) ? std::string() : arr->GetString(i));
            }
        } else if (chunk->type_id() == arrow::Type::LARGE_STRING) {
            auto arr = std::static_pointer_cast<arrow::LargeStringArray>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) {
                out.push_back(arr->IsNull(i) ? std::string() : arr->GetString(i));
            }
        } else {
            throw Error("column '" + name + "' is not a string column (" +
                        chunk->type()->ToString() + ")");
        }
    }
    return out;
}

// Integers of an int32 / int64 column. Nulls are rejected.
template <typename Error = std::runtime_error>
inline std::vector<int64_t> int_values(const arrow::ChunkedArray& col, const std::string& name) {
    std::vector<int64_t> out;
    out.reserve(static_cast<size_t>(col.length()));
    for (const auto& chunk : col.chunks()) {
        if (chunk->null_count() > 0) {
            throw Error("column '" + name + "' contains nulls");
        }
        if (chunk->type_id() == arrow::Type::INT64) {
            auto arr = std::static_pointer_cast<arrow::Int64Array>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) out.push_back(arr->Value(i));
        } else if (chunk->type_id() == arrow::Type::INT32) {
            auto arr = std::static_pointer_cast<arrow::Int32Array>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) out.push_back(arr->Value(i));
        } else {
            throw Error("column '" + name + "' is not an integer column (" +
                        chunk->type()->ToString() + ")");
        }
    }
    return out;
}

// Builders: finish a column or throw.
inline std::shared_ptr<arrow::Array> string_array(const std::vector<std::string>& values) {
    arrow::StringBuilder b;
    check(b.AppendValues(values), "string column");
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "string column");
    return arr;
}

inline std::shared_ptr<arrow::Array> int64_array(const std::vector<int64_t>& values) {
    arrow::Int64Builder b;
    check(b.AppendValues(values), "int64 column");
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "int64 column");
    return arr;
}

// NaN is stored as null so downstream readers see a missing value.
inline std::shared_ptr<arrow::Array> double_array(const std::vector<double>& values) {
    arrow::DoubleBuilder b;
    for (double v : values) {
        if (std::isnan(v)) check(b.AppendNull(), "double column");
        else check(b.Append(v), "double column");
    }
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "double column");
    return arr;
}

inline std::shared_ptr<arrow::Array> bool_array(const std::vector<bool>& values) {
    arrow::BooleanBuilder b;
    for (bool v : values) check(b.Append(v), "boolean column");
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "boolean column");
    return arr;
}

}  // namespace parquet_util
