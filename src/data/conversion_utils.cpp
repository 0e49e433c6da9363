// src/data/conversion_utils.cpp
#include "macross/data/conversion_utils.hpp"
#include <arrow/array/concatenate.h>
#include <arrow/type_traits.h>
#include <chrono>

namespace macross {

namespace {

Result<std::shared_ptr<arrow::Array>> single_chunk(const std::shared_ptr<arrow::Table>& table,
                                                   const std::string& name,
                                                   arrow::Type::type expected) {
    auto column = table->GetColumnByName(name);
    if (column == nullptr) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::INVALID_DATA, "Missing required column: " + name, "DataConversionUtils");
    }
    if (column->type()->id() != expected) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR,
            "Column " + name + " has unexpected type " + column->type()->ToString(),
            "DataConversionUtils");
    }

    auto combined = arrow::Concatenate(column->chunks(), arrow::default_memory_pool());
    if (!combined.ok()) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine chunks of column " + name + ": " + combined.status().ToString(),
            "DataConversionUtils");
    }
    return Result<std::shared_ptr<arrow::Array>>(combined.ValueOrDie());
}

}  // namespace

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table, const BarColumns& columns) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    std::vector<Bar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<Bar>>(std::move(bars));
    }

    auto time_chunk = single_chunk(table, columns.timestamp, arrow::Type::TIMESTAMP);
    if (time_chunk.is_error()) {
        return make_error<std::vector<Bar>>(time_chunk.error()->code(), time_chunk.error()->what(),
                                            "DataConversionUtils");
    }
    auto symbol_chunk = single_chunk(table, columns.instrument, arrow::Type::STRING);
    if (symbol_chunk.is_error()) {
        return make_error<std::vector<Bar>>(symbol_chunk.error()->code(),
                                            symbol_chunk.error()->what(), "DataConversionUtils");
    }
    auto close_chunk = single_chunk(table, columns.close, arrow::Type::DOUBLE);
    if (close_chunk.is_error()) {
        return make_error<std::vector<Bar>>(close_chunk.error()->code(),
                                            close_chunk.error()->what(), "DataConversionUtils");
    }

    const auto& time_array = static_cast<const arrow::TimestampArray&>(*time_chunk.value());
    const auto& symbol_array = static_cast<const arrow::StringArray&>(*symbol_chunk.value());
    const auto& close_array = static_cast<const arrow::DoubleArray&>(*close_chunk.value());

    bars.reserve(table->num_rows());
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto ts_result = extract_timestamp(time_array, i);
        if (ts_result.is_error()) {
            return make_error<std::vector<Bar>>(ts_result.error()->code(),
                                                ts_result.error()->what(), "DataConversionUtils");
        }

        auto symbol_result = extract_string(symbol_array, i);
        if (symbol_result.is_error()) {
            return make_error<std::vector<Bar>>(symbol_result.error()->code(),
                                                symbol_result.error()->what(),
                                                "DataConversionUtils");
        }

        auto close_result = extract_double(close_array, i);
        if (close_result.is_error()) {
            return make_error<std::vector<Bar>>(close_result.error()->code(),
                                                close_result.error()->what(),
                                                "DataConversionUtils");
        }

        bars.emplace_back(ts_result.value(), close_result.value(), symbol_result.value());
    }

    return Result<std::vector<Bar>>(std::move(bars));
}

Result<Timestamp> DataConversionUtils::extract_timestamp(const arrow::TimestampArray& array,
                                                         int64_t index) {
    if (array.IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at row " + std::to_string(index),
                                     "DataConversionUtils");
    }

    const auto& type = static_cast<const arrow::TimestampType&>(*array.type());
    int64_t raw = array.Value(index);

    std::chrono::system_clock::duration since_epoch;
    switch (type.unit()) {
        case arrow::TimeUnit::SECOND:
            since_epoch = std::chrono::seconds(raw);
            break;
        case arrow::TimeUnit::MILLI:
            since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(raw));
            break;
        case arrow::TimeUnit::MICRO:
            since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(raw));
            break;
        case arrow::TimeUnit::NANO:
        default:
            since_epoch = std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(raw));
            break;
    }
    return Result<Timestamp>(Timestamp(since_epoch));
}

Result<double> DataConversionUtils::extract_double(const arrow::DoubleArray& array,
                                                   int64_t index) {
    if (array.IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null close value at row " + std::to_string(index),
                                  "DataConversionUtils");
    }
    return Result<double>(array.Value(index));
}

Result<std::string> DataConversionUtils::extract_string(const arrow::StringArray& array,
                                                        int64_t index) {
    if (array.IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null instrument value at row " + std::to_string(index),
                                       "DataConversionUtils");
    }
    return Result<std::string>(array.GetString(index));
}

}  // namespace macross
