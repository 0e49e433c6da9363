// src/data/csv_data_loader.cpp
#include "macross/data/csv_data_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/value_parsing.h>
#include <filesystem>
#include "macross/core/logger.hpp"

namespace macross {

CsvDataLoader::CsvDataLoader(CsvLoadOptions options) : options_(std::move(options)) {}

Result<std::shared_ptr<arrow::Table>> CsvDataLoader::read_table(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_NOT_FOUND, "Bar file not found: " + path, "CsvDataLoader");
    }

    auto input = arrow::io::ReadableFile::Open(path, arrow::default_memory_pool());
    if (!input.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to open " + path + ": " + input.status().ToString(), "CsvDataLoader");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = options_.delimiter;

    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    const auto& columns = options_.columns;
    convert_options.include_columns = {columns.timestamp, columns.instrument, columns.close};
    convert_options.column_types[columns.timestamp] = arrow::timestamp(arrow::TimeUnit::SECOND);
    convert_options.column_types[columns.instrument] = arrow::utf8();
    convert_options.column_types[columns.close] = arrow::float64();
    if (!options_.timestamp_format.empty()) {
        convert_options.timestamp_parsers = {
            arrow::TimestampParser::MakeStrptime(options_.timestamp_format)};
    }

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(),
                                                input.ValueOrDie(), read_options, parse_options,
                                                convert_options);
    if (!reader.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to create CSV reader: " + reader.status().ToString(), "CsvDataLoader");
    }

    auto table = reader.ValueOrDie()->Read();
    if (!table.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to parse " + path + ": " + table.status().ToString(), "CsvDataLoader");
    }

    DEBUG("Read " << table.ValueOrDie()->num_rows() << " rows from " << path);
    return Result<std::shared_ptr<arrow::Table>>(table.ValueOrDie());
}

Result<std::vector<Bar>> CsvDataLoader::load_bars(const std::string& path) const {
    auto table = read_table(path);
    if (table.is_error()) {
        return make_error<std::vector<Bar>>(table.error()->code(), table.error()->what(),
                                            "CsvDataLoader");
    }
    return DataConversionUtils::arrow_table_to_bars(table.value(), options_.columns);
}

}  // namespace macross
