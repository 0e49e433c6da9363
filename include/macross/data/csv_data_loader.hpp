// include/macross/data/csv_data_loader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"
#include "macross/data/conversion_utils.hpp"

namespace macross {

/**
 * @brief Options for reading a multi-instrument bar file
 */
struct CsvLoadOptions {
    BarColumns columns;
    char delimiter{','};
    // strptime-style format for the timestamp column; empty means ISO-8601
    std::string timestamp_format;
};

/**
 * @brief Reads comma-separated bar files through Arrow's CSV reader
 *
 * Only the timestamp, instrument and close columns are read; they are typed
 * as timestamp[s], utf8 and float64 respectively. Extra columns are ignored.
 */
class CsvDataLoader {
public:
    explicit CsvDataLoader(CsvLoadOptions options = CsvLoadOptions());

    /**
     * @brief Read the file into an Arrow table
     * @return FILE_NOT_FOUND, FILE_IO_ERROR or CONVERSION_ERROR on failure
     */
    Result<std::shared_ptr<arrow::Table>> read_table(const std::string& path) const;

    /**
     * @brief Read the file into bars, in file order
     */
    Result<std::vector<Bar>> load_bars(const std::string& path) const;

private:
    CsvLoadOptions options_;
};

}  // namespace macross
