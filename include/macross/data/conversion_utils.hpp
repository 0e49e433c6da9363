// include/macross/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Names of the columns that make up a bar table
 */
struct BarColumns {
    std::string timestamp{"timestamp"};
    std::string instrument{"stock_name"};
    std::string close{"close"};
};

class DataConversionUtils {
public:
    /**
     * @brief Convert an Arrow table to bars, one per row in table order
     * @param table Table with a timestamp, a string instrument and a double
     *              close column
     * @param columns Column names to read
     * @return Bars, or INVALID_DATA / CONVERSION_ERROR naming the first bad
     *         column or row
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table,
                                                        const BarColumns& columns = BarColumns());

private:
    static Result<Timestamp> extract_timestamp(const arrow::TimestampArray& array, int64_t index);

    static Result<double> extract_double(const arrow::DoubleArray& array, int64_t index);

    static Result<std::string> extract_string(const arrow::StringArray& array, int64_t index);
};

}  // namespace macross
