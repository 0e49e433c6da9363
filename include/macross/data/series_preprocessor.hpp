// include/macross/data/series_preprocessor.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Selects and checks one instrument's price series
 *
 * Input order is preserved; bars are assumed to already be sorted by time.
 */
class SeriesPreprocessor {
public:
    /**
     * @brief Bars of one instrument, in input order
     */
    static std::vector<Bar> select_instrument(const std::vector<Bar>& bars,
                                              const std::string& symbol);

    /**
     * @brief Distinct instrument identifiers in order of first appearance
     */
    static std::vector<std::string> list_instruments(const std::vector<Bar>& bars);

    /**
     * @brief Split a multi-instrument bar list into per-instrument series
     *
     * One pass; instruments appear in order of first appearance and every
     * series keeps the input order of its bars.
     */
    static std::vector<std::pair<std::string, std::vector<Bar>>> group_by_instrument(
        const std::vector<Bar>& bars);

    /**
     * @brief Closing prices of a series
     */
    static std::vector<double> closes(const std::vector<Bar>& bars);

    /**
     * @brief Check every close is finite and strictly positive
     * @return INVALID_DATA naming the first offending bar
     */
    static Result<void> validate(const std::vector<Bar>& bars);
};

}  // namespace macross
