// include/macross/backtest/metrics_csv_exporter.hpp
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Writes one CSV row per instrument metrics record
 *
 * Undefined values (NaN or absent optional fields) are written as empty cells.
 */
class MetricsCSVExporter {
public:
    explicit MetricsCSVExporter(int precision = 10);

    /**
     * @brief Write header and rows to a file, creating parent directories
     * @return FILE_IO_ERROR when the file cannot be written
     */
    Result<void> export_metrics(const std::string& path,
                                const std::vector<PerformanceMetrics>& metrics) const;

    /**
     * @brief Write header and rows to a stream
     */
    void write(std::ostream& out, const std::vector<PerformanceMetrics>& metrics) const;

    static std::string header();

    /**
     * @brief Quote a text field when it contains a delimiter, quote or line break
     */
    static std::string escape_field(const std::string& field);

private:
    int precision_;

    std::string format_value(double value) const;
    std::string format_value(const std::optional<double>& value) const;
};

}  // namespace macross
