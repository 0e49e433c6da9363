// src/backtest/metrics_csv_exporter.cpp
#include "macross/backtest/metrics_csv_exporter.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "macross/core/logger.hpp"

namespace macross {

MetricsCSVExporter::MetricsCSVExporter(int precision) : precision_(precision) {}

std::string MetricsCSVExporter::header() {
    return "instrument_id,annualized_return,annualized_volatility,sharpe_ratio,max_drawdown,"
           "final_portfolio_value,benchmark_annualized_return,benchmark_volatility,bars,"
           "buy_signals,sell_signals,trades_executed,trades_skipped,status";
}

std::string MetricsCSVExporter::format_value(double value) const {
    if (std::isnan(value)) {
        return "";
    }
    std::ostringstream ss;
    ss << std::setprecision(precision_) << value;
    return ss.str();
}

std::string MetricsCSVExporter::format_value(const std::optional<double>& value) const {
    return value ? format_value(*value) : "";
}

std::string MetricsCSVExporter::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void MetricsCSVExporter::write(std::ostream& out,
                               const std::vector<PerformanceMetrics>& metrics) const {
    out << header() << "\n";
    for (const auto& m : metrics) {
        out << escape_field(m.instrument_id) << "," << format_value(m.annualized_return) << ","
            << format_value(m.annualized_volatility) << "," << format_value(m.sharpe_ratio)
            << "," << format_value(m.max_drawdown) << ","
            << format_value(m.final_portfolio_value) << ","
            << format_value(m.benchmark_annualized_return) << ","
            << format_value(m.benchmark_volatility) << "," << m.bars << "," << m.buy_signals
            << "," << m.sell_signals << "," << m.trades_executed << "," << m.trades_skipped
            << "," << run_status_to_string(m.status) << "\n";
    }
}

Result<void> MetricsCSVExporter::export_metrics(
    const std::string& path, const std::vector<PerformanceMetrics>& metrics) const {
    try {
        std::filesystem::path out_path(path);
        if (out_path.has_parent_path()) {
            std::filesystem::create_directories(out_path.parent_path());
        }

        std::ofstream file(out_path);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + path + " for writing",
                                    "MetricsCSVExporter");
        }

        write(file, metrics);
        file.flush();
        if (!file) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                    "MetricsCSVExporter");
        }

        INFO("Wrote " << metrics.size() << " metrics rows to " << path);
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error exporting metrics: ") + e.what(),
                                "MetricsCSVExporter");
    }
}

}  // namespace macross
