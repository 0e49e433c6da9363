#include <fstream>
#include <iostream>
#include <string>
#include "macross/backtest/backtest_config.hpp"
#include "macross/backtest/batch_runner.hpp"
#include "macross/backtest/metrics_csv_exporter.hpp"
#include "macross/core/logger.hpp"
#include "macross/data/csv_data_loader.hpp"

using namespace macross;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <bars.csv> <metrics_out.csv> [config.json]\n"
              << "  bars.csv     columns timestamp, stock_name, close (names configurable)\n"
              << "  config.json  optional {\"backtest\": {...}, \"logger\": {...}, "
                 "\"columns\": {...}}"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string bars_path = argv[1];
    const std::string output_path = argv[2];

    try {
        BacktestConfig config;
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::BOTH;
        logger_config.filename_prefix = "bt_ma_crossover";
        CsvLoadOptions load_options;

        if (argc == 4) {
            std::ifstream config_file(argv[3]);
            if (!config_file.is_open()) {
                std::cerr << "Failed to open config file: " << argv[3] << std::endl;
                return 1;
            }
            nlohmann::json j;
            try {
                config_file >> j;
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "Invalid config file " << argv[3] << ": " << e.what() << std::endl;
                return 1;
            }

            if (j.contains("backtest"))
                config.from_json(j.at("backtest"));
            if (j.contains("logger"))
                logger_config.from_json(j.at("logger"));
            if (j.contains("columns")) {
                const auto& cols = j.at("columns");
                if (cols.contains("timestamp"))
                    load_options.columns.timestamp = cols.at("timestamp").get<std::string>();
                if (cols.contains("instrument"))
                    load_options.columns.instrument = cols.at("instrument").get<std::string>();
                if (cols.contains("close"))
                    load_options.columns.close = cols.at("close").get<std::string>();
                if (cols.contains("timestamp_format"))
                    load_options.timestamp_format =
                        cols.at("timestamp_format").get<std::string>();
            }
        }

        Logger::instance().initialize(logger_config);
        Logger::register_component("bt_ma_crossover");

        auto valid = config.validate();
        if (valid.is_error()) {
            ERROR("Invalid configuration: " << valid.error()->what());
            return 1;
        }
        INFO("Configuration: " << config.to_json().dump());

        CsvDataLoader loader(load_options);
        auto bars = loader.load_bars(bars_path);
        if (bars.is_error()) {
            ERROR("Failed to load bars: " << bars.error()->to_string());
            return 1;
        }
        INFO("Loaded " << bars.value().size() << " bars from " << bars_path);

        BatchRunner runner(config);
        auto metrics = runner.run(bars.value());
        if (metrics.is_error()) {
            ERROR("Backtest failed: " << metrics.error()->to_string());
            return 1;
        }

        for (const auto& m : metrics.value()) {
            INFO(m.instrument_id << ": annualized return " << m.annualized_return
                                 << ", volatility " << m.annualized_volatility << ", sharpe "
                                 << m.sharpe_ratio << ", max drawdown " << m.max_drawdown
                                 << " [" << run_status_to_string(m.status) << "]");
        }

        MetricsCSVExporter exporter;
        auto exported = exporter.export_metrics(output_path, metrics.value());
        if (exported.is_error()) {
            ERROR("Failed to write results: " << exported.error()->to_string());
            return 1;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
