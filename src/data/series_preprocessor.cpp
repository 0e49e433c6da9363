// src/data/series_preprocessor.cpp
#include "macross/data/series_preprocessor.hpp"
#include <cmath>
#include <unordered_map>

namespace macross {

std::vector<Bar> SeriesPreprocessor::select_instrument(const std::vector<Bar>& bars,
                                                       const std::string& symbol) {
    std::vector<Bar> selected;
    for (const auto& bar : bars) {
        if (bar.symbol == symbol) {
            selected.push_back(bar);
        }
    }
    return selected;
}

std::vector<std::string> SeriesPreprocessor::list_instruments(const std::vector<Bar>& bars) {
    std::vector<std::string> symbols;
    for (const auto& [symbol, _] : group_by_instrument(bars)) {
        symbols.push_back(symbol);
    }
    return symbols;
}

std::vector<std::pair<std::string, std::vector<Bar>>> SeriesPreprocessor::group_by_instrument(
    const std::vector<Bar>& bars) {
    std::vector<std::pair<std::string, std::vector<Bar>>> groups;
    std::unordered_map<std::string, size_t> index_by_symbol;

    for (const auto& bar : bars) {
        auto it = index_by_symbol.find(bar.symbol);
        if (it == index_by_symbol.end()) {
            index_by_symbol.emplace(bar.symbol, groups.size());
            groups.emplace_back(bar.symbol, std::vector<Bar>{bar});
        } else {
            groups[it->second].second.push_back(bar);
        }
    }
    return groups;
}

std::vector<double> SeriesPreprocessor::closes(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    return prices;
}

Result<void> SeriesPreprocessor::validate(const std::vector<Bar>& bars) {
    for (size_t i = 0; i < bars.size(); ++i) {
        if (!std::isfinite(bars[i].close) || bars[i].close <= 0.0) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Invalid close " + std::to_string(bars[i].close) +
                                        " at bar " + std::to_string(i) + " of " + bars[i].symbol,
                                    "SeriesPreprocessor");
        }
    }
    return Result<void>();
}

}  // namespace macross
