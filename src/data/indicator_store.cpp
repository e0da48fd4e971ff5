#include "trade_sim/data/indicator_store.hpp"
#include <algorithm>
#include <cmath>
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"
#include "trade_sim/data/price_series_index.hpp"

namespace trade_sim {

std::string indicator_kind_to_string(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::ATR:
            return "ATR";
        case IndicatorKind::REALIZED_VOLATILITY:
            return "realized volatility";
        default:
            return "unknown indicator";
    }
}

void IndicatorStore::set(IndicatorKind kind, const std::string& symbol, const Timestamp& date,
                         double value, int window) {
    series_[{kind, symbol, window}][date] = value;
}

Result<double> IndicatorStore::get(IndicatorKind kind, const std::string& symbol,
                                   const Timestamp& date, int window) const {
    auto series_it = series_.find({kind, symbol, window});
    if (series_it != series_.end()) {
        auto value_it = series_it->second.find(date);
        if (value_it != series_it->second.end()) {
            return value_it->second;
        }
    }
    std::string name = indicator_kind_to_string(kind);
    if (window > 0) {
        name += " (" + std::to_string(window) + "-bar)";
    }
    return make_error<double>(ErrorCode::INSUFFICIENT_HISTORY,
                              "No " + name + " for " + symbol + " on " +
                                  core::format_iso_date(date),
                              "IndicatorStore");
}

size_t IndicatorStore::size() const {
    size_t count = 0;
    for (const auto& entry : series_) {
        count += entry.second.size();
    }
    return count;
}

std::vector<std::optional<double>> IndicatorCalculator::average_true_range(
    const std::vector<PriceBar>& series) const {
    std::vector<std::optional<double>> atr(series.size());
    if (atr_window_ <= 0 || series.size() <= static_cast<size_t>(atr_window_)) {
        return atr;
    }

    std::vector<double> true_range(series.size(), 0.0);
    for (size_t i = 1; i < series.size(); ++i) {
        double prev_close = series[i - 1].close;
        true_range[i] = std::max({series[i].high - series[i].low,
                                  std::abs(series[i].high - prev_close),
                                  std::abs(series[i].low - prev_close)});
    }

    const size_t window = static_cast<size_t>(atr_window_);
    for (size_t i = window; i < series.size(); ++i) {
        double sum = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            sum += true_range[k];
        }
        atr[i] = sum / static_cast<double>(window);
    }
    return atr;
}

std::vector<std::optional<double>> IndicatorCalculator::realized_volatility(
    const std::vector<PriceBar>& series) const {
    std::vector<std::optional<double>> volatility(series.size());
    if (volatility_window_ < 2 || series.size() <= static_cast<size_t>(volatility_window_)) {
        return volatility;
    }

    std::vector<double> returns(series.size(), 0.0);
    for (size_t i = 1; i < series.size(); ++i) {
        returns[i] = series[i - 1].close != 0.0
                         ? (series[i].close - series[i - 1].close) / series[i - 1].close
                         : 0.0;
    }

    const size_t window = static_cast<size_t>(volatility_window_);
    for (size_t i = window; i < series.size(); ++i) {
        double mean = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            mean += returns[k];
        }
        mean /= static_cast<double>(window);

        double sq_sum = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            sq_sum += (returns[k] - mean) * (returns[k] - mean);
        }
        volatility[i] = std::sqrt(sq_sum / static_cast<double>(window - 1)) * std::sqrt(252.0);
    }
    return volatility;
}

Result<IndicatorStore> IndicatorCalculator::compute(const PriceSeriesIndex& index) const {
    if (atr_window_ <= 0 || volatility_window_ < 2) {
        return make_error<IndicatorStore>(ErrorCode::INVALID_ARGUMENT,
                                          "ATR window must be > 0 and volatility window >= 2",
                                          "IndicatorCalculator");
    }

    IndicatorStore store;
    for (const auto& symbol : index.symbols()) {
        const auto& series = index.get_series(symbol);
        auto atr = average_true_range(series);
        auto volatility = realized_volatility(series);
        for (size_t i = 0; i < series.size(); ++i) {
            if (atr[i]) {
                store.set(IndicatorKind::ATR, symbol, series[i].date, *atr[i]);
            }
            if (volatility[i]) {
                store.set(IndicatorKind::REALIZED_VOLATILITY, symbol, series[i].date,
                          *volatility[i], volatility_window_);
            }
        }
    }

    DEBUG("Computed " << store.size() << " indicator values");
    return store;
}

}  // namespace trade_sim
