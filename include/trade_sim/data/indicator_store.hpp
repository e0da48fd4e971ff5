#pragma once

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

class PriceSeriesIndex;

/**
 * @brief Indicator series consumed by the sizing methods
 */
enum class IndicatorKind {
    ATR,                 // average true range, price units
    REALIZED_VOLATILITY  // annualized standard deviation of daily close-to-close returns
};

std::string indicator_kind_to_string(IndicatorKind kind);

/**
 * Precomputed numeric series keyed by (kind, symbol, lookback window, date).
 *
 * Filled before a run starts and read-only afterwards. A missing value means the provider
 * did not have enough history for that date, or never computed that window. Window 0 is
 * used for series whose consumers do not choose a lookback.
 */
class IndicatorStore {
public:
    void set(IndicatorKind kind, const std::string& symbol, const Timestamp& date, double value,
             int window = 0);

    /**
     * @return The value, or INSUFFICIENT_HISTORY when nothing was stored for that date
     */
    Result<double> get(IndicatorKind kind, const std::string& symbol, const Timestamp& date,
                       int window = 0) const;

    bool empty() const {
        return series_.empty();
    }

    size_t size() const;

private:
    std::map<std::tuple<IndicatorKind, std::string, int>, std::map<Timestamp, double>> series_;
};

/**
 * @brief Default indicator provider computed from the price index itself
 */
class IndicatorCalculator {
public:
    IndicatorCalculator(int atr_window = 14, int volatility_window = 20)
        : atr_window_(atr_window), volatility_window_(volatility_window) {}

    /**
     * Compute ATR and realized volatility for every instrument. ATR is stored under window 0,
     * realized volatility under volatility_window.
     * @return Store, or INVALID_ARGUMENT for non-positive windows
     */
    Result<IndicatorStore> compute(const PriceSeriesIndex& index) const;

    /**
     * Rolling mean of the true range; entry i is defined once atr_window true ranges exist
     * (true range needs the previous close, so the first defined entry is i = atr_window)
     */
    std::vector<std::optional<double>> average_true_range(
        const std::vector<PriceBar>& series) const;

    /**
     * Annualized (sqrt(252)) sample standard deviation of the last volatility_window
     * simple returns; entry i is defined once i >= volatility_window
     */
    std::vector<std::optional<double>> realized_volatility(
        const std::vector<PriceBar>& series) const;

private:
    int atr_window_;
    int volatility_window_;
};

}  // namespace trade_sim
