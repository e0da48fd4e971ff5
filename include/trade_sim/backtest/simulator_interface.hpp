// include/trade_sim/backtest/simulator_interface.hpp

#pragma once

#include <string>
#include <vector>
#include "trade_sim/backtest/backtest_config.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

class IndicatorStore;
class PriceSeriesIndex;

/**
 * @brief Abstract interface for simulation runs
 * Implementations must produce the same trade log and warnings for the same inputs
 */
class SimulatorInterface {
public:
    virtual ~SimulatorInterface() = default;

    /**
     * @brief Simulate every signal against the price index
     * @param index Price data, read-only
     * @param signals Entry signals in any order
     * @param config Run configuration, validated before any simulation work
     * @param indicators Precomputed ATR / volatility, required only by lookback sizing
     * @return Trade log sorted by exit date plus warnings, or INVALID_CONFIGURATION
     */
    virtual Result<BacktestResult> run(const PriceSeriesIndex& index,
                                       const std::vector<Signal>& signals,
                                       const BacktestConfig& config,
                                       const IndicatorStore* indicators = nullptr) const = 0;

    virtual std::string name() const = 0;
};

}  // namespace trade_sim
