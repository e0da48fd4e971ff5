// include/trade_sim/backtest/trade_simulator.hpp
#pragma once

#include "trade_sim/backtest/simulator_interface.hpp"

namespace trade_sim {

/**
 * Reference simulator.
 *
 * Instruments are processed in ascending symbol order and signals in ascending date
 * order. Each signal is entered at the close of the first bar on or after its date,
 * walked bar by bar through the exit state machine and realized before the next
 * signal is considered.
 */
class TradeSimulator : public SimulatorInterface {
public:
    Result<BacktestResult> run(const PriceSeriesIndex& index, const std::vector<Signal>& signals,
                               const BacktestConfig& config,
                               const IndicatorStore* indicators = nullptr) const override;

    std::string name() const override {
        return "TradeSimulator";
    }
};

}  // namespace trade_sim
