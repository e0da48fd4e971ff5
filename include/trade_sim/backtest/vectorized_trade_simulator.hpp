// include/trade_sim/backtest/vectorized_trade_simulator.hpp
#pragma once

#include <optional>
#include <vector>
#include "trade_sim/backtest/exit_evaluator.hpp"
#include "trade_sim/backtest/simulator_interface.hpp"

namespace trade_sim {

/**
 * Batch simulator with the same contract as TradeSimulator.
 *
 * Exits do not depend on capital, so for each instrument the entry bars, stop/target
 * levels and the first triggering bar of every signal are resolved at once with Eigen
 * array operations over (signals x holding_period) price windows. Only the capital
 * recurrence (sizing on current equity, one-trade gating) remains a scalar scan.
 */
class VectorizedTradeSimulator : public SimulatorInterface {
public:
    Result<BacktestResult> run(const PriceSeriesIndex& index, const std::vector<Signal>& signals,
                               const BacktestConfig& config,
                               const IndicatorStore* indicators = nullptr) const override;

    std::string name() const override {
        return "VectorizedTradeSimulator";
    }

    /**
     * @brief Resolve the exits of many positions on one instrument
     * @param series Bars of the instrument
     * @param entry_indices Entry bar per position; each must have a following bar
     * @param directions Direction per position
     * @return One exit per position, in input order
     */
    static std::vector<ExitDecision> evaluate_batch(const std::vector<PriceBar>& series,
                                                    const std::vector<size_t>& entry_indices,
                                                    const std::vector<Direction>& directions,
                                                    double stop_loss_pct,
                                                    std::optional<double> take_profit_pct,
                                                    int holding_period);
};

}  // namespace trade_sim
