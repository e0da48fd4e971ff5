// include/trade_sim/backtest/exit_evaluator.hpp
#pragma once

#include <optional>
#include <vector>
#include "trade_sim/core/types.hpp"

namespace trade_sim {

/**
 * @brief Stop and target prices of one position
 */
struct ExitLevels {
    Price stop_loss{0.0};
    std::optional<Price> take_profit;
};

/**
 * @brief Terminal transition of a position
 */
struct ExitDecision {
    size_t exit_index{0};
    Price exit_price{0.0};
    ExitReason reason{ExitReason::TIME_EXIT};
};

/**
 * Exit state machine shared by both simulators.
 *
 * A position is OPEN until the first of: stop touched (exit at the stop), target touched
 * (exit at the target), last bar of the holding window (exit at close), or data runs out
 * (exit at the last close). The stop is checked before the target, so a bar touching both
 * is a stop-out.
 */
class ExitEvaluator {
public:
    /**
     * @brief Long: stop = entry * (1 - sl/100), target = entry * (1 + tp/100); short mirrored
     */
    static ExitLevels compute_levels(Price entry_price, Direction direction,
                                     double stop_loss_pct, std::optional<double> take_profit_pct);

    static bool stop_touched(const PriceBar& bar, Direction direction, const ExitLevels& levels);

    static bool target_touched(const PriceBar& bar, Direction direction,
                               const ExitLevels& levels);

    /**
     * @brief Tie-break between intraday triggers
     * @return STOPPED_OUT whenever the stop was touched, TOOK_PROFIT when only the target
     *         was, empty when neither
     */
    static std::optional<ExitReason> resolve_first_hit(bool stop_hit, bool target_hit);

    /**
     * @brief Evaluate one bar of the holding window
     * @param last_window_bar True on bar entry_index + holding_period
     * @return Exit if the position closes on this bar
     */
    static std::optional<ExitDecision> step(const PriceBar& bar, size_t index,
                                            Direction direction, const ExitLevels& levels,
                                            bool last_window_bar);

    /**
     * @brief Walk bars entry_index + 1 .. min(entry_index + holding_period, last)
     * @return Exit, or empty when no bar follows the entry bar
     */
    static std::optional<ExitDecision> evaluate(const std::vector<PriceBar>& series,
                                                size_t entry_index, Direction direction,
                                                const ExitLevels& levels, int holding_period);
};

}  // namespace trade_sim
