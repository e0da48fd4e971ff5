// src/backtest/exit_evaluator.cpp
#include "trade_sim/backtest/exit_evaluator.hpp"
#include <algorithm>

namespace trade_sim {

ExitLevels ExitEvaluator::compute_levels(Price entry_price, Direction direction,
                                         double stop_loss_pct,
                                         std::optional<double> take_profit_pct) {
    ExitLevels levels;
    if (direction == Direction::LONG) {
        levels.stop_loss = entry_price * (1.0 - stop_loss_pct / 100.0);
        if (take_profit_pct) {
            levels.take_profit = entry_price * (1.0 + *take_profit_pct / 100.0);
        }
    } else {
        levels.stop_loss = entry_price * (1.0 + stop_loss_pct / 100.0);
        if (take_profit_pct) {
            levels.take_profit = entry_price * (1.0 - *take_profit_pct / 100.0);
        }
    }
    return levels;
}

bool ExitEvaluator::stop_touched(const PriceBar& bar, Direction direction,
                                 const ExitLevels& levels) {
    return direction == Direction::LONG ? bar.low <= levels.stop_loss
                                        : bar.high >= levels.stop_loss;
}

bool ExitEvaluator::target_touched(const PriceBar& bar, Direction direction,
                                   const ExitLevels& levels) {
    if (!levels.take_profit) {
        return false;
    }
    return direction == Direction::LONG ? bar.high >= *levels.take_profit
                                        : bar.low <= *levels.take_profit;
}

std::optional<ExitReason> ExitEvaluator::resolve_first_hit(bool stop_hit, bool target_hit) {
    if (stop_hit) {
        return ExitReason::STOPPED_OUT;
    }
    if (target_hit) {
        return ExitReason::TOOK_PROFIT;
    }
    return std::nullopt;
}

std::optional<ExitDecision> ExitEvaluator::step(const PriceBar& bar, size_t index,
                                                Direction direction, const ExitLevels& levels,
                                                bool last_window_bar) {
    auto hit = resolve_first_hit(stop_touched(bar, direction, levels),
                                 target_touched(bar, direction, levels));
    if (hit) {
        ExitDecision decision;
        decision.exit_index = index;
        decision.reason = *hit;
        decision.exit_price =
            *hit == ExitReason::STOPPED_OUT ? levels.stop_loss : *levels.take_profit;
        return decision;
    }

    if (last_window_bar) {
        ExitDecision decision;
        decision.exit_index = index;
        decision.exit_price = bar.close;
        decision.reason = ExitReason::TIME_EXIT;
        return decision;
    }
    return std::nullopt;
}

std::optional<ExitDecision> ExitEvaluator::evaluate(const std::vector<PriceBar>& series,
                                                    size_t entry_index, Direction direction,
                                                    const ExitLevels& levels,
                                                    int holding_period) {
    if (holding_period <= 0 || entry_index + 1 >= series.size()) {
        return std::nullopt;
    }

    const size_t window_end = entry_index + static_cast<size_t>(holding_period);
    const size_t last = std::min(window_end, series.size() - 1);
    for (size_t i = entry_index + 1; i <= last; ++i) {
        auto decision = step(series[i], i, direction, levels, i == window_end);
        if (decision) {
            return decision;
        }
    }

    // window runs past the data
    ExitDecision decision;
    decision.exit_index = last;
    decision.exit_price = series[last].close;
    decision.reason = ExitReason::END_OF_DATA;
    return decision;
}

}  // namespace trade_sim
