// src/backtest/simulation_ledger.cpp
#include "trade_sim/backtest/simulation_ledger.hpp"
#include <algorithm>
#include "trade_sim/backtest/leverage_accountant.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"

namespace trade_sim {

SimulationLedger::SimulationLedger(const BacktestConfig& config, const IndicatorStore* indicators)
    : config_(config),
      indicators_(indicators),
      sizer_(config.sizing),
      portfolio_(config.initial_capital) {}

std::map<std::string, std::vector<Signal>> SimulationLedger::group_by_symbol(
    const std::vector<Signal>& signals) {
    std::map<std::string, std::vector<Signal>> grouped;
    for (const auto& signal : signals) {
        grouped[signal.symbol].push_back(signal);
    }
    for (auto& entry : grouped) {
        std::stable_sort(entry.second.begin(), entry.second.end(),
                         [](const Signal& a, const Signal& b) { return a.date < b.date; });
    }
    return grouped;
}

std::string SimulationLedger::tag(const Signal& signal) const {
    return signal.symbol + " " + core::format_iso_date(signal.date);
}

void SimulationLedger::warn(const std::string& message) {
    WARN(message);
    result_.warnings.push_back(message);
}

bool SimulationLedger::blocked_by_previous_trade(const Signal& signal) {
    if (!config_.one_trade_per_instrument) {
        return false;
    }
    auto it = last_exit_.find(signal.symbol);
    if (it == last_exit_.end() || signal.date > it->second) {
        return false;
    }
    warn(tag(signal) + ": skipped, previous trade open until " +
         core::format_iso_date(it->second));
    return true;
}

void SimulationLedger::skip_no_data(const Signal& signal, const std::string& reason) {
    warn(tag(signal) + ": " + reason + ", no trade");
}

std::optional<OpenPosition> SimulationLedger::open(const Signal& signal,
                                                   const std::vector<PriceBar>& series,
                                                   size_t entry_index) {
    const PriceBar& entry_bar = series[entry_index];
    const Price price = entry_bar.close;
    const Direction direction = direction_of(signal);

    SizingContext context;
    context.symbol = signal.symbol;
    context.date = entry_bar.date;
    context.bars_before_entry = entry_index;
    context.stop_loss_pct = config_.stop_loss_pct;
    context.allow_leverage = config_.allow_leverage;
    context.max_leverage_ratio = config_.max_leverage_ratio;
    context.indicators = indicators_;

    SizingOutcome outcome;
    auto sized = sizer_.size(portfolio_.equity, price, context);
    if (sized.is_error()) {
        if (sized.error()->code() != ErrorCode::INSUFFICIENT_HISTORY) {
            warn(tag(signal) + ": sizing failed (" + sized.error()->what() + "), no trade");
            return std::nullopt;
        }
        warn(tag(signal) + ": " + sizing_method_to_string(sizer_.method()) +
             " sizing unavailable (" + sized.error()->what() + "), fell back to equal_weight");
        outcome = PositionSizer::fallback(portfolio_.equity);
    } else {
        outcome = sized.value();
    }

    if (outcome.invalid) {
        warn(tag(signal) + ": " + sizing_method_to_string(sizer_.method()) +
             " produced an invalid size, no position opened");
        return std::nullopt;
    }
    if (outcome.capped) {
        warn(tag(signal) + ": fixed amount capped at " +
             std::to_string(outcome.desired_capital));
    }

    Allocation allocation =
        LeverageAccountant::allocate(outcome.desired_capital, portfolio_.cash,
                                     config_.allow_leverage, config_.max_leverage_ratio);
    if (!allocation.shares_computable) {
        warn(tag(signal) + ": no capital to commit (desired " +
             std::to_string(outcome.desired_capital) + ", cash " +
             std::to_string(portfolio_.cash) + "), skipped");
        return std::nullopt;
    }
    if (allocation.clamped) {
        warn(tag(signal) + ": desired capital " + std::to_string(outcome.desired_capital) +
             " exceeds funding limit, clamped to " +
             std::to_string(allocation.committed_capital));
    }

    Quantity shares = LeverageAccountant::whole_shares(allocation.committed_capital, price);
    if (shares <= 0.0) {
        warn(tag(signal) + ": committed capital " +
             std::to_string(allocation.committed_capital) + " buys no whole unit at " +
             std::to_string(price) + ", skipped");
        return std::nullopt;
    }

    ExitLevels levels = ExitEvaluator::compute_levels(price, direction, config_.stop_loss_pct,
                                                      config_.take_profit_pct);

    OpenPosition position;
    position.symbol = signal.symbol;
    position.direction = direction;
    position.signal_date = signal.date;
    position.entry_date = entry_bar.date;
    position.entry_index = entry_index;
    position.max_exit_index =
        std::min(entry_index + static_cast<size_t>(config_.holding_period), series.size() - 1);
    position.entry_price = price;
    position.shares = shares;
    position.capital_committed = allocation.committed_capital;
    position.leverage_used = allocation.leverage_used;
    position.stop_loss_price = levels.stop_loss;
    position.take_profit_price = levels.take_profit;

    portfolio_.cash -= shares * price;

    DEBUG("Opened " << direction_to_string(direction) << " " << signal.symbol << " "
                    << shares << " @ " << price << " on "
                    << core::format_iso_date(entry_bar.date));
    return position;
}

const Trade& SimulationLedger::close(const OpenPosition& position,
                                     const std::vector<PriceBar>& series,
                                     const ExitDecision& exit) {
    const double sign = position.direction == Direction::LONG ? 1.0 : -1.0;

    Trade trade;
    trade.symbol = position.symbol;
    trade.direction = position.direction;
    trade.signal_date = position.signal_date;
    trade.entry_date = position.entry_date;
    trade.exit_date = series[exit.exit_index].date;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit.exit_price;
    trade.shares = position.shares;
    trade.position_value = position.shares * position.entry_price;
    trade.pnl_amount = sign * (exit.exit_price - position.entry_price) * position.shares;
    trade.pnl_percent =
        sign * (exit.exit_price - position.entry_price) / position.entry_price * 100.0;
    trade.days_held = static_cast<int>(exit.exit_index - position.entry_index);
    trade.exit_reason = exit.reason;
    trade.leverage_used = position.leverage_used;

    portfolio_.cash += trade.position_value + trade.pnl_amount;
    portfolio_.equity += trade.pnl_amount;
    portfolio_.peak_equity = std::max(portfolio_.peak_equity, portfolio_.equity);
    trade.portfolio_value_after = portfolio_.equity;

    last_exit_[position.symbol] = trade.exit_date;

    DEBUG("Closed " << trade.symbol << " " << exit_reason_to_string(trade.exit_reason) << " @ "
                    << trade.exit_price << " pnl " << trade.pnl_amount);

    result_.trades.push_back(std::move(trade));
    return result_.trades.back();
}

BacktestResult SimulationLedger::finish() {
    std::stable_sort(result_.trades.begin(), result_.trades.end(),
                     [](const Trade& a, const Trade& b) { return a.exit_date < b.exit_date; });
    return std::move(result_);
}

}  // namespace trade_sim
