// src/backtest/performance_aggregator.cpp
#include "trade_sim/backtest/performance_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace trade_sim {

std::map<std::string, double> PerformanceMetrics::to_map() const {
    return {
        {"Total Trades", static_cast<double>(total_trades)},
        {"Win Rate (%)", win_rate_pct},
        {"Average Win (%)", average_win_pct},
        {"Average Loss (%)", average_loss_pct},
        {"Total Return (%)", total_return_pct},
        {"Max Drawdown (%)", max_drawdown_pct},
        {"Profit Factor", profit_factor},
        {"Sharpe Ratio", sharpe_ratio},
        {"Calmar Ratio", calmar_ratio},
        {"Average Holding Period (days)", average_holding_period},
        {"Average Position Size ($)", average_position_size},
        {"Avg Leverage Used", avg_leverage_used},
        {"Max Leverage Used", max_leverage_used},
        {"Total P&L ($)", total_pnl},
        {"Average Win ($)", average_win_amount},
        {"Average Loss ($)", average_loss_amount},
        {"Max Position Size ($)", max_position_size},
        {"Min Position Size ($)", min_position_size},
        {"Leverage Risk Score", leverage_risk_score},
    };
}

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j;
    for (const auto& [key, value] : to_map()) {
        j[key] = value;
    }
    return j;
}

std::vector<double> PerformanceAggregator::equity_curve(const std::vector<Trade>& trades,
                                                        double initial_capital) const {
    std::vector<double> curve;
    curve.reserve(trades.size() + 1);
    curve.push_back(initial_capital);
    double equity = initial_capital;
    for (const auto& trade : trades) {
        equity += trade.pnl_amount;
        curve.push_back(equity);
    }
    return curve;
}

double PerformanceAggregator::max_drawdown_pct(const std::vector<double>& equity_curve) const {
    if (equity_curve.empty()) {
        return 0.0;
    }
    double peak = equity_curve.front();
    double max_dd = 0.0;
    for (double value : equity_curve) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            max_dd = std::min(max_dd, (value - peak) / peak * 100.0);
        }
    }
    return max_dd;
}

double PerformanceAggregator::profit_factor(const std::vector<Trade>& trades) const {
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    for (const auto& trade : trades) {
        if (trade.pnl_percent > 0.0) {
            gross_profit += trade.pnl_amount;
        } else {
            gross_loss += trade.pnl_amount;
        }
    }
    if (gross_loss == 0.0) {
        return gross_profit > 0.0 ? PROFIT_FACTOR_CAP : 0.0;
    }
    return std::min(gross_profit / std::abs(gross_loss), PROFIT_FACTOR_CAP);
}

std::vector<double> PerformanceAggregator::trade_returns(const std::vector<Trade>& trades) const {
    std::vector<double> returns;
    returns.reserve(trades.size());
    for (const auto& trade : trades) {
        double before = trade.portfolio_value_after - trade.pnl_amount;
        returns.push_back(before > 0.0 ? trade.pnl_amount / before : 0.0);
    }
    return returns;
}

double PerformanceAggregator::sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }
    double std_dev = std::sqrt(sq_sum / (returns.size() - 1));
    if (std_dev <= 0.0 || !std::isfinite(std_dev)) {
        return 0.0;
    }

    return (mean - risk_free_rate_ / 252.0) / std_dev * std::sqrt(252.0);
}

double PerformanceAggregator::calmar_ratio(double total_return_pct,
                                           double max_drawdown_pct) const {
    if (max_drawdown_pct == 0.0) {
        return 0.0;
    }
    return total_return_pct / std::abs(max_drawdown_pct);
}

PerformanceMetrics PerformanceAggregator::compute(const std::vector<Trade>& trades,
                                                  double initial_capital) const {
    PerformanceMetrics metrics;
    if (trades.empty()) {
        return metrics;
    }

    const double n = static_cast<double>(trades.size());
    metrics.total_trades = static_cast<int>(trades.size());

    double win_pct_sum = 0.0, loss_pct_sum = 0.0;
    double win_amount_sum = 0.0, loss_amount_sum = 0.0;
    int winners = 0, losers = 0, high_leverage = 0;
    double holding_sum = 0.0, position_sum = 0.0, leverage_sum = 0.0;
    metrics.max_position_size = trades.front().position_value;
    metrics.min_position_size = trades.front().position_value;

    for (const auto& trade : trades) {
        if (trade.pnl_percent > 0.0) {
            ++winners;
            win_pct_sum += trade.pnl_percent;
            win_amount_sum += trade.pnl_amount;
        } else {
            ++losers;
            loss_pct_sum += trade.pnl_percent;
            loss_amount_sum += trade.pnl_amount;
        }
        metrics.total_pnl += trade.pnl_amount;
        holding_sum += trade.days_held;
        position_sum += trade.position_value;
        leverage_sum += trade.leverage_used;
        metrics.max_leverage_used = std::max(metrics.max_leverage_used, trade.leverage_used);
        metrics.max_position_size = std::max(metrics.max_position_size, trade.position_value);
        metrics.min_position_size = std::min(metrics.min_position_size, trade.position_value);
        if (trade.leverage_used > HIGH_LEVERAGE_THRESHOLD) {
            ++high_leverage;
        }
    }

    metrics.win_rate_pct = winners / n * 100.0;
    metrics.average_win_pct = winners > 0 ? win_pct_sum / winners : 0.0;
    metrics.average_loss_pct = losers > 0 ? loss_pct_sum / losers : 0.0;
    metrics.average_win_amount = winners > 0 ? win_amount_sum / winners : 0.0;
    metrics.average_loss_amount = losers > 0 ? loss_amount_sum / losers : 0.0;
    metrics.average_holding_period = holding_sum / n;
    metrics.average_position_size = position_sum / n;
    metrics.avg_leverage_used = leverage_sum / n;
    metrics.leverage_risk_score = high_leverage / n * 100.0;

    if (initial_capital > 0.0) {
        metrics.total_return_pct = metrics.total_pnl / initial_capital * 100.0;
    }
    metrics.max_drawdown_pct = max_drawdown_pct(equity_curve(trades, initial_capital));
    metrics.profit_factor = profit_factor(trades);
    metrics.sharpe_ratio = sharpe_ratio(trade_returns(trades));
    metrics.calmar_ratio = calmar_ratio(metrics.total_return_pct, metrics.max_drawdown_pct);
    return metrics;
}

}  // namespace trade_sim
