// include/trade_sim/backtest/performance_aggregator.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_sim/core/types.hpp"

namespace trade_sim {

/**
 * @brief Summary statistics of one trade log
 */
struct PerformanceMetrics {
    int total_trades{0};
    double win_rate_pct{0.0};
    double average_win_pct{0.0};
    double average_loss_pct{0.0};  // <= 0
    double total_return_pct{0.0};
    double max_drawdown_pct{0.0};  // <= 0
    double profit_factor{0.0};
    double sharpe_ratio{0.0};
    double calmar_ratio{0.0};
    double average_holding_period{0.0};  // bars
    double average_position_size{0.0};
    double avg_leverage_used{0.0};
    double max_leverage_used{0.0};

    double total_pnl{0.0};
    double average_win_amount{0.0};
    double average_loss_amount{0.0};
    double max_position_size{0.0};
    double min_position_size{0.0};
    double leverage_risk_score{0.0};  // % of trades with leverage above 2

    /**
     * @brief Fixed-key view, e.g. "Win Rate (%)" -> 55.0
     */
    std::map<std::string, double> to_map() const;

    nlohmann::json to_json() const;
};

/**
 * Pure stateless calculation of trade log statistics.
 *
 * - Winners are trades with pnl_percent > 0, everything else is a loser
 * - Equity curve is initial capital followed by initial + cumulative P&L in log order
 * - Profit factor with no losing P&L is 999.0 if anything was won, else 0
 * - Sharpe uses per-trade returns pnl / (portfolio value before the trade),
 *   (mean - rf/252) / sample std, annualized by sqrt(252); 0 below two trades
 */
class PerformanceAggregator {
public:
    static constexpr double PROFIT_FACTOR_CAP = 999.0;
    static constexpr double HIGH_LEVERAGE_THRESHOLD = 2.0;

    explicit PerformanceAggregator(double risk_free_rate = 0.0)
        : risk_free_rate_(risk_free_rate) {}

    /**
     * @brief Compute every metric; an empty log gives all zeros
     */
    PerformanceMetrics compute(const std::vector<Trade>& trades, double initial_capital) const;

    // ========== Building Blocks ==========

    std::vector<double> equity_curve(const std::vector<Trade>& trades,
                                     double initial_capital) const;

    /**
     * @return Largest peak-to-trough decline in percent, <= 0
     */
    double max_drawdown_pct(const std::vector<double>& equity_curve) const;

    double profit_factor(const std::vector<Trade>& trades) const;

    std::vector<double> trade_returns(const std::vector<Trade>& trades) const;

    double sharpe_ratio(const std::vector<double>& returns) const;

    double calmar_ratio(double total_return_pct, double max_drawdown_pct) const;

private:
    double risk_free_rate_;
};

}  // namespace trade_sim
