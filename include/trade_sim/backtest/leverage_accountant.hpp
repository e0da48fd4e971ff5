// include/trade_sim/backtest/leverage_accountant.hpp
#pragma once

#include "trade_sim/core/types.hpp"

namespace trade_sim {

/**
 * @brief Funding decision for one desired position
 */
struct Allocation {
    double committed_capital{0.0};
    double leverage_used{0.0};  // committed / cash, 0 without leverage
    bool shares_computable{false};
    bool clamped{false};  // desired capital exceeded what cash (and leverage) can fund
};

/**
 * Funds desired positions from available cash plus permitted leverage.
 *
 * leverage_used never exceeds max_leverage_ratio; requests above the limit are clamped,
 * not rejected.
 */
class LeverageAccountant {
public:
    static Allocation allocate(double desired_capital, double available_cash,
                               bool allow_leverage, double max_leverage_ratio);

    /**
     * @brief Whole units purchasable with the committed capital
     */
    static Quantity whole_shares(double committed_capital, Price price);
};

}  // namespace trade_sim
