// src/backtest/leverage_accountant.cpp
#include "trade_sim/backtest/leverage_accountant.hpp"
#include <algorithm>
#include <cmath>

namespace trade_sim {

Allocation LeverageAccountant::allocate(double desired_capital, double available_cash,
                                        bool allow_leverage, double max_leverage_ratio) {
    Allocation allocation;
    if (!(available_cash > 0.0) || !(desired_capital > 0.0)) {
        return allocation;
    }

    double limit = allow_leverage ? available_cash * std::max(1.0, max_leverage_ratio)
                                  : available_cash;
    allocation.clamped = desired_capital > limit;
    allocation.committed_capital = std::min(desired_capital, limit);
    if (allow_leverage) {
        // rounding in committed / cash must not push the ratio past the limit
        allocation.leverage_used =
            std::min(allocation.committed_capital / available_cash, max_leverage_ratio);
    }
    allocation.shares_computable = true;
    return allocation;
}

Quantity LeverageAccountant::whole_shares(double committed_capital, Price price) {
    if (!(price > 0.0) || !(committed_capital > 0.0)) {
        return 0.0;
    }
    return std::floor(committed_capital / price);
}

}  // namespace trade_sim
