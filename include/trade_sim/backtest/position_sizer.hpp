// include/trade_sim/backtest/position_sizer.hpp
#pragma once

#include <string>
#include <utility>
#include "trade_sim/backtest/backtest_config.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

class IndicatorStore;

/**
 * @brief Per-signal inputs the sizing methods may read
 */
struct SizingContext {
    std::string symbol;
    Timestamp date;                 // entry bar date, key for indicator lookups
    size_t bars_before_entry{0};    // history available to lookback methods
    double stop_loss_pct{5.0};
    bool allow_leverage{false};
    double max_leverage_ratio{2.0};
    const IndicatorStore* indicators{nullptr};
};

/**
 * @brief Result of one sizing decision
 */
struct SizingOutcome {
    double desired_capital{0.0};
    bool capped{false};    // fixed amount was reduced to what the account can fund
    bool invalid{false};   // raw value was negative or not finite and was replaced by zero
};

/**
 * Maps (available capital, entry price, context) to the capital a signal should commit.
 *
 * Stateless apart from its parameters, so one instance can serve every signal of a run.
 */
class PositionSizer {
public:
    explicit PositionSizer(SizingParams params) : params_(std::move(params)) {}

    /**
     * @brief Desired capital for one signal
     * @return Outcome, or INSUFFICIENT_HISTORY when a lookback method lacks its indicator.
     *         The caller falls back to equal_weight with default parameters.
     */
    Result<SizingOutcome> size(double available_capital, Price price,
                               const SizingContext& context) const;

    SizingMethod method() const {
        return sizing_method_of(params_);
    }

    /**
     * @brief Fallback used when a lookback method cannot size a signal
     */
    static SizingOutcome fallback(double available_capital);

    /**
     * @brief kelly = win_rate - (1 - win_rate) / (avg_win / avg_loss), clamped to [0, cap]
     */
    static double kelly_fraction(const KellyCriterionParams& params);

private:
    Result<double> raw_size(double available_capital, Price price, const SizingContext& context,
                            bool& capped) const;

    SizingParams params_;
};

}  // namespace trade_sim
