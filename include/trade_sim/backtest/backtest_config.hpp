// include/trade_sim/backtest/backtest_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include "trade_sim/core/config_base.hpp"
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

/**
 * @brief Position sizing methods
 */
enum class SizingMethod {
    EQUAL_WEIGHT,
    FIXED_AMOUNT,
    PERCENT_RISK,
    VOLATILITY_TARGET,
    ATR_BASED,
    KELLY_CRITERION
};

std::string sizing_method_to_string(SizingMethod method);
Result<SizingMethod> sizing_method_from_string(const std::string& method);

struct EqualWeightParams {
    double fraction{0.02};  // share of available capital per signal
};

struct FixedAmountParams {
    double amount{10000.0};
};

struct PercentRiskParams {
    double risk_fraction{0.02};               // capital lost when the stop is hit
    std::optional<double> stop_loss_fraction;  // defaults to stop_loss_pct / 100
};

struct VolatilityTargetParams {
    double target_volatility{0.15};  // annualized
    int window{20};                  // bars of history required before sizing
};

struct AtrBasedParams {
    double risk_fraction{0.02};
    double atr_multiplier{2.0};
};

struct KellyCriterionParams {
    double win_rate{0.55};
    double avg_win{0.08};
    double avg_loss{0.04};
    double fraction_cap{0.25};
};

/**
 * @brief Method-specific sizing parameters; the active alternative selects the method
 */
using SizingParams = std::variant<EqualWeightParams, FixedAmountParams, PercentRiskParams,
                                  VolatilityTargetParams, AtrBasedParams, KellyCriterionParams>;

SizingMethod sizing_method_of(const SizingParams& params);

/**
 * @brief Default parameters for a method
 */
SizingParams default_sizing_params(SizingMethod method);

nlohmann::json sizing_params_to_json(const SizingParams& params);

/**
 * @brief Build parameters for a method, keys missing from the json keep their defaults
 * @throws TradeError (INVALID_CONFIGURATION) on unknown method names
 */
SizingParams sizing_params_from_json(SizingMethod method, const nlohmann::json& j);

/**
 * @brief Configuration of one simulation run
 */
struct BacktestConfig : public ConfigBase {
    int holding_period{5};                 // max bars held after entry
    double stop_loss_pct{5.0};             // percent below (long) / above (short) entry
    std::optional<double> take_profit_pct{10.0};  // empty disables the target
    double initial_capital{100000.0};
    SizingParams sizing{EqualWeightParams{}};
    Direction signal_type{Direction::LONG};  // direction for signals that carry none
    bool allow_leverage{false};
    double max_leverage_ratio{2.0};
    bool one_trade_per_instrument{false};

    std::string version{"1.0.0"};

    SizingMethod sizing_method() const {
        return sizing_method_of(sizing);
    }

    /**
     * @brief Check every field before any simulation work starts
     * @return INVALID_CONFIGURATION naming the first offending field
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace trade_sim
