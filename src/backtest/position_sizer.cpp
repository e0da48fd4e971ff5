// src/backtest/position_sizer.cpp
#include "trade_sim/backtest/position_sizer.hpp"
#include <algorithm>
#include <cmath>
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"
#include "trade_sim/data/indicator_store.hpp"

namespace trade_sim {

namespace {

Result<double> lookup_indicator(IndicatorKind kind, const SizingContext& context,
                                int window = 0) {
    if (context.indicators == nullptr) {
        return make_error<double>(ErrorCode::INSUFFICIENT_HISTORY,
                                  "No indicator provider for " +
                                      indicator_kind_to_string(kind) + " sizing",
                                  "PositionSizer");
    }
    auto value = context.indicators->get(kind, context.symbol, context.date, window);
    if (value.is_error()) {
        return value;
    }
    if (!std::isfinite(value.value()) || value.value() <= 0.0) {
        return make_error<double>(ErrorCode::INSUFFICIENT_HISTORY,
                                  "Non-positive " + indicator_kind_to_string(kind) + " for " +
                                      context.symbol + " on " +
                                      core::format_iso_date(context.date),
                                  "PositionSizer");
    }
    return value;
}

}  // namespace

SizingOutcome PositionSizer::fallback(double available_capital) {
    SizingOutcome outcome;
    outcome.desired_capital = available_capital * EqualWeightParams{}.fraction;
    return outcome;
}

double PositionSizer::kelly_fraction(const KellyCriterionParams& params) {
    if (params.avg_loss <= 0.0 || params.avg_win <= 0.0) {
        return 0.0;
    }
    double payoff = params.avg_win / params.avg_loss;
    double kelly = params.win_rate - (1.0 - params.win_rate) / payoff;
    return std::clamp(kelly, 0.0, params.fraction_cap);
}

Result<double> PositionSizer::raw_size(double available_capital, Price price,
                                       const SizingContext& context, bool& capped) const {
    switch (method()) {
        case SizingMethod::EQUAL_WEIGHT:
            return available_capital * std::get<EqualWeightParams>(params_).fraction;

        case SizingMethod::FIXED_AMOUNT: {
            double amount = std::get<FixedAmountParams>(params_).amount;
            double cap = context.allow_leverage
                             ? available_capital * (1.0 + context.max_leverage_ratio)
                             : available_capital;
            if (amount > cap) {
                capped = true;
                return cap;
            }
            return amount;
        }

        case SizingMethod::PERCENT_RISK: {
            const auto& params = std::get<PercentRiskParams>(params_);
            double stop_fraction = params.stop_loss_fraction.value_or(context.stop_loss_pct / 100.0);
            return available_capital * params.risk_fraction / stop_fraction;
        }

        case SizingMethod::VOLATILITY_TARGET: {
            const auto& params = std::get<VolatilityTargetParams>(params_);
            if (context.bars_before_entry < static_cast<size_t>(params.window)) {
                return make_error<double>(
                    ErrorCode::INSUFFICIENT_HISTORY,
                    "Volatility target needs " + std::to_string(params.window) +
                        " bars of history for " + context.symbol + ", have " +
                        std::to_string(context.bars_before_entry),
                    "PositionSizer");
            }
            auto volatility =
                lookup_indicator(IndicatorKind::REALIZED_VOLATILITY, context, params.window);
            if (volatility.is_error()) {
                return volatility;
            }
            return available_capital * params.target_volatility / volatility.value();
        }

        case SizingMethod::ATR_BASED: {
            const auto& params = std::get<AtrBasedParams>(params_);
            auto atr = lookup_indicator(IndicatorKind::ATR, context);
            if (atr.is_error()) {
                return atr;
            }
            // shares * ATR * multiplier == risk_fraction * capital
            return available_capital * params.risk_fraction * price /
                   (atr.value() * params.atr_multiplier);
        }

        case SizingMethod::KELLY_CRITERION:
            return available_capital *
                   kelly_fraction(std::get<KellyCriterionParams>(params_));

        default:
            return make_error<double>(ErrorCode::INVALID_CONFIGURATION, "Unknown sizing method",
                                      "PositionSizer");
    }
}

Result<SizingOutcome> PositionSizer::size(double available_capital, Price price,
                                          const SizingContext& context) const {
    SizingOutcome outcome;
    auto raw = raw_size(available_capital, price, context, outcome.capped);
    if (raw.is_error()) {
        return forward_error<SizingOutcome>(raw);
    }

    double desired = raw.value();
    if (!std::isfinite(desired) || desired < 0.0) {
        WARN(sizing_method_to_string(method())
             << " produced invalid size " << desired << " for " << context.symbol
             << ", no position opened");
        outcome.invalid = true;
        desired = 0.0;
    }
    outcome.desired_capital = desired;
    return outcome;
}

}  // namespace trade_sim
