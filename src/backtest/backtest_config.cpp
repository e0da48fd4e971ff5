// src/backtest/backtest_config.cpp
#include "trade_sim/backtest/backtest_config.hpp"
#include <cmath>

namespace trade_sim {

namespace {

Result<void> config_error(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_CONFIGURATION, message, "BacktestConfig");
}

bool positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

bool is_fraction(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

Result<void> validate_sizing(const SizingParams& sizing) {
    if (auto ew = std::get_if<EqualWeightParams>(&sizing)) {
        if (!positive(ew->fraction) || ew->fraction > 1.0)
            return config_error("equal_weight fraction must be in (0, 1]");
    } else if (auto fa = std::get_if<FixedAmountParams>(&sizing)) {
        if (!positive(fa->amount))
            return config_error("fixed_amount amount must be > 0");
    } else if (auto pr = std::get_if<PercentRiskParams>(&sizing)) {
        if (!positive(pr->risk_fraction) || pr->risk_fraction > 1.0)
            return config_error("percent_risk risk_fraction must be in (0, 1]");
        if (pr->stop_loss_fraction && !positive(*pr->stop_loss_fraction))
            return config_error("percent_risk stop_loss_fraction must be > 0");
    } else if (auto vt = std::get_if<VolatilityTargetParams>(&sizing)) {
        if (!positive(vt->target_volatility))
            return config_error("volatility_target target_volatility must be > 0");
        if (vt->window < 2)
            return config_error("volatility_target window must be >= 2");
    } else if (auto ab = std::get_if<AtrBasedParams>(&sizing)) {
        if (!positive(ab->risk_fraction) || ab->risk_fraction > 1.0)
            return config_error("atr_based risk_fraction must be in (0, 1]");
        if (!positive(ab->atr_multiplier))
            return config_error("atr_based atr_multiplier must be > 0");
    } else if (auto kc = std::get_if<KellyCriterionParams>(&sizing)) {
        if (!is_fraction(kc->win_rate))
            return config_error("kelly_criterion win_rate must be in [0, 1]");
        if (!positive(kc->avg_win) || !positive(kc->avg_loss))
            return config_error("kelly_criterion avg_win and avg_loss must be > 0");
        if (!is_fraction(kc->fraction_cap))
            return config_error("kelly_criterion fraction_cap must be in [0, 1]");
    }
    return Result<void>();
}

}  // namespace

std::string sizing_method_to_string(SizingMethod method) {
    switch (method) {
        case SizingMethod::EQUAL_WEIGHT:
            return "equal_weight";
        case SizingMethod::FIXED_AMOUNT:
            return "fixed_amount";
        case SizingMethod::PERCENT_RISK:
            return "percent_risk";
        case SizingMethod::VOLATILITY_TARGET:
            return "volatility_target";
        case SizingMethod::ATR_BASED:
            return "atr_based";
        case SizingMethod::KELLY_CRITERION:
            return "kelly_criterion";
        default:
            return "unknown";
    }
}

Result<SizingMethod> sizing_method_from_string(const std::string& method) {
    if (method == "equal_weight")
        return SizingMethod::EQUAL_WEIGHT;
    if (method == "fixed_amount")
        return SizingMethod::FIXED_AMOUNT;
    if (method == "percent_risk")
        return SizingMethod::PERCENT_RISK;
    if (method == "volatility_target")
        return SizingMethod::VOLATILITY_TARGET;
    if (method == "atr_based")
        return SizingMethod::ATR_BASED;
    if (method == "kelly_criterion")
        return SizingMethod::KELLY_CRITERION;
    return make_error<SizingMethod>(ErrorCode::INVALID_CONFIGURATION,
                                    "Unknown sizing method: " + method, "BacktestConfig");
}

SizingMethod sizing_method_of(const SizingParams& params) {
    // alternatives are declared in SizingMethod order
    return static_cast<SizingMethod>(params.index());
}

SizingParams default_sizing_params(SizingMethod method) {
    switch (method) {
        case SizingMethod::FIXED_AMOUNT:
            return FixedAmountParams{};
        case SizingMethod::PERCENT_RISK:
            return PercentRiskParams{};
        case SizingMethod::VOLATILITY_TARGET:
            return VolatilityTargetParams{};
        case SizingMethod::ATR_BASED:
            return AtrBasedParams{};
        case SizingMethod::KELLY_CRITERION:
            return KellyCriterionParams{};
        case SizingMethod::EQUAL_WEIGHT:
        default:
            return EqualWeightParams{};
    }
}

nlohmann::json sizing_params_to_json(const SizingParams& params) {
    nlohmann::json j = nlohmann::json::object();
    if (auto ew = std::get_if<EqualWeightParams>(&params)) {
        j["fraction"] = ew->fraction;
    } else if (auto fa = std::get_if<FixedAmountParams>(&params)) {
        j["amount"] = fa->amount;
    } else if (auto pr = std::get_if<PercentRiskParams>(&params)) {
        j["risk_fraction"] = pr->risk_fraction;
        if (pr->stop_loss_fraction)
            j["stop_loss_fraction"] = *pr->stop_loss_fraction;
    } else if (auto vt = std::get_if<VolatilityTargetParams>(&params)) {
        j["target_volatility"] = vt->target_volatility;
        j["window"] = vt->window;
    } else if (auto ab = std::get_if<AtrBasedParams>(&params)) {
        j["risk_fraction"] = ab->risk_fraction;
        j["atr_multiplier"] = ab->atr_multiplier;
    } else if (auto kc = std::get_if<KellyCriterionParams>(&params)) {
        j["win_rate"] = kc->win_rate;
        j["avg_win"] = kc->avg_win;
        j["avg_loss"] = kc->avg_loss;
        j["fraction_cap"] = kc->fraction_cap;
    }
    return j;
}

SizingParams sizing_params_from_json(SizingMethod method, const nlohmann::json& j) {
    SizingParams params = default_sizing_params(method);
    if (!j.is_object()) {
        return params;
    }

    if (auto ew = std::get_if<EqualWeightParams>(&params)) {
        if (j.contains("fraction"))
            ew->fraction = j.at("fraction").get<double>();
    } else if (auto fa = std::get_if<FixedAmountParams>(&params)) {
        if (j.contains("amount"))
            fa->amount = j.at("amount").get<double>();
    } else if (auto pr = std::get_if<PercentRiskParams>(&params)) {
        if (j.contains("risk_fraction"))
            pr->risk_fraction = j.at("risk_fraction").get<double>();
        if (j.contains("stop_loss_fraction") && !j.at("stop_loss_fraction").is_null())
            pr->stop_loss_fraction = j.at("stop_loss_fraction").get<double>();
    } else if (auto vt = std::get_if<VolatilityTargetParams>(&params)) {
        if (j.contains("target_volatility"))
            vt->target_volatility = j.at("target_volatility").get<double>();
        if (j.contains("window"))
            vt->window = j.at("window").get<int>();
    } else if (auto ab = std::get_if<AtrBasedParams>(&params)) {
        if (j.contains("risk_fraction"))
            ab->risk_fraction = j.at("risk_fraction").get<double>();
        if (j.contains("atr_multiplier"))
            ab->atr_multiplier = j.at("atr_multiplier").get<double>();
    } else if (auto kc = std::get_if<KellyCriterionParams>(&params)) {
        if (j.contains("win_rate"))
            kc->win_rate = j.at("win_rate").get<double>();
        if (j.contains("avg_win"))
            kc->avg_win = j.at("avg_win").get<double>();
        if (j.contains("avg_loss"))
            kc->avg_loss = j.at("avg_loss").get<double>();
        if (j.contains("fraction_cap"))
            kc->fraction_cap = j.at("fraction_cap").get<double>();
    }
    return params;
}

Result<void> BacktestConfig::validate() const {
    if (holding_period <= 0)
        return config_error("holding_period must be > 0, got " + std::to_string(holding_period));
    if (!positive(stop_loss_pct) || stop_loss_pct >= 100.0)
        return config_error("stop_loss_pct must be in (0, 100), got " +
                            std::to_string(stop_loss_pct));
    if (take_profit_pct && !positive(*take_profit_pct))
        return config_error("take_profit_pct must be > 0 when set, got " +
                            std::to_string(*take_profit_pct));
    if (!positive(initial_capital))
        return config_error("initial_capital must be > 0");
    if (!std::isfinite(max_leverage_ratio) || max_leverage_ratio < 1.0)
        return config_error("max_leverage_ratio must be >= 1.0, got " +
                            std::to_string(max_leverage_ratio));
    return validate_sizing(sizing);
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["holding_period"] = holding_period;
    j["stop_loss_pct"] = stop_loss_pct;
    if (take_profit_pct) {
        j["take_profit_pct"] = *take_profit_pct;
    } else {
        j["take_profit_pct"] = nullptr;
    }
    j["initial_capital"] = initial_capital;
    j["sizing_method"] = sizing_method_to_string(sizing_method());
    j["sizing_params"] = sizing_params_to_json(sizing);
    j["signal_type"] = direction_to_string(signal_type);
    j["allow_leverage"] = allow_leverage;
    j["max_leverage_ratio"] = max_leverage_ratio;
    j["one_trade_per_instrument"] = one_trade_per_instrument;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("holding_period"))
        holding_period = j.at("holding_period").get<int>();
    if (j.contains("stop_loss_pct"))
        stop_loss_pct = j.at("stop_loss_pct").get<double>();
    if (j.contains("take_profit_pct")) {
        if (j.at("take_profit_pct").is_null()) {
            take_profit_pct.reset();
        } else {
            take_profit_pct = j.at("take_profit_pct").get<double>();
        }
    }
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("sizing_method")) {
        auto method = sizing_method_from_string(j.at("sizing_method").get<std::string>());
        if (method.is_error()) {
            throw *method.error();
        }
        sizing = sizing_params_from_json(method.value(), j.value("sizing_params",
                                                                 nlohmann::json::object()));
    }
    if (j.contains("signal_type")) {
        std::string type = j.at("signal_type").get<std::string>();
        if (type == "long") {
            signal_type = Direction::LONG;
        } else if (type == "short") {
            signal_type = Direction::SHORT;
        } else {
            throw TradeError(ErrorCode::INVALID_CONFIGURATION, "Unknown signal_type: " + type,
                             "BacktestConfig");
        }
    }
    if (j.contains("allow_leverage"))
        allow_leverage = j.at("allow_leverage").get<bool>();
    if (j.contains("max_leverage_ratio"))
        max_leverage_ratio = j.at("max_leverage_ratio").get<double>();
    if (j.contains("one_trade_per_instrument"))
        one_trade_per_instrument = j.at("one_trade_per_instrument").get<bool>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace trade_sim
