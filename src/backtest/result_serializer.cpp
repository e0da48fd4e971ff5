// src/backtest/result_serializer.cpp
#include "trade_sim/backtest/result_serializer.hpp"
#include "trade_sim/core/time_utils.hpp"

namespace trade_sim {

nlohmann::json ResultSerializer::trade_to_json(const Trade& trade) {
    nlohmann::json j;
    j["symbol"] = trade.symbol;
    j["direction"] = direction_to_string(trade.direction);
    j["signal_date"] = core::format_iso_date(trade.signal_date);
    j["entry_date"] = core::format_iso_date(trade.entry_date);
    j["exit_date"] = core::format_iso_date(trade.exit_date);
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price;
    j["shares"] = trade.shares;
    j["position_value"] = trade.position_value;
    j["pnl_amount"] = trade.pnl_amount;
    j["pnl_percent"] = trade.pnl_percent;
    j["days_held"] = trade.days_held;
    j["exit_reason"] = exit_reason_to_string(trade.exit_reason);
    j["leverage_used"] = trade.leverage_used;
    j["portfolio_value_after"] = trade.portfolio_value_after;
    return j;
}

nlohmann::json ResultSerializer::to_json(const BacktestResult& result) {
    nlohmann::json j;
    j["trades"] = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        j["trades"].push_back(trade_to_json(trade));
    }
    j["warnings"] = result.warnings;
    return j;
}

nlohmann::json ResultSerializer::to_json(const BacktestResult& result,
                                         const PerformanceMetrics& metrics) {
    nlohmann::json j = to_json(result);
    j["metrics"] = metrics.to_json();
    return j;
}

}  // namespace trade_sim
