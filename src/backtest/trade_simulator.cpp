// src/backtest/trade_simulator.cpp
#include "trade_sim/backtest/trade_simulator.hpp"
#include "trade_sim/backtest/exit_evaluator.hpp"
#include "trade_sim/backtest/simulation_ledger.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"
#include "trade_sim/data/price_series_index.hpp"

namespace trade_sim {

Result<BacktestResult> TradeSimulator::run(const PriceSeriesIndex& index,
                                           const std::vector<Signal>& signals,
                                           const BacktestConfig& config,
                                           const IndicatorStore* indicators) const {
    Logger::register_component(name());

    auto valid = config.validate();
    if (valid.is_error()) {
        ERROR("Rejected configuration: " << valid.error()->what());
        return forward_error<BacktestResult>(valid, name());
    }

    INFO("Simulating " << signals.size() << " signals, holding period " << config.holding_period
                       << ", sizing " << sizing_method_to_string(config.sizing_method()));

    try {
        SimulationLedger ledger(config, indicators);

        for (const auto& [symbol, symbol_signals] : SimulationLedger::group_by_symbol(signals)) {
            const auto& series = index.get_series(symbol);

            for (const auto& signal : symbol_signals) {
                if (ledger.blocked_by_previous_trade(signal)) {
                    continue;
                }

                auto entry_index = index.index_on_or_after(symbol, signal.date);
                if (!entry_index) {
                    ledger.skip_no_data(signal, "no price data on or after signal date");
                    continue;
                }
                if (*entry_index + 1 >= series.size()) {
                    ledger.skip_no_data(signal, "no bar after entry on " +
                                                    core::format_iso_date(
                                                        series[*entry_index].date));
                    continue;
                }

                auto position = ledger.open(signal, series, *entry_index);
                if (!position) {
                    continue;
                }

                ExitLevels levels{position->stop_loss_price, position->take_profit_price};
                auto exit = ExitEvaluator::evaluate(series, position->entry_index,
                                                    position->direction, levels,
                                                    config.holding_period);
                if (!exit) {
                    return make_error<BacktestResult>(
                        ErrorCode::UNKNOWN_ERROR,
                        "Position on " + symbol + " opened without a forward bar", name());
                }
                ledger.close(*position, series, *exit);
            }
        }

        BacktestResult result = ledger.finish();
        INFO("Simulation finished: " << result.trades.size() << " trades, "
                                     << result.warnings.size() << " warnings");
        return result;

    } catch (const std::exception& e) {
        ERROR("Simulation failed: " << e.what());
        return make_error<BacktestResult>(ErrorCode::UNKNOWN_ERROR,
                                          std::string("Simulation failed: ") + e.what(), name());
    }
}

}  // namespace trade_sim
