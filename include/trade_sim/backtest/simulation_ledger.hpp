// include/trade_sim/backtest/simulation_ledger.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "trade_sim/backtest/backtest_config.hpp"
#include "trade_sim/backtest/exit_evaluator.hpp"
#include "trade_sim/backtest/position_sizer.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

class IndicatorStore;

/**
 * Capital bookkeeping of one simulation run.
 *
 * Owns the PortfolioState, the trade log and the warnings. Both simulators route every
 * open and close through one ledger type so sizing, funding, gating and P&L realization
 * cannot drift apart between them. Not thread-safe; one ledger per run.
 */
class SimulationLedger {
public:
    SimulationLedger(const BacktestConfig& config, const IndicatorStore* indicators);

    /**
     * @brief Signals grouped by symbol (ascending), stable-sorted by date within a symbol
     */
    static std::map<std::string, std::vector<Signal>> group_by_symbol(
        const std::vector<Signal>& signals);

    Direction direction_of(const Signal& signal) const {
        return signal.direction.value_or(config_.signal_type);
    }

    /**
     * @brief One-trade-per-instrument gate
     * @return True (and a warning recorded) when the signal falls on or before the exit
     *         date of the previous trade on its instrument
     */
    bool blocked_by_previous_trade(const Signal& signal);

    /**
     * @brief Record a signal that cannot be entered because of missing data
     */
    void skip_no_data(const Signal& signal, const std::string& reason);

    /**
     * @brief Size, fund and open a position at the close of series[entry_index]
     * @return Position, or empty (warning recorded) when no shares can be bought
     */
    std::optional<OpenPosition> open(const Signal& signal, const std::vector<PriceBar>& series,
                                     size_t entry_index);

    /**
     * @brief Realize the position into the portfolio and append the trade
     */
    const Trade& close(const OpenPosition& position, const std::vector<PriceBar>& series,
                       const ExitDecision& exit);

    void warn(const std::string& message);

    const PortfolioState& portfolio() const {
        return portfolio_;
    }

    const BacktestConfig& config() const {
        return config_;
    }

    /**
     * @brief Hand over the trade log (stable-sorted by exit date) and warnings
     */
    BacktestResult finish();

private:
    std::string tag(const Signal& signal) const;

    const BacktestConfig& config_;
    const IndicatorStore* indicators_;
    PositionSizer sizer_;
    PortfolioState portfolio_;
    std::map<std::string, Timestamp> last_exit_;
    BacktestResult result_;
};

}  // namespace trade_sim
