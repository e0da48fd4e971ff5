// src/backtest/vectorized_trade_simulator.cpp
#include "trade_sim/backtest/vectorized_trade_simulator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <limits>
#include "trade_sim/backtest/simulation_ledger.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"
#include "trade_sim/data/price_series_index.hpp"

namespace trade_sim {

namespace {

using BoolArray = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;
using BoolVector = Eigen::Array<bool, Eigen::Dynamic, 1>;

constexpr double kInf = std::numeric_limits<double>::infinity();

}  // namespace

std::vector<ExitDecision> VectorizedTradeSimulator::evaluate_batch(
    const std::vector<PriceBar>& series, const std::vector<size_t>& entry_indices,
    const std::vector<Direction>& directions, double stop_loss_pct,
    std::optional<double> take_profit_pct, int holding_period) {
    const Eigen::Index m = static_cast<Eigen::Index>(entry_indices.size());
    const Eigen::Index n = static_cast<Eigen::Index>(series.size());
    const Eigen::Index h = holding_period;

    std::vector<ExitDecision> exits(entry_indices.size());
    if (m == 0 || h <= 0) {
        return exits;
    }

    Eigen::ArrayXd lows(n), highs(n), closes(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        lows(i) = series[i].low;
        highs(i) = series[i].high;
        closes(i) = series[i].close;
    }

    Eigen::ArrayXi entry(m);
    BoolVector is_long(m);
    for (Eigen::Index r = 0; r < m; ++r) {
        entry(r) = static_cast<int>(entry_indices[r]);
        is_long(r) = directions[r] == Direction::LONG;
    }

    // Levels, same arithmetic as ExitEvaluator::compute_levels
    Eigen::ArrayXd entry_price(m);
    for (Eigen::Index r = 0; r < m; ++r) {
        entry_price(r) = closes(entry(r));
    }
    const Eigen::ArrayXd stop = entry_price * is_long.select(
        Eigen::ArrayXd::Constant(m, 1.0 - stop_loss_pct / 100.0),
        Eigen::ArrayXd::Constant(m, 1.0 + stop_loss_pct / 100.0));
    Eigen::ArrayXd target = Eigen::ArrayXd::Zero(m);
    if (take_profit_pct) {
        target = entry_price * is_long.select(
            Eigen::ArrayXd::Constant(m, 1.0 + *take_profit_pct / 100.0),
            Eigen::ArrayXd::Constant(m, 1.0 - *take_profit_pct / 100.0));
    }

    // Window width is bounded by the bars left after the earliest entry, not by the
    // holding period, so a very long holding period does not grow the matrices.
    const Eigen::Index w = std::min<Eigen::Index>(h, n - 1 - entry.minCoeff());
    if (w <= 0) {
        return exits;
    }

    // Forward windows oriented so that "touched" is always "<= level": shorts are negated.
    // Cells past the end of data hold +inf and never trigger.
    Eigen::ArrayXXd adverse = Eigen::ArrayXXd::Constant(m, w, kInf);
    Eigen::ArrayXXd favorable = Eigen::ArrayXXd::Constant(m, w, kInf);
    for (Eigen::Index r = 0; r < m; ++r) {
        const Eigen::Index start = entry(r) + 1;
        const Eigen::Index len = std::min(w, n - start);
        if (len <= 0) {
            continue;
        }
        if (is_long(r)) {
            adverse.row(r).head(len) = lows.segment(start, len).transpose();
            favorable.row(r).head(len) = -highs.segment(start, len).transpose();
        } else {
            adverse.row(r).head(len) = -highs.segment(start, len).transpose();
            favorable.row(r).head(len) = lows.segment(start, len).transpose();
        }
    }

    const Eigen::ArrayXd adverse_level = is_long.select(stop, -stop);
    const Eigen::ArrayXd favorable_level =
        take_profit_pct ? Eigen::ArrayXd(is_long.select(-target, target))
                        : Eigen::ArrayXd(Eigen::ArrayXd::Constant(m, -kInf));

    const BoolArray stop_hit = adverse <= adverse_level.replicate(1, w);
    const BoolArray target_hit = favorable <= favorable_level.replicate(1, w);
    const BoolArray any_hit = stop_hit || target_hit;

    Eigen::ArrayXXi column(m, w);
    for (Eigen::Index k = 0; k < w; ++k) {
        column.col(k).setConstant(static_cast<int>(k));
    }
    // w marks "no trigger inside the window"
    const Eigen::ArrayXi first_hit =
        any_hit.select(column, static_cast<int>(w)).rowwise().minCoeff();

    for (Eigen::Index r = 0; r < m; ++r) {
        ExitDecision& exit = exits[r];
        const Eigen::Index k = first_hit(r);
        if (k < w) {
            exit.exit_index = static_cast<size_t>(entry(r) + 1 + k);
            exit.reason = *ExitEvaluator::resolve_first_hit(stop_hit(r, k), target_hit(r, k));
            exit.exit_price = exit.reason == ExitReason::STOPPED_OUT ? stop(r) : target(r);
            continue;
        }

        const Eigen::Index window_end = entry(r) + h;
        if (window_end <= n - 1) {
            exit.exit_index = static_cast<size_t>(window_end);
            exit.exit_price = closes(window_end);
            exit.reason = ExitReason::TIME_EXIT;
        } else {
            exit.exit_index = static_cast<size_t>(n - 1);
            exit.exit_price = closes(n - 1);
            exit.reason = ExitReason::END_OF_DATA;
        }
    }
    return exits;
}

Result<BacktestResult> VectorizedTradeSimulator::run(const PriceSeriesIndex& index,
                                                     const std::vector<Signal>& signals,
                                                     const BacktestConfig& config,
                                                     const IndicatorStore* indicators) const {
    Logger::register_component(name());

    auto valid = config.validate();
    if (valid.is_error()) {
        ERROR("Rejected configuration: " << valid.error()->what());
        return forward_error<BacktestResult>(valid, name());
    }

    INFO("Simulating " << signals.size() << " signals (vectorized), holding period "
                       << config.holding_period << ", sizing "
                       << sizing_method_to_string(config.sizing_method()));

    try {
        SimulationLedger ledger(config, indicators);

        for (const auto& [symbol, symbol_signals] : SimulationLedger::group_by_symbol(signals)) {
            const auto& series = index.get_series(symbol);
            const size_t count = symbol_signals.size();

            // Entry bar of every signal
            std::vector<std::optional<size_t>> entries(count);
            std::vector<size_t> batch_entries;
            std::vector<Direction> batch_directions;
            std::vector<size_t> batch_row(count, 0);
            for (size_t i = 0; i < count; ++i) {
                auto it = std::lower_bound(
                    series.begin(), series.end(), symbol_signals[i].date,
                    [](const PriceBar& bar, const Timestamp& date) { return bar.date < date; });
                if (it == series.end()) {
                    continue;
                }
                entries[i] = static_cast<size_t>(std::distance(series.begin(), it));
                if (*entries[i] + 1 < series.size()) {
                    batch_row[i] = batch_entries.size();
                    batch_entries.push_back(*entries[i]);
                    batch_directions.push_back(ledger.direction_of(symbol_signals[i]));
                }
            }

            const auto exits =
                evaluate_batch(series, batch_entries, batch_directions, config.stop_loss_pct,
                               config.take_profit_pct, config.holding_period);

            // Capital recurrence
            for (size_t i = 0; i < count; ++i) {
                const Signal& signal = symbol_signals[i];
                if (ledger.blocked_by_previous_trade(signal)) {
                    continue;
                }
                if (!entries[i]) {
                    ledger.skip_no_data(signal, "no price data on or after signal date");
                    continue;
                }
                if (*entries[i] + 1 >= series.size()) {
                    ledger.skip_no_data(signal, "no bar after entry on " +
                                                    core::format_iso_date(
                                                        series[*entries[i]].date));
                    continue;
                }

                auto position = ledger.open(signal, series, *entries[i]);
                if (!position) {
                    continue;
                }
                ledger.close(*position, series, exits[batch_row[i]]);
            }
        }

        BacktestResult result = ledger.finish();
        INFO("Vectorized simulation finished: " << result.trades.size() << " trades, "
                                                << result.warnings.size() << " warnings");
        return result;

    } catch (const std::exception& e) {
        ERROR("Vectorized simulation failed: " << e.what());
        return make_error<BacktestResult>(ErrorCode::UNKNOWN_ERROR,
                                          std::string("Simulation failed: ") + e.what(), name());
    }
}

}  // namespace trade_sim
