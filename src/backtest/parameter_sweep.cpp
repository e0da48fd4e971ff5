// src/backtest/parameter_sweep.cpp
#include "trade_sim/backtest/parameter_sweep.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>
#include "trade_sim/backtest/trade_simulator.hpp"
#include "trade_sim/backtest/vectorized_trade_simulator.hpp"
#include "trade_sim/core/logger.hpp"
#include "trade_sim/data/price_series_index.hpp"

namespace trade_sim {

Result<std::vector<double>> SweepRange::values() const {
    if (!(step > 0.0) || !std::isfinite(min) || !std::isfinite(max) || max < min) {
        return make_error<std::vector<double>>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid sweep range {" + std::to_string(min) + ", " + std::to_string(max) + ", " +
                std::to_string(step) + "}",
            "ParameterSweep");
    }

    std::vector<double> result;
    // tolerance keeps max in the range when (max - min) / step is not exact in binary
    const size_t count = static_cast<size_t>(std::floor((max - min) / step + 1e-9)) + 1;
    result.reserve(count);
    for (size_t k = 0; k < count; ++k) {
        result.push_back(std::round((min + k * step) * 100.0) / 100.0);
    }
    return result;
}

Result<SweepGrid> SweepGrid::from_ranges(const SweepRange& holding_period,
                                         const SweepRange& stop_loss,
                                         const std::optional<SweepRange>& take_profit,
                                         bool include_no_take_profit) {
    SweepGrid grid;

    auto periods = holding_period.values();
    if (periods.is_error()) {
        return forward_error<SweepGrid>(periods);
    }
    for (double period : periods.value()) {
        grid.holding_periods.push_back(static_cast<int>(std::lround(period)));
    }
    grid.holding_periods.erase(
        std::unique(grid.holding_periods.begin(), grid.holding_periods.end()),
        grid.holding_periods.end());

    auto stops = stop_loss.values();
    if (stops.is_error()) {
        return forward_error<SweepGrid>(stops);
    }
    grid.stop_losses = stops.value();

    grid.take_profits.clear();
    if (include_no_take_profit || !take_profit) {
        grid.take_profits.push_back(std::nullopt);
    }
    if (take_profit) {
        auto targets = take_profit->values();
        if (targets.is_error()) {
            return forward_error<SweepGrid>(targets);
        }
        for (double target : targets.value()) {
            grid.take_profits.push_back(target);
        }
    }
    return grid;
}

std::vector<BacktestConfig> SweepGrid::expand(const BacktestConfig& base) const {
    std::vector<BacktestConfig> configs;
    configs.reserve(size());
    for (int period : holding_periods) {
        for (double stop : stop_losses) {
            for (const auto& target : take_profits) {
                BacktestConfig config = base;
                config.holding_period = period;
                config.stop_loss_pct = stop;
                config.take_profit_pct = target;
                configs.push_back(config);
            }
        }
    }
    return configs;
}

nlohmann::json SweepConfig::to_json() const {
    nlohmann::json j;
    j["max_workers"] = max_workers;
    j["use_vectorized"] = use_vectorized;
    j["risk_free_rate"] = risk_free_rate;
    return j;
}

void SweepConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_workers"))
        max_workers = j.at("max_workers").get<size_t>();
    if (j.contains("use_vectorized"))
        use_vectorized = j.at("use_vectorized").get<bool>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
}

nlohmann::json SweepResult::to_json() const {
    nlohmann::json j;
    j["combination_index"] = combination_index;
    j["holding_period"] = holding_period;
    j["stop_loss_pct"] = stop_loss_pct;
    if (take_profit_pct) {
        j["take_profit_pct"] = *take_profit_pct;
    } else {
        j["take_profit_pct"] = nullptr;
    }
    j["ok"] = ok;
    if (ok) {
        j["metrics"] = metrics.to_json();
        j["warning_count"] = warning_count;
    } else {
        j["error"] = error;
    }
    return j;
}

SweepResult ParameterSweep::run_one(size_t combination_index, const BacktestConfig& config,
                                    const PriceSeriesIndex& index,
                                    const std::vector<Signal>& signals,
                                    const IndicatorStore* indicators) const {
    SweepResult result;
    result.combination_index = combination_index;
    result.holding_period = config.holding_period;
    result.stop_loss_pct = config.stop_loss_pct;
    result.take_profit_pct = config.take_profit_pct;

    const VectorizedTradeSimulator vectorized{};
    const TradeSimulator reference{};
    const SimulatorInterface& simulator =
        config_.use_vectorized ? static_cast<const SimulatorInterface&>(vectorized) : reference;

    try {
        auto run_result = simulator.run(index, signals, config, indicators);
        Logger::register_component("ParameterSweep");

        if (run_result.is_error()) {
            result.error = run_result.error()->to_string();
            WARN("Combination " << combination_index << " failed: " << result.error);
            return result;
        }

        const BacktestResult& backtest = run_result.value();
        result.metrics = PerformanceAggregator(config_.risk_free_rate)
                             .compute(backtest.trades, config.initial_capital);
        result.warning_count = backtest.warnings.size();
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = e.what();
        ERROR("Combination " << combination_index << " threw: " << e.what());
    }
    return result;
}

Result<std::vector<SweepResult>> ParameterSweep::run(const PriceSeriesIndex& index,
                                                     const std::vector<Signal>& signals,
                                                     const BacktestConfig& base_config,
                                                     const SweepGrid& grid,
                                                     const IndicatorStore* indicators) const {
    Logger::register_component("ParameterSweep");

    const std::vector<BacktestConfig> configs = grid.expand(base_config);
    if (configs.empty()) {
        return make_error<std::vector<SweepResult>>(ErrorCode::INVALID_ARGUMENT,
                                                    "Sweep grid has no combinations",
                                                    "ParameterSweep");
    }

    size_t workers = config_.max_workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, configs.size());

    INFO("Sweeping " << configs.size() << " combinations on " << workers << " workers ("
                     << (config_.use_vectorized ? "vectorized" : "reference") << ")");

    // Each slot is written by exactly one worker
    std::vector<SweepResult> results(configs.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < configs.size(); i = next.fetch_add(1)) {
            results[i] = run_one(i, configs[i], index, signals, indicators);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    size_t failed = std::count_if(results.begin(), results.end(),
                                  [](const SweepResult& r) { return !r.ok; });
    INFO("Sweep finished: " << configs.size() - failed << " succeeded, " << failed
                            << " failed");
    return results;
}

Result<SweepResult> ParameterSweep::best(const std::vector<SweepResult>& results,
                                         const std::string& metric) {
    const auto keys = PerformanceMetrics().to_map();
    if (keys.find(metric) == keys.end()) {
        return make_error<SweepResult>(ErrorCode::INVALID_ARGUMENT, "Unknown metric: " + metric,
                                       "ParameterSweep");
    }

    const SweepResult* best_result = nullptr;
    double best_value = 0.0;
    for (const auto& result : results) {
        if (!result.ok) {
            continue;
        }
        double value = result.metrics.to_map().at(metric);
        if (best_result == nullptr || value > best_value) {
            best_result = &result;
            best_value = value;
        }
    }

    if (best_result == nullptr) {
        return make_error<SweepResult>(ErrorCode::DATA_NOT_FOUND,
                                       "No successful combination to rank", "ParameterSweep");
    }
    return *best_result;
}

}  // namespace trade_sim
