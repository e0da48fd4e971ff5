// include/trade_sim/backtest/result_serializer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "trade_sim/backtest/performance_aggregator.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

/**
 * @brief Plain key-value rendering of simulation output, dates as YYYY-MM-DD
 */
class ResultSerializer {
public:
    static nlohmann::json trade_to_json(const Trade& trade);

    /**
     * @return {"trades": [...], "warnings": [...]}
     */
    static nlohmann::json to_json(const BacktestResult& result);

    /**
     * @return to_json(result) plus a "metrics" object
     */
    static nlohmann::json to_json(const BacktestResult& result,
                                  const PerformanceMetrics& metrics);
};

}  // namespace trade_sim
