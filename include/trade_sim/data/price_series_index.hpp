#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

/**
 * @brief How to treat two bars of the same instrument on the same date
 */
enum class DuplicateBarPolicy {
    REJECT,      // fail construction with INVALID_DATA
    KEEP_FIRST   // keep the first occurrence in input order and record a warning
};

/**
 * Per-instrument, date-sorted OHLCV lookup.
 *
 * The index owns its bars and is immutable after build(), so one instance can be shared
 * read-only by any number of concurrent simulation runs. Missing trading days are kept
 * as gaps; nothing is forward-filled.
 */
class PriceSeriesIndex {
public:
    PriceSeriesIndex() = default;

    /**
     * Validate and index a flat list of bars
     * @param bars Bars of any number of instruments, in any order
     * @param policy Duplicate (symbol, date) handling
     * @return Index, or INVALID_DATA for duplicates (REJECT) or OHLC invariant violations
     */
    static Result<PriceSeriesIndex> build(std::vector<PriceBar> bars,
                                          DuplicateBarPolicy policy = DuplicateBarPolicy::REJECT);

    /**
     * Bars of one instrument, strictly ascending by date
     * @return Empty sequence for unknown symbols
     */
    const std::vector<PriceBar>& get_series(const std::string& symbol) const;

    /**
     * First bar dated on or after the given date
     * @return Bar or DATA_NOT_FOUND
     */
    Result<PriceBar> get_price_on_or_after(const std::string& symbol,
                                           const Timestamp& date) const;

    /**
     * Position of the first bar dated on or after the given date
     */
    std::optional<size_t> index_on_or_after(const std::string& symbol,
                                            const Timestamp& date) const;

    std::vector<std::string> symbols() const;

    bool has_symbol(const std::string& symbol) const {
        return series_.find(symbol) != series_.end();
    }

    size_t bar_count() const;

    const std::vector<std::string>& warnings() const {
        return warnings_;
    }

private:
    // std::map keeps instruments in ascending symbol order, which fixes processing order
    std::map<std::string, std::vector<PriceBar>> series_;
    std::vector<std::string> warnings_;
};

}  // namespace trade_sim
