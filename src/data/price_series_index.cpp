#include "trade_sim/data/price_series_index.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"

namespace trade_sim {

namespace {

bool is_finite_bar(const PriceBar& bar) {
    return std::isfinite(bar.open) && std::isfinite(bar.high) && std::isfinite(bar.low) &&
           std::isfinite(bar.close) && std::isfinite(bar.volume);
}

std::string describe(const PriceBar& bar) {
    std::ostringstream ss;
    ss << bar.symbol << " on " << core::format_iso_date(bar.date) << " (O=" << bar.open
       << " H=" << bar.high << " L=" << bar.low << " C=" << bar.close << " V=" << bar.volume
       << ")";
    return ss.str();
}

}  // namespace

Result<PriceSeriesIndex> PriceSeriesIndex::build(std::vector<PriceBar> bars,
                                                 DuplicateBarPolicy policy) {
    PriceSeriesIndex index;

    for (auto& bar : bars) {
        if (bar.symbol.empty()) {
            return make_error<PriceSeriesIndex>(ErrorCode::INVALID_DATA,
                                                "Bar without instrument symbol",
                                                "PriceSeriesIndex");
        }
        if (!is_finite_bar(bar) || bar.low > bar.high || bar.open < bar.low ||
            bar.open > bar.high || bar.close < bar.low || bar.close > bar.high ||
            bar.volume < 0.0) {
            return make_error<PriceSeriesIndex>(ErrorCode::INVALID_DATA,
                                                "Malformed bar: " + describe(bar),
                                                "PriceSeriesIndex");
        }
        index.series_[bar.symbol].push_back(std::move(bar));
    }

    for (auto& [symbol, series] : index.series_) {
        // stable so the first occurrence of a duplicate stays in front
        std::stable_sort(series.begin(), series.end(),
                         [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });

        std::vector<PriceBar> unique_bars;
        unique_bars.reserve(series.size());
        for (auto& bar : series) {
            if (!unique_bars.empty() && unique_bars.back().date == bar.date) {
                std::string message = "Duplicate bar for " + symbol + " on " +
                                      core::format_iso_date(bar.date);
                if (policy == DuplicateBarPolicy::REJECT) {
                    return make_error<PriceSeriesIndex>(ErrorCode::INVALID_DATA, message,
                                                        "PriceSeriesIndex");
                }
                index.warnings_.push_back(message + ": kept first occurrence");
                WARN(index.warnings_.back());
                continue;
            }
            unique_bars.push_back(std::move(bar));
        }
        series = std::move(unique_bars);
    }

    DEBUG("Indexed " << index.bar_count() << " bars across " << index.series_.size()
                     << " instruments");
    return index;
}

const std::vector<PriceBar>& PriceSeriesIndex::get_series(const std::string& symbol) const {
    static const std::vector<PriceBar> empty;
    auto it = series_.find(symbol);
    if (it == series_.end()) {
        return empty;
    }
    return it->second;
}

std::optional<size_t> PriceSeriesIndex::index_on_or_after(const std::string& symbol,
                                                          const Timestamp& date) const {
    const auto& series = get_series(symbol);
    auto it = std::lower_bound(series.begin(), series.end(), date,
                               [](const PriceBar& bar, const Timestamp& d) { return bar.date < d; });
    if (it == series.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(series.begin(), it));
}

Result<PriceBar> PriceSeriesIndex::get_price_on_or_after(const std::string& symbol,
                                                         const Timestamp& date) const {
    auto position = index_on_or_after(symbol, date);
    if (!position) {
        return make_error<PriceBar>(ErrorCode::DATA_NOT_FOUND,
                                    "No bar for " + symbol + " on or after " +
                                        core::format_iso_date(date),
                                    "PriceSeriesIndex");
    }
    return get_series(symbol)[*position];
}

std::vector<std::string> PriceSeriesIndex::symbols() const {
    std::vector<std::string> result;
    result.reserve(series_.size());
    for (const auto& entry : series_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t PriceSeriesIndex::bar_count() const {
    size_t count = 0;
    for (const auto& entry : series_) {
        count += entry.second.size();
    }
    return count;
}

}  // namespace trade_sim
