// include/trade_sim/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {

/**
 * @brief Converts columnar Arrow tables into simulation inputs
 *
 * Date columns may be timestamp (any unit), date32 or "YYYY-MM-DD" strings.
 * Multi-chunk columns are combined before conversion.
 */
class DataConversionUtils {
public:
    /**
     * @brief Convert Arrow Table to price bars
     * @param table Table with columns time, symbol, open, high, low, close, volume
     * @return Result containing bars in table row order
     */
    static Result<std::vector<PriceBar>> arrow_table_to_bars(
        const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Convert Arrow Table to signals
     * @param table Table with columns time, symbol and an optional direction column
     *              ("long"/"short", null means the run's signal type)
     * @return Result containing signals in table row order
     */
    static Result<std::vector<Signal>> arrow_table_to_signals(
        const std::shared_ptr<arrow::Table>& table);

private:
    static Result<std::shared_ptr<arrow::Table>> combine_chunks(
        const std::shared_ptr<arrow::Table>& table,
        const std::vector<std::string>& required_columns);

    static std::shared_ptr<arrow::Array> column(const std::shared_ptr<arrow::Table>& table,
                                                const std::string& name);

    /**
     * @brief Extract a date from a timestamp, date32 or string array
     */
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    /**
     * @brief Extract a double from a double or int64 array
     */
    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace trade_sim
