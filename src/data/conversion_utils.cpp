// src/data/conversion_utils.cpp
#include "trade_sim/data/conversion_utils.hpp"
#include <arrow/type_traits.h>
#include "trade_sim/core/logger.hpp"
#include "trade_sim/core/time_utils.hpp"

namespace trade_sim {

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::combine_chunks(
    const std::shared_ptr<arrow::Table>& table, const std::vector<std::string>& required_columns) {
    if (!table) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_ARGUMENT, "Table pointer is null", "DataConversionUtils");
    }

    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::INVALID_DATA, "Missing required column: " + col,
                "DataConversionUtils");
        }
    }

    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine table chunks: " + combined.status().ToString(),
            "DataConversionUtils");
    }
    return combined.ValueOrDie();
}

std::shared_ptr<arrow::Array> DataConversionUtils::column(
    const std::shared_ptr<arrow::Table>& table, const std::string& name) {
    auto chunked = table->GetColumnByName(name);
    if (!chunked || chunked->num_chunks() == 0) {
        return nullptr;
    }
    return chunked->chunk(0);
}

Result<std::vector<PriceBar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    auto combined_result =
        combine_chunks(table, {"time", "symbol", "open", "high", "low", "close", "volume"});
    if (combined_result.is_error()) {
        return forward_error<std::vector<PriceBar>>(combined_result);
    }
    const auto& combined = combined_result.value();

    std::vector<PriceBar> bars;
    if (combined->num_rows() == 0) {
        return bars;
    }
    bars.reserve(combined->num_rows());

    auto time_array = column(combined, "time");
    auto symbol_array = column(combined, "symbol");
    auto open_array = column(combined, "open");
    auto high_array = column(combined, "high");
    auto low_array = column(combined, "low");
    auto close_array = column(combined, "close");
    auto volume_array = column(combined, "volume");

    for (int64_t i = 0; i < combined->num_rows(); ++i) {
        auto ts_result = extract_timestamp(time_array, i);
        if (ts_result.is_error()) {
            return forward_error<std::vector<PriceBar>>(ts_result, "DataConversionUtils");
        }

        auto symbol_result = extract_string(symbol_array, i);
        if (symbol_result.is_error()) {
            return forward_error<std::vector<PriceBar>>(symbol_result, "DataConversionUtils");
        }

        auto open_result = extract_double(open_array, i);
        auto high_result = extract_double(high_array, i);
        auto low_result = extract_double(low_array, i);
        auto close_result = extract_double(close_array, i);
        auto volume_result = extract_double(volume_array, i);

        if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
            close_result.is_error() || volume_result.is_error()) {
            return make_error<std::vector<PriceBar>>(
                ErrorCode::CONVERSION_ERROR,
                "Error extracting OHLCV values at row " + std::to_string(i),
                "DataConversionUtils");
        }

        bars.emplace_back(ts_result.value(), open_result.value(), high_result.value(),
                          low_result.value(), close_result.value(), volume_result.value(),
                          symbol_result.value());
    }

    DEBUG("Converted " << bars.size() << " bars from Arrow table");
    return bars;
}

Result<std::vector<Signal>> DataConversionUtils::arrow_table_to_signals(
    const std::shared_ptr<arrow::Table>& table) {
    auto combined_result = combine_chunks(table, {"time", "symbol"});
    if (combined_result.is_error()) {
        return forward_error<std::vector<Signal>>(combined_result);
    }
    const auto& combined = combined_result.value();

    std::vector<Signal> signals;
    if (combined->num_rows() == 0) {
        return signals;
    }
    signals.reserve(combined->num_rows());

    auto time_array = column(combined, "time");
    auto symbol_array = column(combined, "symbol");
    auto direction_array = column(combined, "direction");

    for (int64_t i = 0; i < combined->num_rows(); ++i) {
        auto ts_result = extract_timestamp(time_array, i);
        if (ts_result.is_error()) {
            return forward_error<std::vector<Signal>>(ts_result, "DataConversionUtils");
        }

        auto symbol_result = extract_string(symbol_array, i);
        if (symbol_result.is_error()) {
            return forward_error<std::vector<Signal>>(symbol_result, "DataConversionUtils");
        }

        std::optional<Direction> direction;
        if (direction_array && !direction_array->IsNull(i)) {
            auto dir_result = extract_string(direction_array, i);
            if (dir_result.is_error()) {
                return forward_error<std::vector<Signal>>(dir_result, "DataConversionUtils");
            }
            if (dir_result.value() == "long") {
                direction = Direction::LONG;
            } else if (dir_result.value() == "short") {
                direction = Direction::SHORT;
            } else {
                return make_error<std::vector<Signal>>(
                    ErrorCode::INVALID_DATA,
                    "Unknown signal direction '" + dir_result.value() + "' at row " +
                        std::to_string(i),
                    "DataConversionUtils");
            }
        }

        signals.emplace_back(symbol_result.value(), ts_result.value(), direction);
    }

    DEBUG("Converted " << signals.size() << " signals from Arrow table");
    return signals;
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }

    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::TIMESTAMP: {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array->type());
            int64_t raw = ts_array->Value(index);
            switch (ts_type->unit()) {
                case arrow::TimeUnit::SECOND:
                    return Timestamp(std::chrono::seconds(raw));
                case arrow::TimeUnit::MILLI:
                    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::milliseconds(raw)));
                case arrow::TimeUnit::MICRO:
                    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::microseconds(raw)));
                case arrow::TimeUnit::NANO:
                    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::nanoseconds(raw)));
            }
            break;
        }
        case arrow::Type::DATE32: {
            auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
            return Timestamp(std::chrono::seconds(
                static_cast<int64_t>(date_array->Value(index)) * 86400));
        }
        case arrow::Type::STRING: {
            auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
            return core::parse_iso_date(string_array->GetString(index));
        }
        default:
            break;
    }

    return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                 "Unsupported date column type: " + array->type()->ToString(),
                                 "DataConversionUtils");
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }

    if (array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null numeric value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index);
        case arrow::Type::INT64:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index));
        default:
            return make_error<double>(
                ErrorCode::CONVERSION_ERROR,
                "Unsupported numeric column type: " + array->type()->ToString(),
                "DataConversionUtils");
    }
}

Result<std::string> DataConversionUtils::extract_string(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }

    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(
            ErrorCode::CONVERSION_ERROR,
            "Expected string column, got " + array->type()->ToString(), "DataConversionUtils");
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       "DataConversionUtils");
    }

    return string_array->GetString(index);
}

}  // namespace trade_sim
