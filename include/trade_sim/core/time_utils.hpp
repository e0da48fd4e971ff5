#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include "trade_sim/core/error.hpp"
#include "trade_sim/core/types.hpp"

namespace trade_sim {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date
 */
inline long long days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

/**
 * @brief Build a UTC midnight timestamp from a calendar date
 */
inline Timestamp make_date(int year, unsigned month, unsigned day) {
    return Timestamp(std::chrono::hours(24 * days_from_civil(year, month, day)));
}

inline bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline unsigned days_in_month(int year, unsigned month) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

/**
 * @brief Parse an ISO-8601 date ("YYYY-MM-DD"; a trailing time part is ignored)
 * @return Timestamp at midnight UTC, or INVALID_DATA
 */
inline Result<Timestamp> parse_iso_date(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char dash1 = 0;
    char dash2 = 0;
    if (text.size() < 10 ||
        std::sscanf(text.c_str(), "%4d%c%2u%c%2u", &year, &dash1, &month, &dash2, &day) != 5 ||
        dash1 != '-' || dash2 != '-' || month < 1 || month > 12 || day < 1 ||
        day > days_in_month(year, month)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Unparseable date: '" + text + "'", "TimeUtils");
    }
    return make_date(year, month, day);
}

/**
 * @brief Format a timestamp as ISO-8601 date ("YYYY-MM-DD", UTC)
 */
inline std::string format_iso_date(const Timestamp& ts) {
    auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_value{};
    if (safe_gmtime(&time_t_value, &tm_value) == nullptr) {
        return "";
    }
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm_value);
    return std::string(buffer);
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace trade_sim
