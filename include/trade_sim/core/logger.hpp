// include/trade_sim/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "trade_sim/core/config_base.hpp"

namespace trade_sim {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // Per-trade detail
    INFO,     // Run lifecycle
    WARNING,  // Non-fatal conditions (fallbacks, clamps, skips)
    ERR,      // Errors surfaced to the caller
    FATAL
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

std::string level_to_string(LogLevel level);
LogLevel level_from_string(const std::string& level);
std::string log_destination_to_string(LogDestination dest);
LogDestination log_destination_from_string(const std::string& dest);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"trade_sim"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{20 * 1024 * 1024};  // rotate after 20MB
    size_t max_files{5};                     // retained log files

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe process-wide logger
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag messages logged from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_log_file_unsafe();
    void prune_old_files_unsafe();
    void rotate_log_files_unsafe();
    void write_to_file_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::string session_timestamp_;
    int part_number_{1};
    static thread_local std::string current_component_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                            \
    do {                                                               \
        if (level >= ::trade_sim::Logger::instance().get_min_level()) { \
            std::ostringstream os;                                     \
            os << message;                                             \
            ::trade_sim::Logger::instance().log(level, os.str());      \
        }                                                              \
    } while (0)

#define TRACE(message) LOG(::trade_sim::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::trade_sim::LogLevel::DEBUG, message)
#define INFO(message) LOG(::trade_sim::LogLevel::INFO, message)
#define WARN(message) LOG(::trade_sim::LogLevel::WARNING, message)
#define ERROR(message) LOG(::trade_sim::LogLevel::ERR, message)
#define FATAL(message) LOG(::trade_sim::LogLevel::FATAL, message)

}  // namespace trade_sim
