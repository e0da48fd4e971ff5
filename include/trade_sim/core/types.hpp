// include/trade_sim/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace trade_sim {

/**
 * @brief Timestamp type for consistent time representation
 * Daily bars are stored at midnight UTC of their trading date
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for position sizes (whole units are enforced by the sizing path)
 */
using Quantity = double;

/**
 * @brief Trade direction
 */
enum class Direction {
    LONG,
    SHORT
};

inline std::string direction_to_string(Direction direction) {
    return direction == Direction::LONG ? "long" : "short";
}

/**
 * @brief Why a position was closed
 */
enum class ExitReason {
    STOPPED_OUT,
    TOOK_PROFIT,
    TIME_EXIT,
    END_OF_DATA
};

inline std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOPPED_OUT:
            return "Stop Loss";
        case ExitReason::TOOK_PROFIT:
            return "Take Profit";
        case ExitReason::TIME_EXIT:
            return "Time Exit";
        case ExitReason::END_OF_DATA:
            return "End of Data";
        default:
            return "Unknown";
    }
}

/**
 * @brief One OHLCV bar of one instrument on one date
 */
struct PriceBar {
    Timestamp date;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    PriceBar() = default;
    PriceBar(Timestamp d, Price o, Price h, Price l, Price c, double v, std::string s)
        : date(d), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

/**
 * @brief Instruction to consider opening a position
 * When direction is empty the run's configured signal type applies.
 */
struct Signal {
    std::string symbol;
    Timestamp date;
    std::optional<Direction> direction;

    Signal() = default;
    Signal(std::string s, Timestamp d, std::optional<Direction> dir = std::nullopt)
        : symbol(std::move(s)), date(d), direction(dir) {}
};

/**
 * @brief Position held between entry and exit, internal to a simulation run
 */
struct OpenPosition {
    std::string symbol;
    Direction direction{Direction::LONG};
    Timestamp signal_date;
    Timestamp entry_date;
    size_t entry_index{0};
    size_t max_exit_index{0};  // last bar index of the holding window, clipped to data
    Price entry_price{0.0};
    Quantity shares{0.0};
    double capital_committed{0.0};
    double leverage_used{0.0};
    Price stop_loss_price{0.0};
    std::optional<Price> take_profit_price;
};

/**
 * @brief Closed trade record
 */
struct Trade {
    std::string symbol;
    Direction direction{Direction::LONG};
    Timestamp signal_date;
    Timestamp entry_date;
    Timestamp exit_date;
    Price entry_price{0.0};
    Price exit_price{0.0};
    Quantity shares{0.0};
    double position_value{0.0};
    double pnl_amount{0.0};
    double pnl_percent{0.0};
    int days_held{0};
    ExitReason exit_reason{ExitReason::TIME_EXIT};
    double leverage_used{0.0};
    double portfolio_value_after{0.0};
};

/**
 * @brief Running capital of one simulation run
 */
struct PortfolioState {
    double cash{0.0};
    double equity{0.0};
    double peak_equity{0.0};

    PortfolioState() = default;
    explicit PortfolioState(double initial_capital)
        : cash(initial_capital), equity(initial_capital), peak_equity(initial_capital) {}
};

/**
 * @brief Output of one simulation run
 */
struct BacktestResult {
    std::vector<Trade> trades;
    std::vector<std::string> warnings;
};

}  // namespace trade_sim
