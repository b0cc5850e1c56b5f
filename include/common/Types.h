#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace patterngate {

using Price = double;
using Quantity = double;
using Amount = double;
using SignalLabel = std::string;
using SignalSet = std::vector<SignalLabel>;

// Milliseconds since epoch. Injected so tests can drive the day boundary and
// the order rate limit.
using ClockFn = std::function<long long()>;

enum class Side { LONG, SHORT };
enum class PositionStatus { OPEN, CLOSED };
enum class ExitReason { EMERGENCY_STOP, STOP_LOSS, TAKE_PROFIT, MANUAL };
enum class OutcomeResult { WIN, LOSS, UNKNOWN };

inline long long systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline double sideSign(Side side) {
    return side == Side::LONG ? 1.0 : -1.0;
}

inline const char* toString(Side side) {
    return side == Side::LONG ? "LONG" : "SHORT";
}

inline std::optional<Side> sideFromString(const std::string& value) {
    if (value == "LONG" || value == "long" || value == "BUY" || value == "buy") return Side::LONG;
    if (value == "SHORT" || value == "short" || value == "SELL" || value == "sell") return Side::SHORT;
    return std::nullopt;
}

inline const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::EMERGENCY_STOP: return "emergency_stop";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::MANUAL: return "manual";
    }
    return "manual";
}

inline ExitReason exitReasonFromString(const std::string& value) {
    if (value == "emergency_stop") return ExitReason::EMERGENCY_STOP;
    if (value == "stop_loss") return ExitReason::STOP_LOSS;
    if (value == "take_profit") return ExitReason::TAKE_PROFIT;
    return ExitReason::MANUAL;
}

// Protective levels attached to a position at entry.
struct StopLevels {
    Price stop_loss = 0.0;
    Price emergency_stop = 0.0;
    Price take_profit = 0.0;
    std::optional<Price> trailing_step;
};

} // namespace patterngate
