#pragma once

#include "common/Types.h"
#include "pattern/Pattern.h"

#include <optional>
#include <string>

namespace patterngate {
namespace engine {

enum class DecisionReason {
    APPROVED,
    APPROVED_EXPLORATION,       // unseen pattern, fail-open
    APPROVED_SAMPLE_BUILDING,   // seen but below min sample size
    INSUFFICIENT_SIGNALS,
    UNSEEN_PATTERN_DENIED,
    LOW_WIN_RATE,
    CONSECUTIVE_LOSSES,
    POSITION_ALREADY_OPEN,
    INVALID_INPUT,
    INSUFFICIENT_SIZE,
    RATE_LIMITED,
    MAX_POSITIONS,
    EXPOSURE_LIMIT,
    DRAWDOWN_LIMIT,
    RISK_SCORE_LIMIT
};

inline const char* toString(DecisionReason reason) {
    switch (reason) {
        case DecisionReason::APPROVED: return "approved";
        case DecisionReason::APPROVED_EXPLORATION: return "approved_exploration";
        case DecisionReason::APPROVED_SAMPLE_BUILDING: return "approved_sample_building";
        case DecisionReason::INSUFFICIENT_SIGNALS: return "insufficient_signals";
        case DecisionReason::UNSEEN_PATTERN_DENIED: return "unseen_pattern_denied";
        case DecisionReason::LOW_WIN_RATE: return "low_win_rate";
        case DecisionReason::CONSECUTIVE_LOSSES: return "consecutive_losses";
        case DecisionReason::POSITION_ALREADY_OPEN: return "position_already_open";
        case DecisionReason::INVALID_INPUT: return "invalid_input";
        case DecisionReason::INSUFFICIENT_SIZE: return "insufficient_size";
        case DecisionReason::RATE_LIMITED: return "rate_limited";
        case DecisionReason::MAX_POSITIONS: return "max_positions";
        case DecisionReason::EXPOSURE_LIMIT: return "exposure_limit";
        case DecisionReason::DRAWDOWN_LIMIT: return "drawdown_limit";
        case DecisionReason::RISK_SCORE_LIMIT: return "risk_score_limit";
    }
    return "invalid_input";
}

inline bool isRiskLimit(DecisionReason reason) {
    return reason == DecisionReason::RATE_LIMITED ||
           reason == DecisionReason::MAX_POSITIONS ||
           reason == DecisionReason::EXPOSURE_LIMIT ||
           reason == DecisionReason::DRAWDOWN_LIMIT ||
           reason == DecisionReason::RISK_SCORE_LIMIT;
}

// Per-evaluation result; never persisted and safe to discard
struct TradeDecision {
    bool approved = false;
    DecisionReason reason = DecisionReason::INVALID_INPUT;
    std::optional<double> size_hint;    // notional in quote currency
    Quantity quantity = 0.0;            // base units at the evaluated price
    Side side = Side::LONG;
    Price entry_price = 0.0;
    std::optional<StopLevels> levels;
    pattern::Pattern pattern;
};

} // namespace engine
} // namespace patterngate
