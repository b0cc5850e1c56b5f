#pragma once

#include "common/Types.h"
#include "pattern/Pattern.h"

#include <cstdint>
#include <optional>
#include <string>

namespace patterngate {
namespace portfolio {

// Open position, owned by PositionLedger until it closes
struct Position {
    std::uint64_t id = 0;
    std::string symbol;
    Side side = Side::LONG;
    Price entry_price = 0.0;
    Quantity quantity = 0.0;
    long long entry_time = 0;

    Price stop_loss = 0.0;
    Price emergency_stop = 0.0;
    Price take_profit = 0.0;
    std::optional<Price> trailing_step;
    Price trailing_anchor = 0.0;    // price level the last trailing ratchet was measured from

    Price current_price = 0.0;
    Amount unrealized_pnl = 0.0;

    pattern::Pattern pattern;       // signals at entry, for outcome feedback
    PositionStatus status = PositionStatus::OPEN;

    Amount notional() const { return current_price * quantity; }
};

// Closed trade, read-only history record
struct TradeRecord {
    std::uint64_t position_id = 0;
    std::string symbol;
    Side side = Side::LONG;
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    Quantity quantity = 0.0;
    Amount realized_pnl = 0.0;
    double realized_pnl_pct = 0.0;
    long long entry_time = 0;
    long long exit_time = 0;
    ExitReason exit_reason = ExitReason::MANUAL;
    pattern::Pattern pattern;
};

} // namespace portfolio
} // namespace patterngate
