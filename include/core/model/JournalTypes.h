#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace patterngate {
namespace core {

enum class JournalEventType {
    TRADE_REJECTED,
    POSITION_OPENED,
    POSITION_CLOSED,
    PATTERN_UPDATED,
    STATE_SAVED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::POSITION_OPENED;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload;
};

} // namespace core
} // namespace patterngate
