#pragma once

#include <optional>

#include <nlohmann/json.hpp>

namespace patterngate {
namespace core {

struct StateSnapshot {
    int schema_version = 0;     // written by the store
    long long saved_at_ms = 0;
    double capital = 0.0;
    nlohmann::json patterns;    // PatternMemory::toJson()
    nlohmann::json positions;   // PositionLedger::toJson()
};

class IStateStore {
public:
    virtual ~IStateStore() = default;

    // nullopt when nothing is stored or the stored state is unreadable
    virtual std::optional<StateSnapshot> load() = 0;
    virtual bool save(const StateSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace patterngate
