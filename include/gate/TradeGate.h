#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/TradeDecision.h"
#include "pattern/PatternMemory.h"

#include <optional>

namespace patterngate {
namespace gate {

struct GateDecision {
    bool approved = false;
    engine::DecisionReason reason = engine::DecisionReason::INSUFFICIENT_SIGNALS;
    pattern::Pattern pattern;
    unsigned int observations = 0;
    std::optional<double> win_rate;
    unsigned int consecutive_losses = 0;
};

// Pattern-history gate. Read-only against PatternMemory; recording the trade
// outcome is the ledger's job once the position closes.
class TradeGate {
public:
    TradeGate(const pattern::PatternMemory& memory, engine::GateConfig config);

    GateDecision evaluate(const SignalSet& signals) const;

    const engine::GateConfig& config() const { return config_; }

private:
    const pattern::PatternMemory& memory_;
    engine::GateConfig config_;
};

} // namespace gate
} // namespace patterngate
