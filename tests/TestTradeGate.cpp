#include "gate/TradeGate.h"

#include <cassert>
#include <iostream>

using patterngate::engine::DecisionReason;
using patterngate::engine::GateConfig;
using patterngate::engine::UnseenPatternPolicy;
using patterngate::gate::TradeGate;
using patterngate::pattern::PatternMemory;

int main() {
    PatternMemory memory;
    GateConfig config;
    TradeGate gate(memory, config);

    // too few distinct signals
    {
        auto d = gate.evaluate({"A", "B"});
        assert(!d.approved);
        assert(d.reason == DecisionReason::INSUFFICIENT_SIGNALS);

        d = gate.evaluate({"A", "A", "B", "B"});
        assert(!d.approved);
        assert(d.reason == DecisionReason::INSUFFICIENT_SIGNALS);

        d = gate.evaluate({});
        assert(d.reason == DecisionReason::INSUFFICIENT_SIGNALS);
    }

    // unseen pattern fails open
    {
        const auto d = gate.evaluate({"C", "A", "B"});
        assert(d.approved);
        assert(d.reason == DecisionReason::APPROVED_EXPLORATION);
        assert(d.pattern.key() == "A|B|C");
        assert(!d.win_rate.has_value());
        assert(d.observations == 0);
    }

    // deny policy rejects the same unseen pattern
    {
        GateConfig strict = config;
        strict.unseen_pattern_policy = UnseenPatternPolicy::DENY;
        TradeGate strict_gate(memory, strict);
        const auto d = strict_gate.evaluate({"A", "B", "C"});
        assert(!d.approved);
        assert(d.reason == DecisionReason::UNSEEN_PATTERN_DENIED);
    }

    const auto abc = PatternMemory::identify({"A", "B", "C"});

    // below the sample size the gate keeps exploring, even after losses
    {
        memory.recordOutcome(abc, -1.0);
        memory.recordOutcome(abc, -1.0);
        const auto d = gate.evaluate({"A", "B", "C"});
        assert(d.approved);
        assert(d.reason == DecisionReason::APPROVED_SAMPLE_BUILDING);
        assert(d.observations == 2);
        assert(d.consecutive_losses == 2);
    }

    // at sample size: win rate below minimum
    {
        memory.recordOutcome(abc, 1.0);   // 1W 2L, streak 0
        const auto d = gate.evaluate({"B", "C", "A"});
        assert(!d.approved);
        assert(d.reason == DecisionReason::LOW_WIN_RATE);
        assert(d.win_rate.has_value());
    }

    // good win rate but losing streak
    {
        const auto p = PatternMemory::identify({"D", "E", "F"});
        memory.recordOutcome(p, 1.0);
        memory.recordOutcome(p, 1.0);
        memory.recordOutcome(p, 1.0);
        memory.recordOutcome(p, 1.0);
        assert(gate.evaluate({"D", "E", "F"}).reason == DecisionReason::APPROVED);

        memory.recordOutcome(p, -1.0);
        assert(gate.evaluate({"D", "E", "F"}).approved);
        memory.recordOutcome(p, -1.0);    // 4W 2L, streak 2
        const auto d = gate.evaluate({"D", "E", "F"});
        assert(!d.approved);
        assert(d.reason == DecisionReason::CONSECUTIVE_LOSSES);
        assert(d.consecutive_losses == 2);

        memory.recordOutcome(p, 1.0);
        assert(gate.evaluate({"D", "E", "F"}).reason == DecisionReason::APPROVED);
    }

    // thresholds come from config
    {
        GateConfig loose;
        loose.min_signals = 2;
        loose.min_win_rate = 0.3;
        TradeGate loose_gate(memory, loose);
        assert(loose_gate.evaluate({"A", "B"}).reason == DecisionReason::APPROVED_EXPLORATION);
        assert(loose_gate.evaluate({"A", "B", "C"}).reason == DecisionReason::APPROVED);
    }

    // gate never writes to memory
    {
        const auto before = memory.size();
        gate.evaluate({"P", "Q", "R"});
        assert(memory.size() == before);
    }

    std::cout << "[TEST] TradeGate PASSED\n";
    return 0;
}
