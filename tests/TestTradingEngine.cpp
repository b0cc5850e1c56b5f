#include "core/state/StateStoreJson.h"
#include "engine/TradingEngine.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

using namespace patterngate;
using engine::DecisionReason;
using engine::EngineConfig;
using engine::MarketContext;
using engine::TradingEngine;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

// Keeps appended events in memory
class MemoryJournal : public core::IEventJournal {
public:
    bool append(const core::JournalEvent& event) override {
        core::JournalEvent copy = event;
        copy.seq = events.size() + 1;
        events.push_back(copy);
        return true;
    }
    std::vector<core::JournalEvent> readFrom(std::uint64_t seq_inclusive) override {
        std::vector<core::JournalEvent> out;
        for (const auto& e : events) {
            if (e.seq >= seq_inclusive) out.push_back(e);
        }
        return out;
    }
    std::uint64_t lastSeq() const override { return events.size(); }

    std::size_t count(core::JournalEventType type) const {
        std::size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) n++;
        }
        return n;
    }

    std::vector<core::JournalEvent> events;
};

MarketContext context(double price, double atr, double vol, double strength, Side side = Side::LONG) {
    MarketContext ctx;
    ctx.price = price;
    ctx.atr = atr;
    ctx.volatility = vol;
    ctx.signal_strength = strength;
    ctx.side = side;
    return ctx;
}
}

int main() {
    long long now = 1700000000000LL;
    auto clock = [&now]() { return now; };

    const auto dir = std::filesystem::temp_directory_path() / "patterngate_test_engine";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto state_path = dir / "state.json";

    const SignalSet abc = {"rsi_oversold", "macd_cross", "volume_spike"};
    const auto abc_pattern = pattern::PatternMemory::identify(abc);

    auto journal = std::make_shared<MemoryJournal>();
    auto store = std::make_shared<core::StateStoreJson>(state_path);

    {
        TradingEngine engine(EngineConfig(), clock, store, journal);

        // gate rejects before anything else
        auto d = engine.evaluateTrade("BTC", {"rsi_oversold", "macd_cross"}, 10000.0, context(100.0, 1.0, 0.01, 0.8));
        assert(!d.approved);
        assert(d.reason == DecisionReason::INSUFFICIENT_SIGNALS);
        assert(!d.size_hint.has_value());

        // invalid inputs
        d = engine.evaluateTrade("BTC", abc, 0.0, context(100.0, 1.0, 0.01, 0.8));
        assert(d.reason == DecisionReason::INVALID_INPUT);
        d = engine.evaluateTrade("BTC", abc, std::nan(""), context(100.0, 1.0, 0.01, 0.8));
        assert(d.reason == DecisionReason::INVALID_INPUT);
        d = engine.evaluateTrade("BTC", abc, 10000.0, context(0.0, 1.0, 0.01, 0.8));
        assert(d.reason == DecisionReason::INVALID_INPUT);
        d = engine.evaluateTrade("BTC", abc, 10000.0, context(100.0, 0.0, 0.01, 0.8));
        assert(d.reason == DecisionReason::INVALID_INPUT);

        // unseen pattern: exploration with full sizing and levels
        d = engine.evaluateTrade("BTC", abc, 10000.0, context(100.0, 1.0, 0.01, 0.8));
        assert(d.approved);
        assert(d.reason == DecisionReason::APPROVED_EXPLORATION);
        assert(d.size_hint.has_value());
        assert(near(*d.size_hint, 127.4, 1e-4));
        assert(near(d.quantity, 1.274, 1e-9));
        assert(d.levels.has_value());
        assert(near(d.levels->stop_loss, 97.98));
        assert(near(d.levels->take_profit, 104.04));
        assert(d.pattern == abc_pattern);

        // evaluation leaves state untouched
        assert(engine.portfolioSummary().open_count == 0);
        assert(engine.patternMemory().size() == 0);
        assert(journal->events.empty());

        // fill slightly above the evaluated price; level distances are kept
        const auto pos = engine.openPosition(d, "BTC", 100.5);
        assert(pos.has_value());
        assert(near(pos->entry_price, 100.5));
        assert(near(pos->quantity, 1.274, 1e-9));
        assert(near(pos->stop_loss, 98.48));
        assert(near(pos->take_profit, 104.54));
        assert(journal->count(core::JournalEventType::POSITION_OPENED) == 1);

        // a rejected decision cannot be applied
        engine::TradeDecision rejected;
        assert(!engine.openPosition(rejected, "XRP", 1.0).has_value());

        // one position per symbol
        d = engine.evaluateTrade("BTC", abc, 10000.0, context(100.0, 1.0, 0.01, 0.8));
        assert(!d.approved);
        assert(d.reason == DecisionReason::POSITION_ALREADY_OPEN);

        // order rate limit applies across symbols
        d = engine.evaluateTrade("ETH", abc, 10000.0, context(50.0, 0.5, 0.01, 0.8));
        assert(!d.approved);
        assert(d.reason == DecisionReason::RATE_LIMITED);
        assert(engine::isRiskLimit(d.reason));

        now += 60 * 1000;
        d = engine.evaluateTrade("ETH", abc, 10000.0, context(50.0, 0.5, 0.01, 0.8));
        assert(d.approved);
        // existing exposure shrinks the size
        assert(*d.size_hint < 127.4);

        // take profit closes and feeds the pattern back
        const auto closed = engine.onPriceTick("BTC", 105.0);
        assert(closed.size() == 1);
        assert(closed.front().exit_reason == ExitReason::TAKE_PROFIT);
        assert(near(closed.front().realized_pnl, (105.0 - 100.5) * 1.274));
        assert(engine.patternMemory().stats(abc_pattern)->wins == 1);
        assert(journal->count(core::JournalEventType::POSITION_CLOSED) == 1);
        assert(journal->count(core::JournalEventType::PATTERN_UPDATED) == 1);
        assert(journal->count(core::JournalEventType::STATE_SAVED) == 1);
        assert(std::filesystem::exists(state_path));

        assert(!engine.closePosition("NONE", 1.0).has_value());
        assert(engine.onPriceTick("NONE", 1.0).empty());

        // paper mode: evaluate and open at the context price
        d = engine.onSignals("ETH", abc, context(50.0, 0.5, 0.01, 0.8, Side::SHORT));
        assert(d.approved);
        assert(d.reason == DecisionReason::APPROVED_SAMPLE_BUILDING);
        assert(engine.portfolioSummary().open_count == 1);
        assert(engine.getPositions().front().side == Side::SHORT);

        const double capital_before = engine.getCapital();
        assert(near(capital_before, 10000.0 + (105.0 - 100.5) * 1.274));

        // rejection is journaled
        d = engine.onSignals("SOL", {"a", "b"}, context(20.0, 0.2, 0.0, 0.5));
        assert(!d.approved);
        assert(journal->count(core::JournalEventType::TRADE_REJECTED) == 1);

        const auto summary = engine.portfolioSummary();
        assert(engine.portfolioSummary() == summary);

        const auto report = engine.patternReport();
        assert(report.patterns.size() == 1);
        assert(report.patterns.front().key == abc_pattern.key());

        const auto perf = engine.performanceReport();
        assert(perf.overall().trades == 1);
        assert(perf.bySymbol().at("BTC").wins == 1);
        assert(perf.byExitReason().at(ExitReason::TAKE_PROFIT).trades == 1);
        assert(near(perf.overall().winRate(), 1.0));

        assert(engine.saveState());
    }

    // ===== state restored into a fresh engine =====
    {
        TradingEngine engine(EngineConfig(), clock, store, nullptr);
        assert(engine.loadState());
        const auto stats = engine.patternMemory().stats(abc_pattern);
        assert(stats.has_value());
        assert(stats->wins == 1);
        assert(engine.portfolioSummary().open_count == 1);
        assert(engine.getPositions().front().symbol == "ETH");
        assert(near(engine.getCapital(), 10000.0 + (105.0 - 100.5) * 1.274));

        const auto record = engine.closePosition("ETH", 49.0);
        assert(record.has_value());
        assert(record->exit_reason == ExitReason::MANUAL);
        assert(record->realized_pnl > 0.0);
        assert(engine.patternMemory().stats(abc_pattern)->wins == 2);
    }

    // no store configured
    {
        TradingEngine engine(EngineConfig(), clock);
        assert(!engine.loadState());
        assert(!engine.saveState());
    }

    // mistyped snapshot fields drop their rows; loading does not throw
    {
        const auto bad_path = dir / "mistyped.json";
        {
            std::ofstream out(bad_path);
            out << R"({"schema_version": 2, "capital": 9000,
                "patterns": {"patterns": [
                    {"pattern": "A|B|C", "signals": ["A", "B", "C"], "wins": "three"},
                    {"pattern": "D|E|F", "signals": ["D", "E", "F"], "wins": 2, "losses": 1}
                ], "signals": {}},
                "positions": {"next_id": "x", "realized_pnl": "y", "positions": [
                    {"id": 1, "symbol": "BTC", "side": "long", "entry_price": "100", "quantity": 1},
                    {"id": 2, "symbol": "ETH", "side": "long", "entry_price": 50, "quantity": 2,
                     "signals": ["D", "E", "F"]}
                ]}})";
        }
        TradingEngine engine(EngineConfig(), clock, std::make_shared<core::StateStoreJson>(bad_path));
        assert(engine.loadState());
        assert(engine.patternMemory().size() == 1);
        assert(!engine.patternMemory().stats(pattern::PatternMemory::identify({"A", "B", "C"})).has_value());
        assert(engine.patternMemory().stats(pattern::PatternMemory::identify({"D", "E", "F"}))->wins == 2);
        const auto positions = engine.getPositions();
        assert(positions.size() == 1);
        assert(positions.front().symbol == "ETH");
        assert(positions.front().pattern == pattern::PatternMemory::identify({"F", "E", "D"}));
        assert(near(engine.getCapital(), 9000.0));
    }

    // ===== losses teach the gate to stop trading a pattern =====
    {
        EngineConfig config;
        config.risk.min_order_interval_sec = 0;
        TradingEngine engine(config, clock);
        const SignalSet losing = {"L1", "L2", "L3"};

        const DecisionReason expected[] = {
            DecisionReason::APPROVED_EXPLORATION,
            DecisionReason::APPROVED_SAMPLE_BUILDING,
            DecisionReason::APPROVED_SAMPLE_BUILDING
        };
        for (const auto reason : expected) {
            const auto d = engine.onSignals("SOL", losing, context(20.0, 0.2, 0.0, 0.3));
            assert(d.approved);
            assert(d.reason == reason);
            const auto closed = engine.onPriceTick("SOL", 19.5);
            assert(closed.size() == 1);
            assert(closed.front().exit_reason == ExitReason::STOP_LOSS);
        }

        const auto d = engine.onSignals("SOL", losing, context(20.0, 0.2, 0.0, 0.3));
        assert(!d.approved);
        assert(d.reason == DecisionReason::LOW_WIN_RATE);
        assert(engine.patternMemory().stats(pattern::PatternMemory::identify(losing))->consecutive_losses == 3);
        assert(engine.riskMetrics().trades_today == 3);
        assert(engine.riskMetrics().win_rate == 0.0);
        assert(engine.performanceReport().byExitReason().at(ExitReason::STOP_LOSS).trades == 3);
    }

    // ===== deny policy and quantity step =====
    {
        EngineConfig config;
        config.gate.unseen_pattern_policy = engine::UnseenPatternPolicy::DENY;
        TradingEngine engine(config, clock);
        const auto d = engine.evaluateTrade("BTC", abc, 10000.0, context(100.0, 1.0, 0.01, 0.8));
        assert(!d.approved);
        assert(d.reason == DecisionReason::UNSEEN_PATTERN_DENIED);
    }
    {
        EngineConfig config;
        config.ledger.quantity_step = 10.0;
        TradingEngine engine(config, clock);
        const auto d = engine.evaluateTrade("BTC", abc, 10000.0, context(100.0, 1.0, 0.01, 0.8));
        assert(!d.approved);
        assert(d.reason == DecisionReason::INSUFFICIENT_SIZE);
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] TradingEngine PASSED\n";
    return 0;
}
