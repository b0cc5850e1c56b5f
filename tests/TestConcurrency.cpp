#include "engine/TradingEngine.h"

#include <atomic>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace patterngate;
using engine::DecisionReason;
using engine::EngineConfig;
using engine::MarketContext;
using engine::TradingEngine;

namespace {
constexpr int kThreads = 8;

MarketContext context(double price, double atr) {
    MarketContext ctx;
    ctx.price = price;
    ctx.atr = atr;
    ctx.volatility = 0.01;
    ctx.signal_strength = 0.8;
    ctx.side = Side::LONG;
    return ctx;
}

// Releases all workers at once so the calls actually overlap
template <typename Fn>
void runTogether(int count, Fn fn) {
    std::atomic<bool> go{false};
    std::vector<std::thread> workers;
    workers.reserve(count);
    for (int i = 0; i < count; ++i) {
        workers.emplace_back([&go, &fn, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            fn(i);
        });
    }
    go.store(true);
    for (auto& t : workers) {
        t.join();
    }
}
}

int main() {
    std::cout << "[TEST] Starting Concurrency Test..." << std::endl;

    const long long now = 1700000000000LL;
    EngineConfig config;
    config.risk.min_order_interval_sec = 0;
    TradingEngine engine(config, [now]() { return now; });

    const SignalSet signals = {"rsi_oversold", "macd_cross", "volume_spike"};
    const auto pattern = pattern::PatternMemory::identify(signals);

    // 1. Racing ticks through the stop close the position exactly once
    {
        const auto d = engine.onSignals("BTC", signals, context(100.0, 1.0));
        assert(d.approved);
        assert(engine.portfolioSummary().open_count == 1);

        std::atomic<int> closes{0};
        runTogether(kThreads, [&](int) {
            const auto closed = engine.onPriceTick("BTC", 97.0);
            closes += static_cast<int>(closed.size());
            for (const auto& trade : closed) {
                assert(trade.exit_reason == ExitReason::STOP_LOSS);
            }
        });

        assert(closes.load() == 1);
        assert(engine.getTradeHistory().size() == 1);
        assert(engine.patternMemory().stats(pattern)->total() == 1);
        assert(engine.riskMetrics().trades_today == 1);
        assert(engine.portfolioSummary().open_count == 0);
    }

    // 2. Racing manual closes and ticks on one position still close it once
    {
        const auto d = engine.onSignals("ADA", signals, context(1.0, 0.01));
        assert(d.approved);

        std::atomic<int> closes{0};
        runTogether(kThreads, [&](int i) {
            if (i % 2 == 0) {
                closes += engine.closePosition("ADA", 1.01).has_value() ? 1 : 0;
            } else {
                closes += static_cast<int>(engine.onPriceTick("ADA", 0.9).size());
            }
        });

        assert(closes.load() == 1);
        assert(engine.getTradeHistory().size() == 2);
        assert(engine.patternMemory().stats(pattern)->total() == 2);
    }

    // 3. Racing entries on one symbol open a single position
    {
        std::atomic<int> approved{0};
        std::atomic<int> duplicate{0};
        runTogether(kThreads, [&](int) {
            const auto d = engine.onSignals("ETH", signals, context(50.0, 0.5));
            if (d.approved) {
                approved++;
            } else if (d.reason == DecisionReason::POSITION_ALREADY_OPEN) {
                duplicate++;
            }
        });

        assert(approved.load() == 1);
        assert(duplicate.load() == kThreads - 1);
        assert(engine.portfolioSummary().open_count == 1);
    }

    // 4. Entries on many symbols racing with ticks respect the position cap
    {
        std::atomic<int> approved{0};
        std::atomic<int> capped{0};
        runTogether(kThreads, [&](int i) {
            if (i % 2 == 0) {
                engine.onPriceTick("ETH", 50.0 + 0.01 * i);
                return;
            }
            const auto d = engine.onSignals("SYM" + std::to_string(i), signals, context(10.0, 0.1));
            if (d.approved) {
                approved++;
            } else if (d.reason == DecisionReason::MAX_POSITIONS) {
                capped++;
            }
        });

        const int slots = config.risk.max_open_positions - 1;
        assert(approved.load() == slots);
        assert(capped.load() == kThreads / 2 - slots);

        const auto summary = engine.portfolioSummary();
        const auto positions = engine.getPositions();
        assert(summary.open_count == config.risk.max_open_positions);
        assert(static_cast<int>(positions.size()) == summary.open_count);
        assert(engine.riskMetrics().open_positions == summary.open_count);

        std::set<std::string> symbols;
        for (const auto& pos : positions) {
            assert(symbols.insert(pos.symbol).second);
        }
        assert(engine.portfolioSummary() == summary);
    }

    std::cout << "[TEST] Concurrency Test PASSED!" << std::endl;
    return 0;
}
