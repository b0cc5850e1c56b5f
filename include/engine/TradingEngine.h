#pragma once

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IStateStore.h"
#include "engine/EngineConfig.h"
#include "engine/PerformanceStore.h"
#include "engine/TradeDecision.h"
#include "gate/TradeGate.h"
#include "pattern/PatternMemory.h"
#include "portfolio/PositionLedger.h"
#include "risk/RiskEngine.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace patterngate {
namespace engine {

// Market inputs supplied alongside the signal set
struct MarketContext {
    Price price = 0.0;
    double atr = 0.0;
    double volatility = 0.0;
    double signal_strength = 0.0;   // [-1, 1]
    Side side = Side::LONG;
};

// Trading Engine - signals -> gate -> risk -> ledger, and ticks -> exits -> feedback
class TradingEngine {
public:
    TradingEngine(
        const EngineConfig& config,
        ClockFn clock = systemNowMs,
        std::shared_ptr<core::IStateStore> state_store = nullptr,
        std::shared_ptr<core::IEventJournal> journal = nullptr
    );

    // ===== Decisions =====

    // Gate + sizing + levels + risk veto. Leaves engine state untouched.
    TradeDecision evaluateTrade(
        const std::string& symbol,
        const SignalSet& signals,
        double capital,
        const MarketContext& ctx
    );

    // Apply an approved decision at the executed price
    std::optional<portfolio::Position> openPosition(
        const TradeDecision& decision,
        const std::string& symbol,
        Price fill_price
    );

    // Paper mode: evaluate against current capital and fill at ctx.price
    TradeDecision onSignals(
        const std::string& symbol,
        const SignalSet& signals,
        const MarketContext& ctx
    );

    // ===== Position events =====

    std::vector<portfolio::TradeRecord> onPriceTick(const std::string& symbol, Price price);
    std::optional<portfolio::TradeRecord> closePosition(const std::string& symbol, Price price);

    // ===== Reports =====

    portfolio::PortfolioSummary portfolioSummary() const;
    pattern::PatternReport patternReport() const;
    risk::RiskMetrics riskMetrics() const;
    PerformanceStore performanceReport() const;
    std::vector<portfolio::Position> getPositions() const;
    std::vector<portfolio::TradeRecord> getTradeHistory() const;
    double getCapital() const;

    // ===== State =====

    bool loadState();
    bool saveState();

    const pattern::PatternMemory& patternMemory() const { return *pattern_memory_; }
    const EngineConfig& config() const { return config_; }

private:
    TradeDecision evaluateLocked(
        const std::string& symbol,
        const SignalSet& signals,
        double capital,
        const MarketContext& ctx
    );
    std::optional<portfolio::Position> openLocked(
        const TradeDecision& decision,
        const std::string& symbol,
        Price fill_price
    );
    void afterClose(const std::vector<portfolio::TradeRecord>& closed);
    bool saveStateLocked();
    void journal(core::JournalEventType type, const std::string& symbol,
                 const std::string& entity_id, nlohmann::json payload);

    EngineConfig config_;
    ClockFn clock_;

    std::unique_ptr<pattern::PatternMemory> pattern_memory_;
    std::unique_ptr<risk::RiskEngine> risk_engine_;
    std::unique_ptr<gate::TradeGate> trade_gate_;
    std::unique_ptr<portfolio::PositionLedger> ledger_;

    std::shared_ptr<core::IStateStore> state_store_;
    std::shared_ptr<core::IEventJournal> journal_;

    // Serializes decision/open against tick/close
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace patterngate
