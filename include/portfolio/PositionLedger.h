#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "pattern/PatternMemory.h"
#include "portfolio/Position.h"
#include "risk/RiskEngine.h"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace patterngate {
namespace portfolio {

struct PortfolioSummary {
    int open_count = 0;
    double total_exposure = 0.0;        // sum of open notional at last price
    double total_unrealized_pnl = 0.0;
    double total_realized_pnl = 0.0;

    bool operator==(const PortfolioSummary& o) const {
        return open_count == o.open_count &&
               total_exposure == o.total_exposure &&
               total_unrealized_pnl == o.total_unrealized_pnl &&
               total_realized_pnl == o.total_realized_pnl;
    }
};

// Position Ledger - open positions, exit enforcement and outcome feedback.
// Each close is applied atomically under the ledger lock: history append,
// pattern outcome and risk metrics are updated before the next tick is seen.
class PositionLedger {
public:
    PositionLedger(
        pattern::PatternMemory& pattern_memory,
        risk::RiskEngine& risk_engine,
        engine::LedgerConfig config,
        ClockFn clock = systemNowMs
    );

    // ===== Lifecycle =====

    std::optional<Position> open(
        const std::string& symbol,
        Side side,
        Quantity quantity,
        Price entry_price,
        const StopLevels& levels,
        const pattern::Pattern& pattern
    );

    // Mark to market and enforce exits; returns the trades closed by this tick
    std::vector<TradeRecord> onPriceTick(const std::string& symbol, Price price);

    // Manual / forced close of the oldest open position on the symbol
    std::optional<TradeRecord> close(const std::string& symbol, Price exit_price,
                                     ExitReason reason = ExitReason::MANUAL);
    std::optional<TradeRecord> closeById(std::uint64_t id, Price exit_price,
                                         ExitReason reason = ExitReason::MANUAL);

    // ===== Queries =====

    PortfolioSummary portfolioSummary() const;
    std::vector<Position> openPositions() const;
    std::optional<Position> getPosition(std::uint64_t id) const;
    bool hasOpenPosition(const std::string& symbol) const;
    std::vector<TradeRecord> tradeHistory() const;
    std::optional<Price> lastPrice(const std::string& symbol) const;

    // ===== Persistence =====

    nlohmann::json toJson() const;
    // Replaces open positions with the snapshot; returns positions restored
    std::size_t restore(const nlohmann::json& doc);

private:
    static std::optional<ExitReason> exitTriggered(const Position& pos, Price price);
    void ratchetTrailingStop(Position& pos, Price price) const;
    TradeRecord closeLocked(std::map<std::uint64_t, Position>::iterator it,
                            Price exit_price, ExitReason reason);
    void refreshRiskLocked();

    pattern::PatternMemory& pattern_memory_;
    risk::RiskEngine& risk_engine_;
    engine::LedgerConfig config_;
    ClockFn clock_;

    std::uint64_t next_id_ = 1;
    std::map<std::uint64_t, Position> positions_;   // id order == entry order
    std::vector<TradeRecord> trade_history_;
    std::map<std::string, double> last_prices_;
    double realized_pnl_ = 0.0;

    mutable std::shared_mutex mutex_;
};

} // namespace portfolio
} // namespace patterngate
