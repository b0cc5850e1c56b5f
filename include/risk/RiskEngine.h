#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/TradeDecision.h"
#include "portfolio/Position.h"

#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace patterngate {
namespace risk {

struct RiskCheck {
    bool allowed = false;
    engine::DecisionReason reason = engine::DecisionReason::INVALID_INPUT;
};

// Process-wide risk state. Daily fields reset on each UTC day boundary.
struct RiskMetrics {
    double capital = 0.0;
    double current_exposure = 0.0;      // committed notional / capital
    double daily_drawdown = 0.0;        // loss fraction of day-start capital, >= 0
    double risk_score = 0.0;            // 0-100
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double avg_win_loss_ratio = 0.0;
    double daily_realized_pnl = 0.0;
    double unrealized_pnl = 0.0;
    int trades_today = 0;
    int open_positions = 0;
};

// Risk Engine - sizing, protective levels and the exposure/drawdown veto
class RiskEngine {
public:
    RiskEngine(double initial_capital, engine::RiskConfig config, ClockFn clock = systemNowMs);

    // ===== Sizing / pricing =====

    // Notional to commit, floored to size_increment. 0 means reject.
    double sizePosition(
        double capital,
        double signal_strength,
        double volatility,
        double current_exposure
    ) const;

    // 2:1 reward:risk by construction. nullopt for unusable inputs (zero ATR etc.)
    std::optional<StopLevels> computeStops(
        Price entry_price,
        Side side,
        double atr,
        double volatility
    ) const;

    // ===== Veto =====

    RiskCheck checkOpen(const std::string& symbol, double size, double capital);
    bool canOpenPosition(const std::string& symbol, double size, double capital);

    // Stamp the order rate limit clock
    void recordOrder(const std::string& symbol);

    // ===== Metrics =====

    // Full recomputation of exposure / drawdown / risk score from current state
    void updateMetrics(
        const std::vector<portfolio::Position>& open_positions,
        const std::map<std::string, double>& current_prices
    );

    // Realized result of a closed trade
    void recordTradeResult(double pnl);

    bool shouldReduceExposure() const;

    RiskMetrics getRiskMetrics() const;
    double currentExposure() const;
    double getCapital() const;
    void resetCapital(double capital);

    const engine::RiskConfig& config() const { return config_; }

private:
    void resetDailyIfNeeded();
    void recomputeTradeStats();
    double computeRiskScore(double exposure, double drawdown) const;
    static long long dayIndex(long long ts_ms);

    engine::RiskConfig config_;
    ClockFn clock_;

    double capital_;
    double daily_start_capital_;
    long long current_day_ = -1;
    long long last_order_time_ms_ = 0;
    bool has_last_order_ = false;

    RiskMetrics metrics_;
    std::deque<double> recent_results_;

    mutable std::shared_mutex mutex_;
};

} // namespace risk
} // namespace patterngate
