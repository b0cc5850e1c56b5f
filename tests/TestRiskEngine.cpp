#include "risk/RiskEngine.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using patterngate::Side;
using patterngate::engine::DecisionReason;
using patterngate::engine::RiskConfig;
using patterngate::portfolio::Position;
using patterngate::risk::RiskEngine;

namespace {
constexpr long long kDayMs = 24LL * 60 * 60 * 1000;

bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

Position openPosition(const std::string& symbol, double price, double qty) {
    Position p;
    p.id = 1;
    p.symbol = symbol;
    p.entry_price = price;
    p.current_price = price;
    p.quantity = qty;
    return p;
}
}

int main() {
    long long now = 10 * kDayMs + 1000;
    auto clock = [&now]() { return now; };

    // ===== sizing =====
    {
        RiskEngine risk(10000.0, RiskConfig(), clock);

        // 10000 * 0.01 * 1.3 * 0.98 * 1.0
        assert(near(risk.sizePosition(10000.0, 0.8, 0.01, 0.0), 127.4, 1e-4));
        // strength sign does not matter
        assert(near(risk.sizePosition(10000.0, -0.8, 0.01, 0.0), 127.4, 1e-4));
        // volatility dampener bottoms out at 0.5
        assert(near(risk.sizePosition(10000.0, 0.8, 0.5, 0.0), 65.0, 1e-4));
        assert(near(risk.sizePosition(10000.0, 0.8, 3.0, 0.0), 65.0, 1e-4));
        // strength clamped to 1
        assert(near(risk.sizePosition(10000.0, 5.0, 0.0, 0.0), 150.0, 1e-4));
        // exposure dampener tapers to zero at the total risk budget
        assert(near(risk.sizePosition(10000.0, 0.8, 0.01, 0.025), 63.7, 1e-4));
        assert(risk.sizePosition(10000.0, 0.8, 0.01, 0.05) == 0.0);
        assert(risk.sizePosition(10000.0, 0.8, 0.01, 0.9) == 0.0);

        // invalid input -> 0
        assert(risk.sizePosition(-1.0, 0.8, 0.01, 0.0) == 0.0);
        assert(risk.sizePosition(0.0, 0.8, 0.01, 0.0) == 0.0);
        assert(risk.sizePosition(std::nan(""), 0.8, 0.01, 0.0) == 0.0);
        assert(risk.sizePosition(10000.0, std::numeric_limits<double>::infinity(), 0.01, 0.0) == 0.0);
        assert(risk.sizePosition(10000.0, 0.8, -0.1, 0.0) == 0.0);
    }

    // single position cap
    {
        RiskConfig config;
        config.base_fraction = 0.05;
        RiskEngine risk(10000.0, config, clock);
        const double size = risk.sizePosition(10000.0, 1.0, 0.0, 0.0);
        assert(near(size, 200.0));
        assert(size <= 10000.0 * config.max_position_size_fraction);
    }

    // rounding down to the increment
    {
        RiskConfig config;
        config.size_increment = 1.0;
        RiskEngine risk(10000.0, config, clock);
        assert(near(risk.sizePosition(10000.0, 0.8, 0.01, 0.0), 127.0));
    }

    // ===== protective levels =====
    {
        RiskEngine risk(10000.0, RiskConfig(), clock);

        const auto longs = risk.computeStops(100.0, Side::LONG, 1.0, 0.1);
        assert(longs.has_value());
        assert(near(longs->stop_loss, 97.8));
        assert(near(longs->take_profit, 104.4));
        assert(near(longs->emergency_stop, 96.7));
        assert(longs->trailing_step.has_value());
        assert(near(*longs->trailing_step, 1.0));
        // 2:1 reward:risk
        assert(near((longs->take_profit - 100.0) / (100.0 - longs->stop_loss), 2.0));
        assert(longs->emergency_stop < longs->stop_loss);

        const auto shorts = risk.computeStops(100.0, Side::SHORT, 1.0, 0.1);
        assert(shorts.has_value());
        assert(near(shorts->stop_loss, 102.2));
        assert(near(shorts->take_profit, 95.6));
        assert(near(shorts->emergency_stop, 103.3));
        assert(near((100.0 - shorts->take_profit) / (shorts->stop_loss - 100.0), 2.0));

        assert(!risk.computeStops(100.0, Side::LONG, 0.0, 0.1).has_value());
        assert(!risk.computeStops(0.0, Side::LONG, 1.0, 0.1).has_value());
        assert(!risk.computeStops(100.0, Side::LONG, 1.0, -0.1).has_value());
        assert(!risk.computeStops(100.0, Side::LONG, std::nan(""), 0.1).has_value());
        // stop distance larger than the price
        assert(!risk.computeStops(1.0, Side::LONG, 1.0, 0.0).has_value());
    }

    // ===== veto: input, rate limit =====
    {
        RiskEngine risk(10000.0, RiskConfig(), clock);
        assert(risk.checkOpen("BTC", 100.0, 0.0).reason == DecisionReason::INVALID_INPUT);
        assert(risk.checkOpen("BTC", std::nan(""), 10000.0).reason == DecisionReason::INVALID_INPUT);
        assert(risk.checkOpen("BTC", 0.0, 10000.0).reason == DecisionReason::INSUFFICIENT_SIZE);

        auto check = risk.checkOpen("BTC", 100.0, 10000.0);
        assert(check.allowed);
        assert(check.reason == DecisionReason::APPROVED);
        assert(risk.canOpenPosition("BTC", 100.0, 10000.0));

        risk.recordOrder("BTC");
        now += 30 * 1000;
        check = risk.checkOpen("ETH", 100.0, 10000.0);
        assert(!check.allowed);
        assert(check.reason == DecisionReason::RATE_LIMITED);

        now += 30 * 1000;
        assert(risk.checkOpen("ETH", 100.0, 10000.0).allowed);
    }

    // ===== veto: open position count =====
    {
        RiskEngine risk(10000.0, RiskConfig(), clock);
        risk.updateMetrics({openPosition("BTC", 100.0, 0.1), openPosition("ETH", 50.0, 0.1)}, {});
        assert(risk.checkOpen("SOL", 10.0, 10000.0).allowed);

        risk.updateMetrics({openPosition("BTC", 100.0, 0.1), openPosition("ETH", 50.0, 0.1),
                            openPosition("SOL", 10.0, 1.0)}, {});
        const auto check = risk.checkOpen("XRP", 10.0, 10000.0);
        assert(!check.allowed);
        assert(check.reason == DecisionReason::MAX_POSITIONS);
        assert(patterngate::engine::isRiskLimit(check.reason));

        // a close frees a slot
        risk.updateMetrics({openPosition("BTC", 100.0, 0.1), openPosition("ETH", 50.0, 0.1)}, {});
        assert(risk.checkOpen("XRP", 10.0, 10000.0).allowed);

        RiskConfig unlimited;
        unlimited.max_open_positions = 0;
        RiskEngine open(10000.0, unlimited, clock);
        open.updateMetrics({openPosition("BTC", 100.0, 0.1), openPosition("ETH", 50.0, 0.1),
                            openPosition("SOL", 10.0, 1.0), openPosition("ADA", 1.0, 1.0)}, {});
        assert(open.checkOpen("XRP", 10.0, 10000.0).allowed);
    }

    // ===== veto: exposure =====
    {
        RiskEngine risk(10000.0, RiskConfig(), clock);
        risk.updateMetrics({openPosition("BTC", 100.0, 4.5)}, {});
        assert(near(risk.currentExposure(), 0.045));

        // 0.045 + 0.005 sits exactly on the bound
        assert(risk.checkOpen("ETH", 50.0, 10000.0).allowed);
        const auto check = risk.checkOpen("ETH", 100.0, 10000.0);
        assert(!check.allowed);
        assert(check.reason == DecisionReason::EXPOSURE_LIMIT);

        // current price map overrides the position price
        risk.updateMetrics({openPosition("BTC", 100.0, 4.5)}, {{"BTC", 50.0}});
        assert(near(risk.currentExposure(), 0.0225));
        const auto metrics = risk.getRiskMetrics();
        assert(near(metrics.unrealized_pnl, -225.0));
        assert(metrics.open_positions == 1);
    }

    // ===== veto: drawdown, daily reset =====
    {
        RiskEngine risk(10000.0, RiskConfig(), clock);
        risk.recordTradeResult(-350.0);
        risk.updateMetrics({}, {});

        auto metrics = risk.getRiskMetrics();
        assert(near(metrics.daily_drawdown, 0.035));
        assert(near(metrics.daily_realized_pnl, -350.0));
        assert(near(metrics.capital, 9650.0));
        assert(metrics.trades_today == 1);
        // drawdown ratio clamps to 1 -> 60 points
        assert(near(metrics.risk_score, 60.0));
        assert(risk.shouldReduceExposure());

        const auto check = risk.checkOpen("BTC", 10.0, 9650.0);
        assert(!check.allowed);
        assert(check.reason == DecisionReason::DRAWDOWN_LIMIT);

        now += kDayMs;
        assert(risk.checkOpen("BTC", 10.0, 9650.0).allowed);
        metrics = risk.getRiskMetrics();
        assert(metrics.daily_drawdown == 0.0);
        assert(metrics.daily_realized_pnl == 0.0);
        assert(metrics.trades_today == 0);
        assert(near(metrics.capital, 9650.0));
        assert(!risk.shouldReduceExposure());
    }

    // ===== veto: composite score =====
    {
        RiskConfig config;
        config.max_total_risk = 0.5;
        config.exposure_weight = 90.0;
        config.drawdown_weight = 10.0;
        RiskEngine risk(10000.0, config, clock);
        risk.updateMetrics({openPosition("BTC", 100.0, 48.0)}, {});

        const auto metrics = risk.getRiskMetrics();
        assert(near(metrics.risk_score, 86.4));
        const auto check = risk.checkOpen("ETH", 10.0, 10000.0);
        assert(!check.allowed);
        assert(check.reason == DecisionReason::RISK_SCORE_LIMIT);
        assert(risk.shouldReduceExposure());
    }

    // ===== trade statistics =====
    {
        RiskEngine risk(10000.0, RiskConfig(), clock);
        risk.recordTradeResult(100.0);
        risk.recordTradeResult(-50.0);
        risk.recordTradeResult(30.0);
        risk.recordTradeResult(-20.0);
        risk.recordTradeResult(std::nan(""));

        const auto metrics = risk.getRiskMetrics();
        assert(near(metrics.win_rate, 0.5));
        assert(near(metrics.profit_factor, 130.0 / 70.0));
        assert(near(metrics.avg_win_loss_ratio, 65.0 / 35.0));
        assert(near(metrics.capital, 10060.0));
        assert(metrics.trades_today == 4);
    }

    // rolling window keeps only the latest results
    {
        RiskConfig config;
        config.trade_history_window = 2;
        RiskEngine risk(10000.0, config, clock);
        risk.recordTradeResult(-10.0);
        risk.recordTradeResult(5.0);
        risk.recordTradeResult(5.0);
        assert(near(risk.getRiskMetrics().win_rate, 1.0));
        assert(risk.getRiskMetrics().profit_factor == 0.0);
    }

    std::cout << "[TEST] RiskEngine PASSED\n";
    return 0;
}
