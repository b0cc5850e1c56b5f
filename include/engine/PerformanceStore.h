#pragma once

#include "common/Types.h"
#include "portfolio/Position.h"
#include <map>
#include <string>
#include <vector>

namespace patterngate {
namespace engine {

struct PerformanceStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double expectancy() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
};

// Aggregate realized trade outcomes per symbol, per exit reason and overall.
class PerformanceStore {
public:
    void rebuild(const std::vector<portfolio::TradeRecord>& history);

    const PerformanceStats& overall() const { return overall_; }
    const std::map<std::string, PerformanceStats>& bySymbol() const {
        return by_symbol_;
    }
    const std::map<ExitReason, PerformanceStats>& byExitReason() const {
        return by_exit_reason_;
    }

private:
    PerformanceStats overall_;
    std::map<std::string, PerformanceStats> by_symbol_;
    std::map<ExitReason, PerformanceStats> by_exit_reason_;
};

} // namespace engine
} // namespace patterngate
