#include "engine/PerformanceStore.h"

#include <cmath>

namespace patterngate {
namespace engine {
namespace {
void accumulateStats(PerformanceStats& s, const portfolio::TradeRecord& trade) {
    s.trades++;
    s.net_profit += trade.realized_pnl;
    if (trade.realized_pnl > 0.0) {
        s.wins++;
        s.gross_profit += trade.realized_pnl;
    } else if (trade.realized_pnl < 0.0) {
        s.gross_loss_abs += std::abs(trade.realized_pnl);
    }
}
}

void PerformanceStore::rebuild(const std::vector<portfolio::TradeRecord>& history) {
    overall_ = PerformanceStats();
    by_symbol_.clear();
    by_exit_reason_.clear();

    for (const auto& trade : history) {
        const std::string symbol = trade.symbol.empty() ? "unknown" : trade.symbol;
        accumulateStats(overall_, trade);
        accumulateStats(by_symbol_[symbol], trade);
        accumulateStats(by_exit_reason_[trade.exit_reason], trade);
    }
}

} // namespace engine
} // namespace patterngate
