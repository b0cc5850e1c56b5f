#include "portfolio/PositionLedger.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace patterngate {
namespace portfolio {

namespace {
bool validPrice(double p) {
    return std::isfinite(p) && p > 0.0;
}

nlohmann::json positionToJson(const Position& pos) {
    nlohmann::json j;
    j["id"] = pos.id;
    j["symbol"] = pos.symbol;
    j["side"] = toString(pos.side);
    j["entry_price"] = pos.entry_price;
    j["quantity"] = pos.quantity;
    j["entry_time"] = pos.entry_time;
    j["stop_loss"] = pos.stop_loss;
    j["emergency_stop"] = pos.emergency_stop;
    j["take_profit"] = pos.take_profit;
    if (pos.trailing_step) {
        j["trailing_step"] = *pos.trailing_step;
    }
    j["trailing_anchor"] = pos.trailing_anchor;
    j["current_price"] = pos.current_price;
    j["pattern"] = pos.pattern.key();
    j["signals"] = pos.pattern.signals();
    return j;
}

std::optional<Position> positionFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    Position pos;
    try {
        const auto side = sideFromString(j.value("side", std::string()));
        if (!side) {
            return std::nullopt;
        }
        pos.id = j.value("id", static_cast<std::uint64_t>(0));
        pos.symbol = j.value("symbol", std::string());
        pos.side = *side;
        pos.entry_price = j.value("entry_price", 0.0);
        pos.quantity = j.value("quantity", 0.0);
        pos.entry_time = j.value("entry_time", 0LL);
        pos.stop_loss = j.value("stop_loss", 0.0);
        pos.emergency_stop = j.value("emergency_stop", 0.0);
        pos.take_profit = j.value("take_profit", 0.0);
        if (j.contains("trailing_step") && j["trailing_step"].is_number()) {
            pos.trailing_step = j["trailing_step"].get<double>();
        }
        pos.trailing_anchor = j.value("trailing_anchor", pos.entry_price);
        pos.current_price = j.value("current_price", pos.entry_price);
        pos.pattern = pattern::Pattern::fromSignals(j.value("signals", SignalSet{}));
    } catch (const nlohmann::json::type_error& e) {
        LOG_WARN("ledger restore: mistyped position field: {}", e.what());
        return std::nullopt;
    }
    pos.unrealized_pnl = (pos.current_price - pos.entry_price) * pos.quantity * sideSign(pos.side);

    if (pos.id == 0 || pos.symbol.empty() || !validPrice(pos.entry_price) || !(pos.quantity > 0.0)) {
        return std::nullopt;
    }
    return pos;
}
}

PositionLedger::PositionLedger(
    pattern::PatternMemory& pattern_memory,
    risk::RiskEngine& risk_engine,
    engine::LedgerConfig config,
    ClockFn clock
)
    : pattern_memory_(pattern_memory)
    , risk_engine_(risk_engine)
    , config_(config)
    , clock_(clock ? std::move(clock) : ClockFn(systemNowMs)) {}

// ===== Lifecycle =====

std::optional<Position> PositionLedger::open(
    const std::string& symbol,
    Side side,
    Quantity quantity,
    Price entry_price,
    const StopLevels& levels,
    const pattern::Pattern& pattern
) {
    if (!std::isfinite(quantity) || quantity <= 0.0) {
        LOG_WARN("{} open rejected: quantity {} <= 0", symbol, quantity);
        return std::nullopt;
    }
    if (!validPrice(entry_price) || symbol.empty()) {
        LOG_WARN("{} open rejected: invalid entry price {}", symbol, entry_price);
        return std::nullopt;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    Position pos;
    pos.id = next_id_++;
    pos.symbol = symbol;
    pos.side = side;
    pos.entry_price = entry_price;
    pos.quantity = quantity;
    pos.entry_time = clock_();
    pos.stop_loss = levels.stop_loss;
    pos.emergency_stop = levels.emergency_stop;
    pos.take_profit = levels.take_profit;
    if (config_.enable_trailing_stop && levels.trailing_step && *levels.trailing_step > 0.0) {
        pos.trailing_step = levels.trailing_step;
    }
    pos.trailing_anchor = entry_price;
    pos.current_price = entry_price;
    pos.unrealized_pnl = 0.0;
    pos.pattern = pattern;
    pos.status = PositionStatus::OPEN;

    positions_.emplace(pos.id, pos);
    last_prices_[symbol] = entry_price;

    LOG_INFO("Position opened: #{} {} {} | qty={:.8f} @ {:.8f} | SL={:.8f} EM={:.8f} TP={:.8f} | pattern [{}]",
             pos.id, symbol, toString(side), quantity, entry_price,
             pos.stop_loss, pos.emergency_stop, pos.take_profit, pattern.key());

    refreshRiskLocked();
    return pos;
}

std::vector<TradeRecord> PositionLedger::onPriceTick(const std::string& symbol, Price price) {
    std::vector<TradeRecord> closed;
    if (!validPrice(price)) {
        LOG_WARN("{} tick ignored: invalid price {}", symbol, price);
        return closed;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    last_prices_[symbol] = price;

    bool touched = false;
    for (auto it = positions_.begin(); it != positions_.end();) {
        auto& pos = it->second;
        if (pos.symbol != symbol) {
            ++it;
            continue;
        }

        touched = true;
        pos.current_price = price;
        pos.unrealized_pnl = (price - pos.entry_price) * pos.quantity * sideSign(pos.side);
        ratchetTrailingStop(pos, price);

        const auto reason = exitTriggered(pos, price);
        if (!reason) {
            ++it;
            continue;
        }

        auto next = std::next(it);
        closed.push_back(closeLocked(it, price, *reason));
        it = next;
    }

    // Stale tick (no position on the symbol) only refreshes the last price
    if (touched) {
        refreshRiskLocked();
    }
    return closed;
}

std::optional<TradeRecord> PositionLedger::close(const std::string& symbol, Price exit_price,
                                                 ExitReason reason) {
    if (!validPrice(exit_price)) {
        LOG_WARN("{} close rejected: invalid exit price {}", symbol, exit_price);
        return std::nullopt;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(positions_.begin(), positions_.end(),
                           [&symbol](const auto& kv) { return kv.second.symbol == symbol; });
    if (it == positions_.end()) {
        LOG_WARN("{} close: no open position", symbol);
        return std::nullopt;
    }

    last_prices_[symbol] = exit_price;
    TradeRecord record = closeLocked(it, exit_price, reason);
    refreshRiskLocked();
    return record;
}

std::optional<TradeRecord> PositionLedger::closeById(std::uint64_t id, Price exit_price,
                                                     ExitReason reason) {
    if (!validPrice(exit_price)) {
        LOG_WARN("#{} close rejected: invalid exit price {}", id, exit_price);
        return std::nullopt;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        LOG_WARN("#{} close: not found", id);
        return std::nullopt;
    }

    last_prices_[it->second.symbol] = exit_price;
    TradeRecord record = closeLocked(it, exit_price, reason);
    refreshRiskLocked();
    return record;
}

// ===== Queries =====

PortfolioSummary PositionLedger::portfolioSummary() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    PortfolioSummary summary;
    for (const auto& [id, pos] : positions_) {
        summary.open_count++;
        summary.total_exposure += pos.notional();
        summary.total_unrealized_pnl += pos.unrealized_pnl;
    }
    summary.total_realized_pnl = realized_pnl_;
    return summary;
}

std::vector<Position> PositionLedger::openPositions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [id, pos] : positions_) {
        out.push_back(pos);
    }
    return out;
}

std::optional<Position> PositionLedger::getPosition(std::uint64_t id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PositionLedger::hasOpenPosition(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::any_of(positions_.begin(), positions_.end(),
                       [&symbol](const auto& kv) { return kv.second.symbol == symbol; });
}

std::vector<TradeRecord> PositionLedger::tradeHistory() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trade_history_;
}

std::optional<Price> PositionLedger::lastPrice(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = last_prices_.find(symbol);
    if (it == last_prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ===== Persistence =====

nlohmann::json PositionLedger::toJson() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& [id, pos] : positions_) {
        rows.push_back(positionToJson(pos));
    }
    return {{"next_id", next_id_}, {"realized_pnl", realized_pnl_}, {"positions", rows}};
}

std::size_t PositionLedger::restore(const nlohmann::json& doc) {
    std::map<std::uint64_t, Position> positions;
    std::map<std::string, double> last_prices;
    double realized_pnl = 0.0;
    std::uint64_t next_id = 1;

    if (!doc.is_object()) {
        LOG_WARN("ledger restore: snapshot is not an object");
    } else {
        const auto pnl = doc.find("realized_pnl");
        if (pnl != doc.end() && pnl->is_number()) {
            realized_pnl = pnl->get<double>();
        }
        const auto id = doc.find("next_id");
        if (id != doc.end() && id->is_number_integer() && id->get<long long>() > 0) {
            next_id = id->get<std::uint64_t>();
        }

        const auto rows = doc.find("positions");
        if (rows != doc.end() && rows->is_array()) {
            for (const auto& row : *rows) {
                auto pos = positionFromJson(row);
                if (!pos || positions.count(pos->id) > 0) {
                    LOG_WARN("ledger restore: skipping malformed position");
                    continue;
                }
                next_id = std::max(next_id, pos->id + 1);
                last_prices[pos->symbol] = pos->current_price;
                positions.emplace(pos->id, std::move(*pos));
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    positions_ = std::move(positions);
    last_prices_ = std::move(last_prices);
    realized_pnl_ = realized_pnl;
    next_id_ = next_id;

    LOG_INFO("ledger restored: {} open positions", positions_.size());
    refreshRiskLocked();
    return positions_.size();
}

// ===== Helpers =====

std::optional<ExitReason> PositionLedger::exitTriggered(const Position& pos, Price price) {
    // Fixed priority: emergency stop, stop loss, take profit. A level of 0 is unset.
    if (pos.side == Side::LONG) {
        if (pos.emergency_stop > 0.0 && price <= pos.emergency_stop) return ExitReason::EMERGENCY_STOP;
        if (pos.stop_loss > 0.0 && price <= pos.stop_loss) return ExitReason::STOP_LOSS;
        if (pos.take_profit > 0.0 && price >= pos.take_profit) return ExitReason::TAKE_PROFIT;
    } else {
        if (pos.emergency_stop > 0.0 && price >= pos.emergency_stop) return ExitReason::EMERGENCY_STOP;
        if (pos.stop_loss > 0.0 && price >= pos.stop_loss) return ExitReason::STOP_LOSS;
        if (pos.take_profit > 0.0 && price <= pos.take_profit) return ExitReason::TAKE_PROFIT;
    }
    return std::nullopt;
}

void PositionLedger::ratchetTrailingStop(Position& pos, Price price) const {
    if (!pos.trailing_step || *pos.trailing_step <= 0.0) {
        return;
    }
    const double step = *pos.trailing_step;
    // Distance the price has advanced past the anchor in the position's favour
    const double advance = (price - pos.trailing_anchor) * sideSign(pos.side);
    if (advance < step) {
        return;
    }

    const double steps = std::floor(advance / step);
    const double shift = steps * step * sideSign(pos.side);
    const double old_stop = pos.stop_loss;
    pos.stop_loss += shift;
    pos.trailing_anchor += shift;

    LOG_INFO("#{} {} trailing stop {:.8f} -> {:.8f}", pos.id, pos.symbol, old_stop, pos.stop_loss);
}

TradeRecord PositionLedger::closeLocked(std::map<std::uint64_t, Position>::iterator it,
                                        Price exit_price, ExitReason reason) {
    Position pos = it->second;
    pos.status = PositionStatus::CLOSED;

    const double sign = sideSign(pos.side);
    const double pnl = (exit_price - pos.entry_price) * pos.quantity * sign;

    TradeRecord record;
    record.position_id = pos.id;
    record.symbol = pos.symbol;
    record.side = pos.side;
    record.entry_price = pos.entry_price;
    record.exit_price = exit_price;
    record.quantity = pos.quantity;
    record.realized_pnl = pnl;
    record.realized_pnl_pct = (exit_price - pos.entry_price) / pos.entry_price * sign;
    record.entry_time = pos.entry_time;
    record.exit_time = clock_();
    record.exit_reason = reason;
    record.pattern = pos.pattern;

    positions_.erase(it);
    trade_history_.push_back(record);
    realized_pnl_ += pnl;

    // Feedback: pattern learns from the result, risk books the realized pnl
    pattern_memory_.recordOutcome(pos.pattern, pnl);
    risk_engine_.recordTradeResult(pnl);

    LOG_INFO("Position closed: #{} {} {} | {} | entry={:.8f} exit={:.8f} | pnl={:.4f} ({:+.2f}%)",
             record.position_id, record.symbol, toString(record.side), toString(reason),
             record.entry_price, record.exit_price, pnl, record.realized_pnl_pct * 100.0);
    Logger::getInstance().logTrade(record.symbol, toString(record.side), record.entry_price,
                                   record.exit_price, record.quantity, pnl, toString(reason));
    return record;
}

void PositionLedger::refreshRiskLocked() {
    std::vector<Position> open;
    open.reserve(positions_.size());
    for (const auto& [id, pos] : positions_) {
        open.push_back(pos);
    }
    risk_engine_.updateMetrics(open, last_prices_);
}

} // namespace portfolio
} // namespace patterngate
