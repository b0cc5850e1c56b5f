#include "engine/TradingEngine.h"
#include "common/Logger.h"
#include "common/QuantityHelper.h"
#include "core/state/StateStoreJson.h"

#include <cmath>
#include <string>

namespace patterngate {
namespace engine {

namespace {
bool validPrice(double p) {
    return std::isfinite(p) && p > 0.0;
}

TradeDecision reject(TradeDecision decision, DecisionReason reason) {
    decision.approved = false;
    decision.reason = reason;
    decision.size_hint.reset();
    decision.quantity = 0.0;
    decision.levels.reset();
    return decision;
}
}

TradingEngine::TradingEngine(
    const EngineConfig& config,
    ClockFn clock,
    std::shared_ptr<core::IStateStore> state_store,
    std::shared_ptr<core::IEventJournal> journal
)
    : config_(config)
    , clock_(clock ? std::move(clock) : ClockFn(systemNowMs))
    , state_store_(std::move(state_store))
    , journal_(std::move(journal))
{
    pattern_memory_ = std::make_unique<pattern::PatternMemory>(clock_);
    risk_engine_ = std::make_unique<risk::RiskEngine>(config_.initial_capital, config_.risk, clock_);
    trade_gate_ = std::make_unique<gate::TradeGate>(*pattern_memory_, config_.gate);
    ledger_ = std::make_unique<portfolio::PositionLedger>(*pattern_memory_, *risk_engine_, config_.ledger, clock_);

    LOG_INFO("TradingEngine initialized - capital {:.2f}", config_.initial_capital);
    LOG_INFO("  gate: min_signals={}, min_sample={}, min_win_rate={:.2f}, max_consec_losses={}, unseen={}",
             config_.gate.min_signals, config_.gate.min_sample_size, config_.gate.min_win_rate,
             config_.gate.max_consecutive_losses,
             config_.gate.unseen_pattern_policy == UnseenPatternPolicy::EXPLORE ? "explore" : "deny");
    LOG_INFO("  ledger: trailing={}, pyramiding={}, state store={}, journal={}",
             config_.ledger.enable_trailing_stop ? "on" : "off",
             config_.ledger.allow_pyramiding ? "on" : "off",
             state_store_ ? "on" : "off",
             journal_ ? "on" : "off");
}

// ===== Decisions =====

TradeDecision TradingEngine::evaluateTrade(
    const std::string& symbol,
    const SignalSet& signals,
    double capital,
    const MarketContext& ctx
) {
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluateLocked(symbol, signals, capital, ctx);
}

std::optional<portfolio::Position> TradingEngine::openPosition(
    const TradeDecision& decision,
    const std::string& symbol,
    Price fill_price
) {
    std::lock_guard<std::mutex> lock(mutex_);
    return openLocked(decision, symbol, fill_price);
}

TradeDecision TradingEngine::onSignals(
    const std::string& symbol,
    const SignalSet& signals,
    const MarketContext& ctx
) {
    std::lock_guard<std::mutex> lock(mutex_);

    TradeDecision decision = evaluateLocked(symbol, signals, risk_engine_->getCapital(), ctx);
    if (!decision.approved) {
        journal(core::JournalEventType::TRADE_REJECTED, symbol, decision.pattern.key(),
                {{"reason", toString(decision.reason)}, {"price", ctx.price}});
        return decision;
    }

    if (!openLocked(decision, symbol, ctx.price)) {
        return reject(std::move(decision), DecisionReason::INVALID_INPUT);
    }
    return decision;
}

// ===== Position events =====

std::vector<portfolio::TradeRecord> TradingEngine::onPriceTick(const std::string& symbol, Price price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto closed = ledger_->onPriceTick(symbol, price);
    afterClose(closed);
    return closed;
}

std::optional<portfolio::TradeRecord> TradingEngine::closePosition(const std::string& symbol, Price price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = ledger_->close(symbol, price, ExitReason::MANUAL);
    if (record) {
        afterClose({*record});
    }
    return record;
}

// ===== Reports =====

portfolio::PortfolioSummary TradingEngine::portfolioSummary() const {
    return ledger_->portfolioSummary();
}

pattern::PatternReport TradingEngine::patternReport() const {
    return pattern_memory_->report();
}

risk::RiskMetrics TradingEngine::riskMetrics() const {
    return risk_engine_->getRiskMetrics();
}

PerformanceStore TradingEngine::performanceReport() const {
    PerformanceStore store;
    store.rebuild(ledger_->tradeHistory());
    return store;
}

std::vector<portfolio::Position> TradingEngine::getPositions() const {
    return ledger_->openPositions();
}

std::vector<portfolio::TradeRecord> TradingEngine::getTradeHistory() const {
    return ledger_->tradeHistory();
}

double TradingEngine::getCapital() const {
    return risk_engine_->getCapital();
}

// ===== State =====

bool TradingEngine::loadState() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_store_) {
        return false;
    }

    const auto snapshot = state_store_->load();
    if (!snapshot) {
        LOG_INFO("No saved state loaded - starting fresh");
        return false;
    }

    const std::size_t patterns = pattern_memory_->loadJson(snapshot->patterns);
    if (std::isfinite(snapshot->capital) && snapshot->capital > 0.0) {
        risk_engine_->resetCapital(snapshot->capital);
    }
    const std::size_t positions = ledger_->restore(snapshot->positions);

    LOG_INFO("State restored (saved at {}): {} patterns, {} open positions, capital {:.2f}",
             snapshot->saved_at_ms, patterns, positions, risk_engine_->getCapital());
    return true;
}

bool TradingEngine::saveState() {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveStateLocked();
}

// ===== Helpers =====

TradeDecision TradingEngine::evaluateLocked(
    const std::string& symbol,
    const SignalSet& signals,
    double capital,
    const MarketContext& ctx
) {
    TradeDecision decision;
    decision.side = ctx.side;
    decision.entry_price = ctx.price;

    // 1) pattern history
    const auto gate_decision = trade_gate_->evaluate(signals);
    decision.pattern = gate_decision.pattern;
    if (!gate_decision.approved) {
        return reject(std::move(decision), gate_decision.reason);
    }

    if (symbol.empty() || !std::isfinite(capital) || capital <= 0.0 || !validPrice(ctx.price)) {
        LOG_WARN("{} rejected: invalid input (capital={}, price={})", symbol, capital, ctx.price);
        return reject(std::move(decision), DecisionReason::INVALID_INPUT);
    }

    // 2) one position per symbol
    if (!config_.ledger.allow_pyramiding && ledger_->hasOpenPosition(symbol)) {
        LOG_INFO("{} rejected: position already open", symbol);
        return reject(std::move(decision), DecisionReason::POSITION_ALREADY_OPEN);
    }

    // 3) sizing
    const double size = risk_engine_->sizePosition(
        capital, ctx.signal_strength, ctx.volatility, risk_engine_->currentExposure());
    if (size <= 0.0) {
        LOG_WARN("{} rejected: size rounds to zero", symbol);
        return reject(std::move(decision), DecisionReason::INSUFFICIENT_SIZE);
    }

    // 4) protective levels
    const auto levels = risk_engine_->computeStops(ctx.price, ctx.side, ctx.atr, ctx.volatility);
    if (!levels) {
        return reject(std::move(decision), DecisionReason::INVALID_INPUT);
    }

    // 5) risk veto
    const auto check = risk_engine_->checkOpen(symbol, size, capital);
    if (!check.allowed) {
        return reject(std::move(decision), check.reason);
    }

    const double quantity = common::roundDownToIncrement(size / ctx.price, config_.ledger.quantity_step);
    if (quantity <= 0.0) {
        LOG_WARN("{} rejected: notional {:.5f} below one quantity step at {:.8f}", symbol, size, ctx.price);
        return reject(std::move(decision), DecisionReason::INSUFFICIENT_SIZE);
    }

    if (risk_engine_->shouldReduceExposure()) {
        LOG_WARN("{} approved while risk is elevated (score {:.1f})", symbol, risk_engine_->getRiskMetrics().risk_score);
    }

    decision.approved = true;
    decision.reason = gate_decision.reason;
    decision.size_hint = size;
    decision.quantity = quantity;
    decision.levels = levels;

    LOG_INFO("{} {} approved ({}) | size={:.5f} qty={} | SL={:.8f} TP={:.8f}",
             symbol, toString(ctx.side), toString(decision.reason), size,
             common::quantityToString(quantity, config_.ledger.quantity_step),
             levels->stop_loss, levels->take_profit);
    return decision;
}

std::optional<portfolio::Position> TradingEngine::openLocked(
    const TradeDecision& decision,
    const std::string& symbol,
    Price fill_price
) {
    if (!decision.approved || !decision.levels || decision.quantity <= 0.0) {
        LOG_WARN("{} open skipped: decision not approved ({})", symbol, toString(decision.reason));
        return std::nullopt;
    }
    if (!validPrice(fill_price)) {
        LOG_WARN("{} open skipped: invalid fill price {}", symbol, fill_price);
        return std::nullopt;
    }
    // State may have moved between evaluation and fill
    if (!config_.ledger.allow_pyramiding && ledger_->hasOpenPosition(symbol)) {
        LOG_WARN("{} open skipped: position already open", symbol);
        return std::nullopt;
    }

    // Keep the level distances, re-anchored on the fill
    StopLevels levels = *decision.levels;
    if (validPrice(decision.entry_price)) {
        const double shift = fill_price - decision.entry_price;
        levels.stop_loss += shift;
        levels.emergency_stop += shift;
        levels.take_profit += shift;
    }
    if (levels.stop_loss <= 0.0 || levels.emergency_stop <= 0.0 || levels.take_profit <= 0.0) {
        LOG_WARN("{} open skipped: levels out of range at fill {:.8f}", symbol, fill_price);
        return std::nullopt;
    }

    auto position = ledger_->open(symbol, decision.side, decision.quantity, fill_price, levels, decision.pattern);
    if (!position) {
        return std::nullopt;
    }
    risk_engine_->recordOrder(symbol);

    journal(core::JournalEventType::POSITION_OPENED, symbol, std::to_string(position->id), {
        {"side", toString(position->side)},
        {"entry_price", position->entry_price},
        {"quantity", position->quantity},
        {"stop_loss", position->stop_loss},
        {"emergency_stop", position->emergency_stop},
        {"take_profit", position->take_profit},
        {"pattern", position->pattern.key()},
        {"reason", toString(decision.reason)}
    });
    return position;
}

void TradingEngine::afterClose(const std::vector<portfolio::TradeRecord>& closed) {
    for (const auto& trade : closed) {
        journal(core::JournalEventType::POSITION_CLOSED, trade.symbol, std::to_string(trade.position_id), {
            {"side", toString(trade.side)},
            {"entry_price", trade.entry_price},
            {"exit_price", trade.exit_price},
            {"quantity", trade.quantity},
            {"realized_pnl", trade.realized_pnl},
            {"exit_reason", toString(trade.exit_reason)},
            {"pattern", trade.pattern.key()},
            {"signals", trade.pattern.signals()}
        });

        const auto stats = pattern_memory_->stats(trade.pattern);
        if (stats) {
            journal(core::JournalEventType::PATTERN_UPDATED, trade.symbol, trade.pattern.key(), {
                {"wins", stats->wins},
                {"losses", stats->losses},
                {"consecutive_losses", stats->consecutive_losses},
                {"win_rate", stats->winRate()}
            });
        }
    }

    if (!closed.empty() && config_.state.autosave_on_close && state_store_) {
        saveStateLocked();
    }
}

bool TradingEngine::saveStateLocked() {
    if (!state_store_) {
        return false;
    }

    core::StateSnapshot snapshot;
    snapshot.schema_version = core::StateStoreJson::kSchemaVersion;
    snapshot.saved_at_ms = clock_();
    snapshot.capital = risk_engine_->getCapital();
    snapshot.patterns = pattern_memory_->toJson();
    snapshot.positions = ledger_->toJson();

    if (!state_store_->save(snapshot)) {
        LOG_ERROR("State save failed");
        return false;
    }
    LOG_DEBUG("State saved: {} patterns", pattern_memory_->size());
    journal(core::JournalEventType::STATE_SAVED, "", "", {{"patterns", pattern_memory_->size()}});
    return true;
}

void TradingEngine::journal(core::JournalEventType type, const std::string& symbol,
                            const std::string& entity_id, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = clock_();
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed for {} {}", symbol, entity_id);
    }
}

} // namespace engine
} // namespace patterngate
