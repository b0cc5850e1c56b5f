#include "risk/RiskEngine.h"
#include "common/Logger.h"
#include "common/QuantityHelper.h"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace patterngate {
namespace risk {

using engine::DecisionReason;

namespace {
constexpr long long kMsPerDay = 24LL * 60 * 60 * 1000;
constexpr double kEpsilon = 1e-12;

bool finite(double v) {
    return std::isfinite(v);
}
}

RiskEngine::RiskEngine(double initial_capital, engine::RiskConfig config, ClockFn clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : ClockFn(systemNowMs))
    , capital_(initial_capital)
    , daily_start_capital_(initial_capital)
{
    metrics_.capital = capital_;
    current_day_ = dayIndex(clock_());
    LOG_INFO("RiskEngine initialized - capital {:.2f}, max total risk {:.2f}%, max daily drawdown {:.2f}%",
             initial_capital, config_.max_total_risk * 100.0, config_.max_daily_drawdown * 100.0);
}

// ===== Sizing =====

double RiskEngine::sizePosition(
    double capital,
    double signal_strength,
    double volatility,
    double current_exposure
) const {
    if (!finite(capital) || capital <= 0.0 ||
        !finite(signal_strength) || !finite(volatility) || volatility < 0.0 ||
        !finite(current_exposure)) {
        LOG_WARN("sizePosition: invalid input (capital={}, strength={}, vol={}, exposure={})",
                 capital, signal_strength, volatility, current_exposure);
        return 0.0;
    }
    if (config_.max_total_risk <= 0.0) {
        return 0.0;
    }

    const double strength = std::clamp(signal_strength, -1.0, 1.0);
    const double exposure = std::clamp(current_exposure, 0.0, 1.0);

    const double base_size = capital * config_.base_fraction;
    // 0.5 .. 1.5 depending on conviction
    const double signal_multiplier = 0.5 + std::fabs(strength);
    // shrink in volatile markets, never below half
    const double volatility_multiplier = std::clamp(1.0 - (volatility * 2.0), 0.5, 1.0);
    // taper to zero as exposure approaches the total risk budget
    const double exposure_multiplier = std::clamp(1.0 - (exposure / config_.max_total_risk), 0.0, 1.0);

    double size = base_size * signal_multiplier * volatility_multiplier * exposure_multiplier;

    const double max_allowed = capital * config_.max_position_size_fraction;
    size = std::min(size, max_allowed);

    const double rounded = common::roundDownToIncrement(size, config_.size_increment);
    return std::min(rounded, max_allowed);
}

std::optional<StopLevels> RiskEngine::computeStops(
    Price entry_price,
    Side side,
    double atr,
    double volatility
) const {
    if (!finite(entry_price) || entry_price <= 0.0 ||
        !finite(atr) || atr <= 0.0 ||
        !finite(volatility) || volatility < 0.0) {
        LOG_WARN("computeStops: invalid input (entry={}, atr={}, vol={})", entry_price, atr, volatility);
        return std::nullopt;
    }

    const double base_stop = atr * config_.atr_multiplier;
    const double adjusted_stop = base_stop * (1.0 + volatility);
    const double sign = sideSign(side);

    StopLevels levels;
    levels.stop_loss = entry_price - sign * adjusted_stop;
    levels.take_profit = entry_price + sign * 2.0 * adjusted_stop;
    levels.emergency_stop = entry_price - sign * config_.emergency_multiplier * adjusted_stop;
    levels.trailing_step = base_stop * config_.trailing_fraction;

    // Stop distance wider than the price itself
    if (levels.stop_loss <= 0.0 || levels.take_profit <= 0.0 || levels.emergency_stop <= 0.0) {
        LOG_WARN("computeStops: levels out of range for entry {:.8f} atr {:.8f}", entry_price, atr);
        return std::nullopt;
    }
    return levels;
}

// ===== Veto =====

RiskCheck RiskEngine::checkOpen(const std::string& symbol, double size, double capital) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    resetDailyIfNeeded();

    if (!finite(capital) || capital <= 0.0 || !finite(size) || size < 0.0) {
        LOG_WARN("{} entry blocked: invalid size {} / capital {}", symbol, size, capital);
        return {false, DecisionReason::INVALID_INPUT};
    }
    if (size <= 0.0) {
        LOG_WARN("{} entry blocked: size rounds to zero", symbol);
        return {false, DecisionReason::INSUFFICIENT_SIZE};
    }

    // 1) order rate limit
    if (has_last_order_) {
        const long long elapsed_ms = clock_() - last_order_time_ms_;
        if (elapsed_ms < static_cast<long long>(config_.min_order_interval_sec) * 1000LL) {
            LOG_WARN("{} entry blocked: {} ms since last order < {} s",
                     symbol, elapsed_ms, config_.min_order_interval_sec);
            return {false, DecisionReason::RATE_LIMITED};
        }
    }

    // 2) open position count
    if (config_.max_open_positions > 0 && metrics_.open_positions >= config_.max_open_positions) {
        LOG_WARN("{} entry blocked: {} open positions, limit {}",
                 symbol, metrics_.open_positions, config_.max_open_positions);
        return {false, DecisionReason::MAX_POSITIONS};
    }

    // 3) total exposure
    const double new_exposure = (size / capital) + metrics_.current_exposure;
    if (new_exposure > config_.max_total_risk + kEpsilon) {
        LOG_WARN("{} entry blocked: exposure {:.4f} + {:.4f} > {:.4f}",
                 symbol, metrics_.current_exposure, size / capital, config_.max_total_risk);
        return {false, DecisionReason::EXPOSURE_LIMIT};
    }

    // 4) daily drawdown
    if (metrics_.daily_drawdown > config_.max_daily_drawdown) {
        LOG_ERROR("{} entry blocked: daily drawdown {:.2f}% > {:.2f}%",
                  symbol, metrics_.daily_drawdown * 100.0, config_.max_daily_drawdown * 100.0);
        return {false, DecisionReason::DRAWDOWN_LIMIT};
    }

    // 5) composite risk score
    if (metrics_.risk_score > config_.risk_score_ceiling) {
        LOG_WARN("{} entry blocked: risk score {:.1f} > {:.1f}",
                 symbol, metrics_.risk_score, config_.risk_score_ceiling);
        return {false, DecisionReason::RISK_SCORE_LIMIT};
    }

    return {true, DecisionReason::APPROVED};
}

bool RiskEngine::canOpenPosition(const std::string& symbol, double size, double capital) {
    return checkOpen(symbol, size, capital).allowed;
}

void RiskEngine::recordOrder(const std::string& symbol) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    last_order_time_ms_ = clock_();
    has_last_order_ = true;
    LOG_DEBUG("{} order recorded at {}", symbol, last_order_time_ms_);
}

// ===== Metrics =====

void RiskEngine::updateMetrics(
    const std::vector<portfolio::Position>& open_positions,
    const std::map<std::string, double>& current_prices
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    resetDailyIfNeeded();

    double total_notional = 0.0;
    double unrealized = 0.0;
    int open_count = 0;

    for (const auto& pos : open_positions) {
        if (pos.status != PositionStatus::OPEN) {
            continue;
        }
        double price = pos.current_price;
        const auto it = current_prices.find(pos.symbol);
        if (it != current_prices.end() && finite(it->second) && it->second > 0.0) {
            price = it->second;
        }
        total_notional += price * pos.quantity;
        unrealized += (price - pos.entry_price) * pos.quantity * sideSign(pos.side);
        open_count++;
    }

    metrics_.current_exposure = (capital_ > 0.0) ? (total_notional / capital_) : 0.0;
    metrics_.unrealized_pnl = unrealized;
    metrics_.open_positions = open_count;

    const double day_pnl = metrics_.daily_realized_pnl + unrealized;
    metrics_.daily_drawdown = (daily_start_capital_ > 0.0)
        ? std::max(0.0, -day_pnl) / daily_start_capital_
        : 0.0;

    metrics_.risk_score = computeRiskScore(metrics_.current_exposure, metrics_.daily_drawdown);
    metrics_.capital = capital_;

    LOG_DEBUG("risk metrics: exposure {:.4f}, drawdown {:.4f}, score {:.1f}",
              metrics_.current_exposure, metrics_.daily_drawdown, metrics_.risk_score);
}

void RiskEngine::recordTradeResult(double pnl) {
    if (!finite(pnl)) {
        LOG_WARN("recordTradeResult: non-finite pnl ignored");
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    resetDailyIfNeeded();

    capital_ += pnl;
    metrics_.capital = capital_;
    metrics_.daily_realized_pnl += pnl;
    metrics_.trades_today++;

    recent_results_.push_back(pnl);
    const std::size_t window = static_cast<std::size_t>(std::max(1, config_.trade_history_window));
    while (recent_results_.size() > window) {
        recent_results_.pop_front();
    }
    recomputeTradeStats();
}

bool RiskEngine::shouldReduceExposure() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metrics_.risk_score > config_.reduce_exposure_score ||
           metrics_.daily_drawdown > (config_.max_daily_drawdown * 0.8);
}

RiskMetrics RiskEngine::getRiskMetrics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metrics_;
}

double RiskEngine::currentExposure() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metrics_.current_exposure;
}

double RiskEngine::getCapital() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return capital_;
}

void RiskEngine::resetCapital(double capital) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    capital_ = capital;
    daily_start_capital_ = capital;
    metrics_.capital = capital;
    LOG_INFO("RiskEngine capital reset -> {:.2f}", capital);
}

// ===== Helpers =====

void RiskEngine::resetDailyIfNeeded() {
    const long long today = dayIndex(clock_());
    if (today == current_day_) {
        return;
    }
    current_day_ = today;
    daily_start_capital_ = capital_;
    metrics_.daily_realized_pnl = 0.0;
    metrics_.trades_today = 0;
    metrics_.daily_drawdown = 0.0;
    metrics_.risk_score = computeRiskScore(metrics_.current_exposure, 0.0);
    LOG_INFO("new trading day {} - daily counters reset (start capital {:.2f})", today, daily_start_capital_);
}

void RiskEngine::recomputeTradeStats() {
    int wins = 0;
    int losses = 0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    for (double r : recent_results_) {
        if (r > 0.0) {
            wins++;
            gross_profit += r;
        } else if (r < 0.0) {
            losses++;
            gross_loss += std::fabs(r);
        }
    }

    const double total = static_cast<double>(recent_results_.size());
    metrics_.win_rate = total > 0.0 ? static_cast<double>(wins) / total : 0.0;
    metrics_.profit_factor = gross_loss > kEpsilon ? gross_profit / gross_loss : 0.0;

    const double avg_win = wins > 0 ? gross_profit / wins : 0.0;
    const double avg_loss = losses > 0 ? gross_loss / losses : 0.0;
    metrics_.avg_win_loss_ratio = avg_loss > kEpsilon ? avg_win / avg_loss : 0.0;
}

double RiskEngine::computeRiskScore(double exposure, double drawdown) const {
    const double exposure_ratio = config_.max_total_risk > 0.0
        ? std::clamp(exposure / config_.max_total_risk, 0.0, 1.0)
        : 1.0;
    const double drawdown_ratio = config_.max_daily_drawdown > 0.0
        ? std::clamp(drawdown / config_.max_daily_drawdown, 0.0, 1.0)
        : 0.0;
    const double score = exposure_ratio * config_.exposure_weight + drawdown_ratio * config_.drawdown_weight;
    return std::clamp(score, 0.0, 100.0);
}

long long RiskEngine::dayIndex(long long ts_ms) {
    return ts_ms / kMsPerDay;
}

} // namespace risk
} // namespace patterngate
