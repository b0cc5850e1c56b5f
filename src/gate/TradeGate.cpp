#include "gate/TradeGate.h"
#include "common/Logger.h"

namespace patterngate {
namespace gate {

using engine::DecisionReason;

TradeGate::TradeGate(const pattern::PatternMemory& memory, engine::GateConfig config)
    : memory_(memory)
    , config_(config) {}

GateDecision TradeGate::evaluate(const SignalSet& signals) const {
    GateDecision out;
    out.pattern = pattern::PatternMemory::identify(signals);

    // 1) Minimum distinct signals
    if (static_cast<int>(out.pattern.size()) < config_.min_signals) {
        out.reason = DecisionReason::INSUFFICIENT_SIGNALS;
        LOG_INFO("gate reject [{}]: {} signals < min {}",
                 out.pattern.key(), out.pattern.size(), config_.min_signals);
        return out;
    }

    // Single snapshot so the checks below see consistent numbers
    const auto stats = memory_.stats(out.pattern);
    if (!stats || stats->total() == 0) {
        if (config_.unseen_pattern_policy == engine::UnseenPatternPolicy::DENY) {
            out.reason = DecisionReason::UNSEEN_PATTERN_DENIED;
            LOG_INFO("gate reject [{}]: unseen pattern (deny policy)", out.pattern.key());
            return out;
        }
        out.approved = true;
        out.reason = DecisionReason::APPROVED_EXPLORATION;
        LOG_INFO("gate approve [{}]: new pattern, exploring", out.pattern.key());
        return out;
    }

    out.observations = stats->total();
    out.win_rate = stats->winRate();
    out.consecutive_losses = stats->consecutive_losses;

    if (static_cast<int>(out.observations) < config_.min_sample_size) {
        out.approved = true;
        out.reason = DecisionReason::APPROVED_SAMPLE_BUILDING;
        LOG_INFO("gate approve [{}]: {} / {} samples, still exploring",
                 out.pattern.key(), out.observations, config_.min_sample_size);
        return out;
    }

    if (*out.win_rate < config_.min_win_rate) {
        out.reason = DecisionReason::LOW_WIN_RATE;
        LOG_INFO("gate reject [{}]: win rate {:.2f} < {:.2f}",
                 out.pattern.key(), *out.win_rate, config_.min_win_rate);
        return out;
    }

    if (static_cast<int>(out.consecutive_losses) >= config_.max_consecutive_losses) {
        out.reason = DecisionReason::CONSECUTIVE_LOSSES;
        LOG_INFO("gate reject [{}]: {} consecutive losses",
                 out.pattern.key(), out.consecutive_losses);
        return out;
    }

    out.approved = true;
    out.reason = DecisionReason::APPROVED;
    LOG_INFO("gate approve [{}]: win rate {:.2f} over {} trades",
             out.pattern.key(), *out.win_rate, out.observations);
    return out;
}

} // namespace gate
} // namespace patterngate
