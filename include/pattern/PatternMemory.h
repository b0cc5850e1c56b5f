#pragma once

#include "common/Types.h"
#include "pattern/Pattern.h"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace patterngate {
namespace pattern {

struct PatternStats {
    static constexpr std::size_t kRecentCapacity = 5;

    unsigned int wins = 0;
    unsigned int losses = 0;
    unsigned int consecutive_losses = 0;
    OutcomeResult last_result = OutcomeResult::UNKNOWN;
    std::deque<double> recent_outcomes;     // last realized returns, oldest first
    long long last_seen_ms = 0;

    unsigned int total() const { return wins + losses; }
    double winRate() const {
        return total() > 0 ? static_cast<double>(wins) / static_cast<double>(total()) : 0.0;
    }
    double avgRecentOutcome() const;
};

// Per-signal hit rate; weight = 2 * win_rate, 1.0 when unseen
struct SignalPerformance {
    unsigned int total = 0;
    unsigned int wins = 0;
    double weight = 1.0;
};

struct PatternReportRow {
    std::string key;
    unsigned int wins = 0;
    unsigned int losses = 0;
    double win_rate = 0.0;
    unsigned int consecutive_losses = 0;
    double avg_recent_outcome = 0.0;
};

struct PatternReport {
    std::vector<PatternReportRow> patterns;
    std::map<std::string, SignalPerformance> signals;
};

// Pattern -> outcome statistics. Stats live in a dense arena indexed through
// the pattern map; entries are created on first outcome and never removed.
class PatternMemory {
public:
    explicit PatternMemory(ClockFn clock = systemNowMs);

    static Pattern identify(const SignalSet& signals);

    void recordOutcome(const Pattern& pattern, double profit);

    std::optional<PatternStats> stats(const Pattern& pattern) const;
    // nullopt when the pattern has no observations (distinct from a 0% win rate)
    std::optional<double> winRate(const Pattern& pattern) const;
    unsigned int totalObservations(const Pattern& pattern) const;

    double signalWeight(const SignalLabel& signal) const;
    std::optional<SignalPerformance> signalStats(const SignalLabel& signal) const;

    std::size_t size() const;
    PatternReport report() const;

    nlohmann::json toJson() const;
    // Replaces current contents; rows that are malformed or mistyped are
    // skipped. Never throws on snapshot data. Returns patterns loaded.
    std::size_t loadJson(const nlohmann::json& doc);

private:
    std::optional<std::size_t> findIndex(const Pattern& pattern) const;
    std::size_t findOrCreate(const Pattern& pattern);

    ClockFn clock_;
    std::vector<PatternStats> arena_;
    std::vector<Pattern> arena_keys_;
    std::unordered_map<Pattern, std::size_t, PatternHash> index_;
    std::map<std::string, SignalPerformance> signal_performance_;

    mutable std::shared_mutex mutex_;
};

} // namespace pattern
} // namespace patterngate
