#include "pattern/PatternMemory.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>
#include <utility>

namespace patterngate {
namespace pattern {

namespace {
const char* resultToString(OutcomeResult r) {
    switch (r) {
        case OutcomeResult::WIN: return "WIN";
        case OutcomeResult::LOSS: return "LOSS";
        case OutcomeResult::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

OutcomeResult resultFromString(const std::string& v) {
    if (v == "WIN") return OutcomeResult::WIN;
    if (v == "LOSS") return OutcomeResult::LOSS;
    return OutcomeResult::UNKNOWN;
}

// Absent is fine (defaults apply); present with the wrong type is not
bool countField(const nlohmann::json& row, const char* name) {
    const auto it = row.find(name);
    return it == row.end() || it->is_number_unsigned()
        || (it->is_number_integer() && it->get<long long>() >= 0);
}

bool numberField(const nlohmann::json& row, const char* name) {
    const auto it = row.find(name);
    return it == row.end() || it->is_number();
}

std::optional<std::pair<Pattern, PatternStats>> rowFromJson(const nlohmann::json& row) {
    if (!row.is_object()) {
        return std::nullopt;
    }
    const auto labels = row.find("signals");
    if (labels == row.end() || !labels->is_array()) {
        return std::nullopt;
    }
    SignalSet signals;
    for (const auto& label : *labels) {
        if (!label.is_string()) {
            return std::nullopt;
        }
        signals.push_back(label.get<std::string>());
    }
    Pattern pattern = Pattern::fromSignals(signals);
    if (pattern.empty()) {
        return std::nullopt;
    }

    if (!countField(row, "wins") || !countField(row, "losses") || !countField(row, "consecutive_losses")
        || !numberField(row, "last_seen_ms")) {
        return std::nullopt;
    }
    const auto last_result = row.find("last_result");
    if (last_result != row.end() && !last_result->is_string()) {
        return std::nullopt;
    }
    const auto recent = row.find("recent_outcomes");
    if (recent != row.end() && !recent->is_array()) {
        return std::nullopt;
    }

    PatternStats s;
    s.wins = row.value("wins", 0u);
    s.losses = row.value("losses", 0u);
    s.consecutive_losses = std::min(s.losses, row.value("consecutive_losses", 0u));
    s.last_result = resultFromString(row.value("last_result", std::string("UNKNOWN")));
    s.last_seen_ms = row.value("last_seen_ms", 0LL);
    if (recent != row.end()) {
        for (const auto& v : *recent) {
            if (!v.is_number()) {
                return std::nullopt;
            }
            s.recent_outcomes.push_back(v.get<double>());
        }
    }
    while (s.recent_outcomes.size() > PatternStats::kRecentCapacity) {
        s.recent_outcomes.pop_front();
    }
    return std::make_pair(std::move(pattern), std::move(s));
}
}

double PatternStats::avgRecentOutcome() const {
    if (recent_outcomes.empty()) {
        return 0.0;
    }
    const double sum = std::accumulate(recent_outcomes.begin(), recent_outcomes.end(), 0.0);
    return sum / static_cast<double>(recent_outcomes.size());
}

PatternMemory::PatternMemory(ClockFn clock)
    : clock_(clock ? std::move(clock) : ClockFn(systemNowMs)) {}

Pattern PatternMemory::identify(const SignalSet& signals) {
    return Pattern::fromSignals(signals);
}

void PatternMemory::recordOutcome(const Pattern& pattern, double profit) {
    if (!std::isfinite(profit)) {
        LOG_WARN("pattern [{}] outcome ignored: non-finite profit", pattern.key());
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& stats = arena_[findOrCreate(pattern)];
    const bool win = profit > 0.0;
    if (win) {
        stats.wins++;
        stats.consecutive_losses = 0;
    } else {
        stats.losses++;
        // Streak only continues if the previous outcome was also a loss
        stats.consecutive_losses =
            (stats.last_result == OutcomeResult::LOSS) ? stats.consecutive_losses + 1 : 1;
    }
    stats.last_result = win ? OutcomeResult::WIN : OutcomeResult::LOSS;

    stats.recent_outcomes.push_back(profit);
    while (stats.recent_outcomes.size() > PatternStats::kRecentCapacity) {
        stats.recent_outcomes.pop_front();
    }
    stats.last_seen_ms = clock_();

    for (const auto& signal : pattern.signals()) {
        auto& perf = signal_performance_[signal];
        perf.total++;
        if (win) {
            perf.wins++;
        }
        perf.weight = 2.0 * static_cast<double>(perf.wins) / static_cast<double>(perf.total);
    }

    LOG_INFO("pattern [{}] {} {:.4f} -> W{}/L{} streak={}",
             pattern.key(), win ? "win" : "loss", profit,
             stats.wins, stats.losses, stats.consecutive_losses);
}

std::optional<PatternStats> PatternMemory::stats(const Pattern& pattern) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto idx = findIndex(pattern);
    if (!idx) {
        return std::nullopt;
    }
    return arena_[*idx];
}

std::optional<double> PatternMemory::winRate(const Pattern& pattern) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto idx = findIndex(pattern);
    if (!idx || arena_[*idx].total() == 0) {
        return std::nullopt;
    }
    return arena_[*idx].winRate();
}

unsigned int PatternMemory::totalObservations(const Pattern& pattern) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto idx = findIndex(pattern);
    return idx ? arena_[*idx].total() : 0u;
}

double PatternMemory::signalWeight(const SignalLabel& signal) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = signal_performance_.find(signal);
    return it != signal_performance_.end() ? it->second.weight : 1.0;
}

std::optional<SignalPerformance> PatternMemory::signalStats(const SignalLabel& signal) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = signal_performance_.find(signal);
    if (it == signal_performance_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PatternMemory::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return arena_.size();
}

PatternReport PatternMemory::report() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    PatternReport out;
    out.patterns.reserve(arena_.size());
    for (std::size_t i = 0; i < arena_.size(); ++i) {
        const auto& s = arena_[i];
        PatternReportRow row;
        row.key = arena_keys_[i].key();
        row.wins = s.wins;
        row.losses = s.losses;
        row.win_rate = s.winRate();
        row.consecutive_losses = s.consecutive_losses;
        row.avg_recent_outcome = s.avgRecentOutcome();
        out.patterns.push_back(std::move(row));
    }

    // Most observed first, key as tie-break for a stable dashboard order
    std::sort(out.patterns.begin(), out.patterns.end(),
              [](const PatternReportRow& a, const PatternReportRow& b) {
                  const unsigned int ta = a.wins + a.losses;
                  const unsigned int tb = b.wins + b.losses;
                  if (ta == tb) {
                      return a.key < b.key;
                  }
                  return ta > tb;
              });

    out.signals = signal_performance_;
    return out;
}

nlohmann::json PatternMemory::toJson() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    nlohmann::json rows = nlohmann::json::array();
    for (std::size_t i = 0; i < arena_.size(); ++i) {
        const auto& s = arena_[i];
        nlohmann::json row;
        row["pattern"] = arena_keys_[i].key();
        row["signals"] = arena_keys_[i].signals();
        row["wins"] = s.wins;
        row["losses"] = s.losses;
        row["consecutive_losses"] = s.consecutive_losses;
        row["last_result"] = resultToString(s.last_result);
        row["recent_outcomes"] = std::vector<double>(s.recent_outcomes.begin(), s.recent_outcomes.end());
        row["last_seen_ms"] = s.last_seen_ms;
        rows.push_back(std::move(row));
    }

    nlohmann::json signals = nlohmann::json::object();
    for (const auto& [name, perf] : signal_performance_) {
        signals[name] = {{"total", perf.total}, {"wins", perf.wins}};
    }

    return {{"patterns", rows}, {"signals", signals}};
}

std::size_t PatternMemory::loadJson(const nlohmann::json& doc) {
    // Parse into a staging table first; the live table is replaced only at the end
    std::vector<Pattern> keys;
    std::vector<PatternStats> arena;
    std::unordered_map<Pattern, std::size_t, PatternHash> index;
    std::map<std::string, SignalPerformance> signal_performance;

    if (!doc.is_object()) {
        LOG_WARN("pattern memory: snapshot is not an object, starting empty");
    } else {
        const auto rows = doc.find("patterns");
        if (rows != doc.end() && rows->is_array()) {
            for (const auto& row : *rows) {
                auto parsed = rowFromJson(row);
                if (!parsed) {
                    LOG_WARN("pattern memory: skipping malformed row");
                    continue;
                }
                // a repeated pattern keeps its first row
                if (!index.emplace(parsed->first, arena.size()).second) {
                    continue;
                }
                keys.push_back(std::move(parsed->first));
                arena.push_back(std::move(parsed->second));
            }
        }

        const auto signals = doc.find("signals");
        if (signals != doc.end() && signals->is_object()) {
            for (auto it = signals->begin(); it != signals->end(); ++it) {
                const auto& v = it.value();
                if (!v.is_object() || !countField(v, "total") || !countField(v, "wins")) {
                    LOG_WARN("pattern memory: skipping malformed signal [{}]", it.key());
                    continue;
                }
                SignalPerformance perf;
                perf.total = v.value("total", 0u);
                perf.wins = std::min(perf.total, v.value("wins", 0u));
                perf.weight = perf.total > 0
                    ? 2.0 * static_cast<double>(perf.wins) / static_cast<double>(perf.total)
                    : 1.0;
                signal_performance[it.key()] = perf;
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    arena_keys_ = std::move(keys);
    arena_ = std::move(arena);
    index_ = std::move(index);
    signal_performance_ = std::move(signal_performance);

    LOG_INFO("pattern memory restored: {} patterns, {} signals", arena_.size(), signal_performance_.size());
    return arena_.size();
}

std::optional<std::size_t> PatternMemory::findIndex(const Pattern& pattern) const {
    const auto it = index_.find(pattern);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PatternMemory::findOrCreate(const Pattern& pattern) {
    const auto it = index_.find(pattern);
    if (it != index_.end()) {
        return it->second;
    }
    const std::size_t idx = arena_.size();
    arena_.emplace_back();
    arena_keys_.push_back(pattern);
    index_.emplace(pattern, idx);
    return idx;
}

} // namespace pattern
} // namespace patterngate
