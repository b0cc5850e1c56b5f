#pragma once

#include "common/Types.h"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace patterngate {
namespace pattern {

// Canonical, order-independent set of signals seen at one decision point.
// Signals are kept sorted and unique. Identity is the signal list itself;
// key() joins the labels with '|' for display and logs only.
class Pattern {
public:
    Pattern() = default;

    static Pattern fromSignals(const SignalSet& signals);

    const std::vector<SignalLabel>& signals() const { return signals_; }
    const std::string& key() const { return key_; }
    std::size_t size() const { return signals_.size(); }
    bool empty() const { return signals_.empty(); }

    bool operator==(const Pattern& other) const { return signals_ == other.signals_; }
    bool operator!=(const Pattern& other) const { return signals_ != other.signals_; }
    bool operator<(const Pattern& other) const { return signals_ < other.signals_; }

    static constexpr char kSeparator = '|';

private:
    std::vector<SignalLabel> signals_;
    std::string key_;
};

struct PatternHash {
    std::size_t operator()(const Pattern& p) const {
        std::size_t seed = p.size();
        for (const auto& s : p.signals()) {
            seed ^= std::hash<std::string>{}(s) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

} // namespace pattern
} // namespace patterngate
