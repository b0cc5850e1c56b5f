#include "pattern/Pattern.h"

#include <algorithm>

namespace patterngate {
namespace pattern {

Pattern Pattern::fromSignals(const SignalSet& signals) {
    Pattern p;
    p.signals_.reserve(signals.size());
    for (const auto& s : signals) {
        if (!s.empty()) {
            p.signals_.push_back(s);
        }
    }
    std::sort(p.signals_.begin(), p.signals_.end());
    p.signals_.erase(std::unique(p.signals_.begin(), p.signals_.end()), p.signals_.end());

    for (std::size_t i = 0; i < p.signals_.size(); ++i) {
        if (i > 0) {
            p.key_.push_back(kSeparator);
        }
        p.key_ += p.signals_[i];
    }
    return p;
}

} // namespace pattern
} // namespace patterngate
