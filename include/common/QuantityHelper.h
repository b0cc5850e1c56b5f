#pragma once
// ===================================================================
// Minimum tradable increment helpers
//
// Sizes and quantities are floored to the asset's increment so an order
// never exceeds the amount the risk checks approved. A tiny epsilon keeps
// values like 127.39999999 from dropping a whole step.
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

namespace patterngate {
namespace common {

// Floor to the increment (sell-side style rounding)
inline double roundDownToIncrement(double value, double increment) {
    if (!std::isfinite(value) || value <= 0.0) return 0.0;
    if (!(increment > 0.0)) return value;
    const double ratio = value / increment;
    // relative slack so large step counts survive representation error
    const double steps = std::floor(ratio + std::fmax(1e-9, ratio * 1e-12));
    return steps * increment;
}

// Number of decimals implied by the increment (0.001 -> 3)
inline int incrementDecimals(double increment) {
    int decimals = 0;
    double t = increment;
    while (t > 0.0 && t < 1.0 - 1e-12 && decimals < 10) {
        t *= 10.0;
        decimals++;
    }
    return decimals;
}

// Order-ready string formatted to the increment precision
inline std::string quantityToString(double value, double increment) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", incrementDecimals(increment), value);
    return std::string(buf);
}

} // namespace common
} // namespace patterngate
