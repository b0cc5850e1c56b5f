#pragma once

#include <string>

namespace patterngate {
namespace engine {

// What the gate does with a pattern it has never seen
enum class UnseenPatternPolicy {
    EXPLORE,    // approve so the pattern can accumulate statistics
    DENY        // conservative: only trade patterns with history
};

struct GateConfig {
    int min_signals = 3;
    int min_sample_size = 3;
    double min_win_rate = 0.5;
    int max_consecutive_losses = 2;
    UnseenPatternPolicy unseen_pattern_policy = UnseenPatternPolicy::EXPLORE;
};

struct RiskConfig {
    double base_fraction = 0.01;                // 1% of capital per trade before multipliers
    double max_position_size_fraction = 0.02;   // single position cap
    double max_total_risk = 0.05;               // total exposure cap (fraction of capital)
    double max_daily_drawdown = 0.03;
    int min_order_interval_sec = 60;
    int max_open_positions = 3;                 // across all symbols; <= 0 disables
    double risk_score_ceiling = 80.0;
    double reduce_exposure_score = 70.0;
    double exposure_weight = 40.0;              // exposure_weight + drawdown_weight == 100
    double drawdown_weight = 60.0;
    double size_increment = 0.00001;
    int trade_history_window = 100;

    // Stop construction: base = atr * atr_multiplier, reward:risk fixed at 2:1
    double atr_multiplier = 2.0;
    double emergency_multiplier = 1.5;
    double trailing_fraction = 0.5;
};

struct LedgerConfig {
    bool enable_trailing_stop = true;
    bool allow_pyramiding = false;  // more than one open position per symbol
    double quantity_step = 0.00001;
};

struct StateConfig {
    std::string state_file = "state/patterngate_state.json";
    std::string journal_file = "state/journal.jsonl";
    bool autosave_on_close = true;
};

struct EngineConfig {
    double initial_capital = 10000.0;
    std::string log_level = "info";
    std::string log_dir = "logs";

    GateConfig gate;
    RiskConfig risk;
    LedgerConfig ledger;
    StateConfig state;
};

} // namespace engine
} // namespace patterngate
