#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace patterngate {

namespace {
std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

engine::UnseenPatternPolicy parseUnseenPolicy(const std::string& value,
                                              engine::UnseenPatternPolicy fallback) {
    const std::string v = toLowerCopy(value);
    if (v == "explore") return engine::UnseenPatternPolicy::EXPLORE;
    if (v == "deny") return engine::UnseenPatternPolicy::DENY;
    std::cerr << "warning: unknown gate.unseen_pattern_policy '" << value << "', keeping default" << std::endl;
    return fallback;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "warning: config file not found, using defaults" << std::endl;
        return true;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "warning: config file could not be opened, using defaults" << std::endl;
        return true;
    }

    try {
        nlohmann::json j;
        file >> j;
        apply(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "config load error: " << e.what() << std::endl;
        return false;
    }

    std::cout << "Config loaded: capital=" << engine_config_.initial_capital
              << ", min_signals=" << engine_config_.gate.min_signals
              << ", max_total_risk=" << engine_config_.risk.max_total_risk << std::endl;
    return true;
}

void Config::apply(const nlohmann::json& j) {
    // Built on a copy so a mistyped key leaves the current config untouched
    engine::EngineConfig cfg = engine_config_;

    if (j.contains("engine")) {
        const auto& e = j["engine"];
        cfg.initial_capital = e.value("initial_capital", cfg.initial_capital);
        cfg.log_level = e.value("log_level", cfg.log_level);
        cfg.log_dir = e.value("log_dir", cfg.log_dir);
    }

    if (j.contains("gate")) {
        const auto& g = j["gate"];
        auto& gate = cfg.gate;
        gate.min_signals = g.value("min_signals", gate.min_signals);
        gate.min_sample_size = g.value("min_sample_size", gate.min_sample_size);
        gate.min_win_rate = g.value("min_win_rate", gate.min_win_rate);
        gate.max_consecutive_losses = g.value("max_consecutive_losses", gate.max_consecutive_losses);
        if (g.contains("unseen_pattern_policy")) {
            gate.unseen_pattern_policy = parseUnseenPolicy(
                g["unseen_pattern_policy"].get<std::string>(), gate.unseen_pattern_policy);
        }
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        auto& risk = cfg.risk;
        risk.base_fraction = r.value("base_fraction", risk.base_fraction);
        risk.max_position_size_fraction = r.value("max_position_size_fraction", risk.max_position_size_fraction);
        risk.max_total_risk = r.value("max_total_risk", risk.max_total_risk);
        risk.max_daily_drawdown = r.value("max_daily_drawdown", risk.max_daily_drawdown);
        risk.min_order_interval_sec = r.value("min_order_interval_sec", risk.min_order_interval_sec);
        risk.max_open_positions = r.value("max_open_positions", risk.max_open_positions);
        risk.risk_score_ceiling = r.value("risk_score_ceiling", risk.risk_score_ceiling);
        risk.reduce_exposure_score = r.value("reduce_exposure_score", risk.reduce_exposure_score);
        risk.exposure_weight = r.value("exposure_weight", risk.exposure_weight);
        risk.drawdown_weight = r.value("drawdown_weight", risk.drawdown_weight);
        risk.size_increment = r.value("size_increment", risk.size_increment);
        risk.trade_history_window = r.value("trade_history_window", risk.trade_history_window);
        risk.atr_multiplier = r.value("atr_multiplier", risk.atr_multiplier);
        risk.emergency_multiplier = r.value("emergency_multiplier", risk.emergency_multiplier);
        risk.trailing_fraction = r.value("trailing_fraction", risk.trailing_fraction);

        // Risk score is on a 0-100 scale
        if (std::fabs(risk.exposure_weight + risk.drawdown_weight - 100.0) > 1e-6) {
            std::cerr << "warning: risk.exposure_weight + risk.drawdown_weight must be 100 (got "
                      << risk.exposure_weight + risk.drawdown_weight << "), using 40/60" << std::endl;
            risk.exposure_weight = 40.0;
            risk.drawdown_weight = 60.0;
        }
    }

    if (j.contains("ledger")) {
        const auto& l = j["ledger"];
        auto& ledger = cfg.ledger;
        ledger.enable_trailing_stop = l.value("enable_trailing_stop", ledger.enable_trailing_stop);
        ledger.allow_pyramiding = l.value("allow_pyramiding", ledger.allow_pyramiding);
        ledger.quantity_step = l.value("quantity_step", ledger.quantity_step);
    }

    if (j.contains("state")) {
        const auto& s = j["state"];
        auto& state = cfg.state;
        state.state_file = s.value("state_file", state.state_file);
        state.journal_file = s.value("journal_file", state.journal_file);
        state.autosave_on_close = s.value("autosave_on_close", state.autosave_on_close);
    }

    engine_config_ = cfg;
}

} // namespace patterngate
