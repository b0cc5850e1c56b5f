#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace patterngate {

class Config {
public:
    static Config& getInstance();

    // Missing file or keys keep defaults; returns false if the file could not be parsed
    bool load(const std::string& config_path);
    void apply(const nlohmann::json& j);

    double getInitialCapital() const { return engine_config_.initial_capital; }
    std::string getLogLevel() const { return engine_config_.log_level; }
    std::string getLogDir() const { return engine_config_.log_dir; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::GateConfig getGateConfig() const { return engine_config_.gate; }
    engine::RiskConfig getRiskConfig() const { return engine_config_.risk; }
    engine::LedgerConfig getLedgerConfig() const { return engine_config_.ledger; }
    engine::StateConfig getStateConfig() const { return engine_config_.state; }

    // Back to compiled-in defaults
    void reset() { engine_config_ = engine::EngineConfig(); }

private:
    Config() = default;
    engine::EngineConfig engine_config_;
};

} // namespace patterngate
