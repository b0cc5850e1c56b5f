#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/StateStoreJson.h"
#include "engine/TradingEngine.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace patterngate;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string events_path;
    std::string state_path;
    std::string journal_path;
    bool use_state = true;
    bool use_journal = true;
};

void printUsage() {
    std::cout << "usage: patterngate [options] <events.jsonl>\n"
              << "  --config <path>    config file (default config/config.json)\n"
              << "  --state <path>     state file (overrides state.state_file)\n"
              << "  --journal <path>   journal file (overrides state.journal_file)\n"
              << "  --no-state         do not load or save state\n"
              << "  --no-journal       do not write the event journal\n"
              << "\n"
              << "event lines:\n"
              << "  {\"type\":\"signals\",\"symbol\":\"BTC\",\"signals\":[\"A\",\"B\",\"C\"],\n"
              << "   \"price\":100,\"atr\":1,\"volatility\":0.01,\"strength\":0.8,\"side\":\"LONG\"}\n"
              << "  {\"type\":\"tick\",\"symbol\":\"BTC\",\"price\":101}\n"
              << "  {\"type\":\"close\",\"symbol\":\"BTC\",\"price\":101}\n"
              << "  optional \"ts_ms\" on any line drives the engine clock\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--state") {
            if (!next(opts.state_path)) return false;
        } else if (arg == "--journal") {
            if (!next(opts.journal_path)) return false;
        } else if (arg == "--no-state") {
            opts.use_state = false;
        } else if (arg == "--no-journal") {
            opts.use_journal = false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option " << arg << "\n";
            return false;
        } else {
            opts.events_path = arg;
        }
    }
    return !opts.events_path.empty();
}

std::filesystem::path resolve(const std::string& path) {
    if (std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return utils::PathUtils::resolveRelativePath(path);
}

SignalSet readSignals(const nlohmann::json& line) {
    SignalSet signals;
    const auto it = line.find("signals");
    if (it == line.end() || !it->is_array()) {
        return signals;
    }
    for (const auto& s : *it) {
        if (s.is_string()) {
            signals.push_back(s.get<std::string>());
        }
    }
    return signals;
}

void printReports(const engine::TradingEngine& engine) {
    const auto summary = engine.portfolioSummary();
    const auto metrics = engine.riskMetrics();
    const auto patterns = engine.patternReport();
    const auto performance = engine.performanceReport();

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n===== Portfolio =====\n";
    std::cout << "capital            " << engine.getCapital() << "\n";
    std::cout << "open positions     " << summary.open_count << "\n";
    std::cout << "exposure           " << summary.total_exposure << "\n";
    std::cout << "unrealized pnl     " << summary.total_unrealized_pnl << "\n";
    std::cout << "realized pnl       " << summary.total_realized_pnl << "\n";

    std::cout << "\n===== Risk =====\n";
    std::cout << "exposure ratio     " << metrics.current_exposure << "\n";
    std::cout << "daily drawdown     " << metrics.daily_drawdown << "\n";
    std::cout << "risk score         " << metrics.risk_score << "\n";
    std::cout << "win rate           " << metrics.win_rate << "\n";
    std::cout << "profit factor      " << metrics.profit_factor << "\n";
    std::cout << "trades today       " << metrics.trades_today << "\n";

    std::cout << "\n===== Patterns =====\n";
    for (const auto& row : patterns.patterns) {
        std::cout << std::setw(40) << std::left << row.key << std::right
                  << " W " << row.wins << " L " << row.losses
                  << " win% " << row.win_rate * 100.0
                  << " streak " << row.consecutive_losses
                  << " avg " << row.avg_recent_outcome << "\n";
    }
    for (const auto& [signal, perf] : patterns.signals) {
        std::cout << "  signal " << signal << " " << perf.wins << "/" << perf.total
                  << " weight " << perf.weight << "\n";
    }

    std::cout << "\n===== Performance =====\n";
    const auto& all = performance.overall();
    std::cout << "trades " << all.trades << " win% " << all.winRate() * 100.0
              << " net " << all.net_profit << " expectancy " << all.expectancy()
              << " PF " << all.profitFactor() << "\n";
    for (const auto& [symbol, s] : performance.bySymbol()) {
        std::cout << "  " << symbol << ": trades " << s.trades << " net " << s.net_profit << "\n";
    }
    for (const auto& [reason, s] : performance.byExitReason()) {
        std::cout << "  " << toString(reason) << ": trades " << s.trades << " net " << s.net_profit << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        if (!config.load(opts.config_path)) {
            std::cerr << "config " << opts.config_path << " could not be parsed, using defaults\n";
        }
        const auto engine_config = config.getEngineConfig();

        Logger::getInstance().initialize(engine_config.log_dir, engine_config.log_level);
        LOG_INFO("patterngate replay: {}", opts.events_path);

        // Event timestamps drive the clock when present
        long long replay_now_ms = 0;
        ClockFn clock = [&replay_now_ms]() {
            return replay_now_ms > 0 ? replay_now_ms : systemNowMs();
        };

        std::shared_ptr<core::IStateStore> state_store;
        if (opts.use_state) {
            const std::string state_path = opts.state_path.empty()
                ? engine_config.state.state_file : opts.state_path;
            state_store = std::make_shared<core::StateStoreJson>(resolve(state_path));
        }
        std::shared_ptr<core::IEventJournal> journal;
        if (opts.use_journal) {
            const std::string journal_path = opts.journal_path.empty()
                ? engine_config.state.journal_file : opts.journal_path;
            journal = std::make_shared<core::EventJournalJsonl>(resolve(journal_path));
        }

        engine::TradingEngine engine(engine_config, clock, state_store, journal);
        engine.loadState();

        std::ifstream in(opts.events_path);
        if (!in.is_open()) {
            LOG_ERROR("cannot open events file {}", opts.events_path);
            std::cerr << "cannot open " << opts.events_path << "\n";
            return 1;
        }

        std::string row;
        std::size_t line_no = 0;
        std::size_t decisions = 0;
        std::size_t approved = 0;
        std::size_t closed = 0;
        while (std::getline(in, row)) {
            line_no++;
            if (row.empty() || row[0] == '#') {
                continue;
            }

            nlohmann::json line;
            try {
                line = nlohmann::json::parse(row);
            } catch (const nlohmann::json::parse_error& e) {
                LOG_WARN("line {}: invalid JSON ({})", line_no, e.what());
                continue;
            }
            if (!line.is_object()) {
                LOG_WARN("line {}: not an object", line_no);
                continue;
            }

            try {
                const long long ts = line.value("ts_ms", 0LL);
                if (ts > 0) {
                    replay_now_ms = ts;
                }

                const std::string type = line.value("type", std::string());
                const std::string symbol = line.value("symbol", std::string());
                const double price = line.value("price", 0.0);

                if (type == "signals") {
                    engine::MarketContext ctx;
                    ctx.price = price;
                    ctx.atr = line.value("atr", 0.0);
                    ctx.volatility = line.value("volatility", 0.0);
                    ctx.signal_strength = line.value("strength", 0.0);
                    const auto side = sideFromString(line.value("side", std::string("LONG")));
                    if (!side) {
                        LOG_WARN("line {}: unknown side", line_no);
                        continue;
                    }
                    ctx.side = *side;

                    const auto decision = engine.onSignals(symbol, readSignals(line), ctx);
                    decisions++;
                    if (decision.approved) {
                        approved++;
                    }
                } else if (type == "tick") {
                    closed += engine.onPriceTick(symbol, price).size();
                } else if (type == "close") {
                    if (engine.closePosition(symbol, price)) {
                        closed++;
                    }
                } else {
                    LOG_WARN("line {}: unknown event type '{}'", line_no, type);
                }
            } catch (const nlohmann::json::type_error& e) {
                LOG_WARN("line {}: bad field type ({})", line_no, e.what());
            }
        }

        LOG_INFO("replay done: {} lines, {} decisions, {} approved, {} closed",
                 line_no, decisions, approved, closed);
        std::cout << "decisions " << decisions << ", approved " << approved << ", closed " << closed << "\n";
        printReports(engine);

        if (opts.use_state && !engine.saveState()) {
            std::cerr << "state save failed\n";
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << "\n";
        return 1;
    }
}
