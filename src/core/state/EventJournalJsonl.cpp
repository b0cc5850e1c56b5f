#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace patterngate {
namespace core {

namespace {
std::optional<nlohmann::json> parseLine(const std::string& row) {
    try {
        auto line = nlohmann::json::parse(row);
        if (!line.is_object()) {
            return std::nullopt;
        }
        return line;
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

std::uint64_t parseSeq(const nlohmann::json& line) {
    const auto it = line.find("seq");
    if (it == line.end() || !it->is_number_unsigned()) {
        return 0;
    }
    return it->get<std::uint64_t>();
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    std::size_t skipped = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const auto line = parseLine(row);
        if (!line) {
            skipped++;
            continue;
        }
        last_seq_ = (std::max)(last_seq_, parseSeq(*line));
    }
    if (skipped > 0) {
        LOG_WARN("journal {}: {} malformed lines skipped", file_path_.string(), skipped);
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("journal: cannot create {}: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("journal: cannot open {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["symbol"] = event.symbol;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;

    out << line.dump() << "\n";
    if (!out.good()) {
        LOG_ERROR("journal: write to {} failed", file_path_.string());
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const auto line = parseLine(row);
        if (!line) {
            continue;
        }

        const auto seq = parseSeq(*line);
        if (seq == 0 || seq < seq_inclusive) {
            continue;
        }
        JournalEvent event;
        try {
            const auto type = fromString(line->value("type", std::string()));
            if (!type) {
                continue;
            }
            event.seq = seq;
            event.ts_ms = line->value("ts_ms", 0LL);
            event.type = *type;
            event.symbol = line->value("symbol", std::string());
            event.entity_id = line->value("entity_id", std::string());
            event.payload = line->value("payload", nlohmann::json::object());
        } catch (const nlohmann::json::type_error& e) {
            LOG_WARN("journal: skipping mistyped event seq={}: {}", seq, e.what());
            continue;
        }
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::TRADE_REJECTED: return "TRADE_REJECTED";
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::PATTERN_UPDATED: return "PATTERN_UPDATED";
        case JournalEventType::STATE_SAVED: return "STATE_SAVED";
    }
    return "POSITION_OPENED";
}

std::optional<JournalEventType> EventJournalJsonl::fromString(const std::string& value) {
    if (value == "TRADE_REJECTED") return JournalEventType::TRADE_REJECTED;
    if (value == "POSITION_OPENED") return JournalEventType::POSITION_OPENED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    if (value == "PATTERN_UPDATED") return JournalEventType::PATTERN_UPDATED;
    if (value == "STATE_SAVED") return JournalEventType::STATE_SAVED;
    return std::nullopt;
}

} // namespace core
} // namespace patterngate
