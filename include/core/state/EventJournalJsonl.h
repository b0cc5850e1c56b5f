#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace patterngate {
namespace core {

// One JSON object per line. Malformed lines are skipped on read.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    static std::string toString(JournalEventType type);
    static std::optional<JournalEventType> fromString(const std::string& value);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace patterngate
