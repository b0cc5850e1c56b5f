#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/IStateStore.h"

namespace patterngate {
namespace core {

// Single JSON document; writes go to <file>.tmp and are renamed into place
class StateStoreJson : public IStateStore {
public:
    static constexpr int kSchemaVersion = 2;

    explicit StateStoreJson(std::filesystem::path file_path);

    std::optional<StateSnapshot> load() override;
    bool save(const StateSnapshot& snapshot) override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace patterngate
