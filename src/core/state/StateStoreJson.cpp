#include "core/state/StateStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace patterngate {
namespace core {

StateStoreJson::StateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<StateSnapshot> StateStoreJson::load() {
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("state store: cannot open {}", file_path_.string());
        return std::nullopt;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("state store: {} is not valid JSON: {}", file_path_.string(), e.what());
        return std::nullopt;
    }
    if (!raw.is_object()) {
        LOG_ERROR("state store: {} root is not an object", file_path_.string());
        return std::nullopt;
    }

    StateSnapshot snapshot;
    try {
        snapshot.schema_version = raw.value("schema_version", 0);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
        snapshot.capital = raw.value("capital", 0.0);
    } catch (const nlohmann::json::type_error& e) {
        LOG_ERROR("state store: bad header field in {}: {}", file_path_.string(), e.what());
        return std::nullopt;
    }
    if (snapshot.schema_version > kSchemaVersion) {
        LOG_ERROR("state store: schema {} is newer than supported {}", snapshot.schema_version, kSchemaVersion);
        return std::nullopt;
    }
    if (snapshot.schema_version < kSchemaVersion) {
        // v1 keyed patterns by the joined label string, which is ambiguous
        LOG_WARN("state store: schema {} predates {}, ignoring {}",
                 snapshot.schema_version, kSchemaVersion, file_path_.string());
        return std::nullopt;
    }
    snapshot.patterns = raw.contains("patterns") ? raw["patterns"] : nlohmann::json::object();
    snapshot.positions = raw.contains("positions") ? raw["positions"] : nlohmann::json::object();
    return snapshot;
}

bool StateStoreJson::save(const StateSnapshot& snapshot) {
    nlohmann::json raw;
    raw["schema_version"] = kSchemaVersion;
    raw["saved_at_ms"] = snapshot.saved_at_ms;
    raw["capital"] = snapshot.capital;
    raw["patterns"] = snapshot.patterns;
    raw["positions"] = snapshot.positions;

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("state store: cannot create {}: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("state store: cannot write {}", tmp_path.string());
            return false;
        }
        out << raw.dump(2);
        if (!out.good()) {
            LOG_ERROR("state store: write to {} failed", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        LOG_ERROR("state store: rename {} -> {} failed: {}", tmp_path.string(), file_path_.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

} // namespace core
} // namespace patterngate
