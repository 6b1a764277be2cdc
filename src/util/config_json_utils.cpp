#include "util/config_json_utils.hpp"

#include <fstream>
#include <string>

namespace cloner::config::detail {

namespace {

// Each getter returns false only when the key is present with the wrong type.

bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<long long>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<long long>());
        return true;
    }
    err = std::string(key) + " must be a non-negative integer";
    return false;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ClonerConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "OwnerUID", cfg.owner_uid, err)) return false;
    if (!GetStringIfPresent(j, "BlockDevicePath", cfg.block_device_path, err)) return false;
    if (!GetStringIfPresent(j, "TargetDir", cfg.target_dir, err)) return false;
    if (!GetStringIfPresent(j, "MetricsFile", cfg.metrics_file, err)) return false;
    if (!GetStringIfPresent(j, "LogLevel", cfg.log_level, err)) return false;
    if (!GetU64IfPresent(j, "ProgressIntervalMs", cfg.progress_interval_ms, err)) return false;
    if (!GetU64IfPresent(j, "FsyncIntervalBytes", cfg.fsync_interval_bytes, err)) return false;

    if (cfg.block_device_path && cfg.block_device_path->empty()) {
        err = "BlockDevicePath must not be empty";
        return false;
    }
    if (cfg.target_dir && cfg.target_dir->empty()) {
        err = "TargetDir must not be empty";
        return false;
    }
    if (cfg.progress_interval_ms && *cfg.progress_interval_ms == 0) {
        err = "ProgressIntervalMs must be greater than zero";
        return false;
    }
    if (cfg.progress_interval_ms && *cfg.progress_interval_ms > kMaxProgressIntervalMs) {
        err = "ProgressIntervalMs must not exceed " + std::to_string(kMaxProgressIntervalMs);
        return false;
    }

    return true;
}

} // namespace cloner::config::detail
