#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace cloner::config {

void ClonerConfigFromFile::Reset() {
    owner_uid.reset();
    block_device_path.reset();
    target_dir.reset();
    metrics_file.reset();
    log_level.reset();
    progress_interval_ms.reset();
    fsync_interval_bytes.reset();
}

Result ClonerConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::ConfigError, -1, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::ConfigError, -1, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace cloner::config
