#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cloner::config {

// One day. Longer intervals overflow the reporter's steady_clock wait.
inline constexpr std::uint64_t kMaxProgressIntervalMs = 24ULL * 60 * 60 * 1000;

// Optional JSON settings file. Every key is optional; values given on the
// command line take precedence over the ones loaded here.
struct ClonerConfigFromFile {
    std::optional<std::string> owner_uid;
    std::optional<std::string> block_device_path;
    std::optional<std::string> target_dir;
    std::optional<std::string> metrics_file;
    std::optional<std::string> log_level;
    std::optional<std::uint64_t> progress_interval_ms;
    std::optional<std::uint64_t> fsync_interval_bytes;

    void Reset();
    Result LoadFile(const std::string& path);
};

} // namespace cloner::config
