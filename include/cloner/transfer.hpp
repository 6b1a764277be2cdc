#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace cloner {

// One clone transfer. bytes_transferred is written only by the relay reader
// on the main path and sampled by the progress reporter.
struct Transfer {
    Transfer(std::uint64_t total, std::string owner)
        : total_size(total), owner_id(std::move(owner)) {}

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    const std::uint64_t total_size;
    std::atomic<std::uint64_t> bytes_transferred{0};
    const std::string owner_id;
};

} // namespace cloner
