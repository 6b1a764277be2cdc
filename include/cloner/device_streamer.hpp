#pragma once

#include "cloner/destination.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace cloner {

class DeviceStreamer final : public IBlockWriter {
  public:
    static constexpr std::size_t kBlockSize = 1024 * 1024;

    struct Options {
        // 0 disables periodic fsync; a final fsync is always issued.
        std::uint64_t fsync_interval_bytes = 1024 * 1024ULL;
    };

    DeviceStreamer() = default;
    explicit DeviceStreamer(const Options& opt) : opt_(opt) {}

    Result StreamToDevice(IReader& source, const std::string& device_path) const override;

    // Copies reader to writer until end-of-stream.
    Result Copy(IReader& reader, IWriter& writer) const;

  private:
    Options opt_{};
};

} // namespace cloner
