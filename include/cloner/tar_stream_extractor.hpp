#pragma once

#include "cloner/destination.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace cloner {

class TarStreamExtractor final : public IArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        // Keep reading the source to end-of-stream after the end-of-archive
        // marker.
        bool drain_trailing_bytes = true;
        std::uint64_t progress_interval_bytes = 64 * 1024 * 1024ULL;
    };

    TarStreamExtractor() = default;
    explicit TarStreamExtractor(const Options& opt) : opt_(opt) {}

    Result ExtractToDir(IReader& tar_stream, const std::string& dst_dir) const override;

  private:
    Options opt_{};
};

} // namespace cloner
