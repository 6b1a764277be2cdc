#pragma once

#include "cloner/channel.hpp"
#include "cloner/destination.hpp"
#include "cloner/progress_reporter.hpp"
#include "metrics/registry.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace cloner {

struct CloneTargetOptions {
    std::string owner_uid;
    std::string marker_path = kDefaultBlockDevicePath;
    std::string block_device_path = kDefaultBlockDevicePath;
    std::string target_dir = ".";
    ProgressReporter::Options progress{};
};

// Receives one payload over the channel: size header on a first open, payload
// on a second open, written to the destination picked by the marker path.
class CloneTarget {
  public:
    CloneTarget(IChannel& channel,
                const DestinationDispatcher& dispatcher,
                metrics::Registry& registry,
                CloneTargetOptions opt);

    Result Run();

    std::uint64_t TotalSize() const { return total_size_; }
    std::uint64_t BytesTransferred() const { return bytes_transferred_; }

  private:
    IChannel& channel_;
    const DestinationDispatcher& dispatcher_;
    metrics::Registry& registry_;
    CloneTargetOptions opt_;

    std::uint64_t total_size_ = 0;
    std::uint64_t bytes_transferred_ = 0;
};

} // namespace cloner
