#include "cloner/destination.hpp"

#include "cloner/device_streamer.hpp"
#include "cloner/tar_stream_extractor.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace cloner {

Destination ResolveDestination(const std::string& marker_path,
                               const std::string& device_path,
                               const std::string& target_dir) {
    // Only a marker that does not exist selects directory mode; any other
    // stat failure still counts as present.
    struct stat st{};
    if (::stat(marker_path.c_str(), &st) != 0 && errno == ENOENT) {
        return DirectoryTree{target_dir};
    }
    return BlockDevice{device_path};
}

std::string DescribeDestination(const Destination& dst) {
    if (const auto* dev = std::get_if<BlockDevice>(&dst)) {
        return "block device " + dev->path;
    }
    return "directory " + std::get<DirectoryTree>(dst).path;
}

DestinationDispatcher::DestinationDispatcher()
    : DestinationDispatcher(std::make_shared<DeviceStreamer>(), std::make_shared<TarStreamExtractor>()) {}

DestinationDispatcher::DestinationDispatcher(std::shared_ptr<const IBlockWriter> block_writer,
                                             std::shared_ptr<const IArchiveExtractor> extractor)
    : block_writer_(std::move(block_writer)), extractor_(std::move(extractor)) {}

Result DestinationDispatcher::Dispatch(const Destination& dst, IReader& source) const {
    if (const auto* dev = std::get_if<BlockDevice>(&dst)) {
        if (!block_writer_) return Result::Fail(ErrorKind::WriteError, -1, "No block writer configured");
        LogInfo("Writing data to block device %s", dev->path.c_str());
        return block_writer_->StreamToDevice(source, dev->path);
    }

    const auto& dir = std::get<DirectoryTree>(dst);
    if (!extractor_) return Result::Fail(ErrorKind::WriteError, -1, "No archive extractor configured");
    LogInfo("Writing data to file system under %s", dir.path.c_str());
    return extractor_->ExtractToDir(source, dir.path);
}

} // namespace cloner
