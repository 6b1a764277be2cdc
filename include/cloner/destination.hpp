#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>
#include <variant>

namespace cloner {

inline constexpr const char* kDefaultBlockDevicePath = "/dev/cdi-block-volume";

struct BlockDevice {
    std::string path;
};

struct DirectoryTree {
    std::string path;
};

using Destination = std::variant<BlockDevice, DirectoryTree>;

// The marker and the raw device are normally the same path: a volume exposed
// in block mode shows up at the marker path.
Destination ResolveDestination(const std::string& marker_path,
                               const std::string& device_path,
                               const std::string& target_dir);

std::string DescribeDestination(const Destination& dst);

class IBlockWriter {
  public:
    virtual ~IBlockWriter() = default;
    virtual Result StreamToDevice(IReader& source, const std::string& device_path) const = 0;
};

class IArchiveExtractor {
  public:
    virtual ~IArchiveExtractor() = default;
    virtual Result ExtractToDir(IReader& source, const std::string& dst_dir) const = 0;
};

class DestinationDispatcher {
  public:
    DestinationDispatcher();
    DestinationDispatcher(std::shared_ptr<const IBlockWriter> block_writer,
                          std::shared_ptr<const IArchiveExtractor> extractor);

    // Drives the whole source into exactly one consumer.
    Result Dispatch(const Destination& dst, IReader& source) const;

  private:
    std::shared_ptr<const IBlockWriter> block_writer_;
    std::shared_ptr<const IArchiveExtractor> extractor_;
};

} // namespace cloner
