#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace cloner {

// Writer for a raw block device. Paths outside /dev/ are treated as image
// files and created or truncated.
class DeviceWriter final : public IWriter {
  public:
    static Result Open(std::string path, DeviceWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace cloner
