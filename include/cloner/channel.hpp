#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace cloner {

// A named, single-use byte channel. Every Open() is an independent
// acquisition; the returned reader releases it when destroyed.
class IChannel {
  public:
    virtual ~IChannel() = default;
    virtual Result Open(std::unique_ptr<IReader>& out) = 0;
    virtual const std::string& Name() const = 0;
};

class NamedPipeChannel final : public IChannel {
  public:
    explicit NamedPipeChannel(std::string path) : path_(std::move(path)) {}

    Result Open(std::unique_ptr<IReader>& out) override;
    const std::string& Name() const override { return path_; }

  private:
    std::string path_;
};

} // namespace cloner
