#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace cloner {

// Read end of a named pipe (FIFO). Open blocks until a writer opens the other
// end; Read returns 0 once every writer has closed it.
class NamedPipeReader final : public IReader {
public:
    static Result Open(std::string path, NamedPipeReader& out);

    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }
    bool IsOpen() const { return fd_.Valid(); }
    void Close();

private:
    std::string path_;
    Fd fd_;
};

} // namespace cloner
