#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <cstdint>
#include <string>
#include <vector>

namespace cloner {

// Client state for the libarchive read callback. Owned by the caller and must
// outlive the archive handle it is opened on.
struct ArchiveReaderCtx {
    explicit ArchiveReaderCtx(IReader& in, size_t buffer_size = 64 * 1024)
        : reader(&in), buffer(buffer_size) {}

    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;
    std::uint64_t bytes_fed = 0;

    // Set when the source itself failed, as opposed to a decode error.
    bool source_failed = false;
    int source_errno = 0;
};

int OpenArchiveFromReader(struct archive* ar, ArchiveReaderCtx& ctx);
std::string ArchiveErr(struct archive* ar);

} // namespace cloner
