#include "cloner/tar_stream_reader_adapter.hpp"

#include "system/signals.hpp"

#include <cerrno>

namespace cloner {

namespace {

la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ArchiveReaderCtx*>(client_data);

    if (g_cancel.load(std::memory_order_relaxed)) {
        ctx->source_failed = true;
        ctx->source_errno = ECANCELED;
        archive_set_error(ar, ECANCELED, "canceled");
        return -1;
    }

    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) {
        const int e = errno;
        ctx->source_failed = true;
        ctx->source_errno = e;
        archive_set_error(ar, e, "payload read failed");
        return -1;
    }

    ctx->bytes_fed += static_cast<std::uint64_t>(n);
    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

} // namespace

int OpenArchiveFromReader(struct archive* ar, ArchiveReaderCtx& ctx) {
    return archive_read_open2(ar, &ctx, nullptr, ReadCb, nullptr, nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace cloner
