#include "cloner/tar_stream_extractor.hpp"

#include "cloner/archive_path_policy.hpp"
#include "cloner/tar_stream_reader_adapter.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>

namespace cloner {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

// A failure on the read side is a ReadError only if the payload source itself
// failed; anything else means the stream could not be unpacked.
Result ReadSideFailure(const ArchiveReaderCtx& ctx, archive* ar, const char* what) {
    if (ctx.source_failed) {
        if (ctx.source_errno == ECANCELED) {
            return Result::Fail(ErrorKind::Cancelled, ECANCELED, "Canceled by signal");
        }
        return Result::Fail(ErrorKind::ReadError,
                            ctx.source_errno,
                            std::string(what) + ": " + std::strerror(ctx.source_errno));
    }
    return Result::Fail(ErrorKind::WriteError, -1, std::string(what) + ": " + ArchiveErr(ar));
}

Result WriteSideFailure(archive* aw, const char* what) {
    return Result::Fail(ErrorKind::WriteError, archive_errno(aw), std::string(what) + ": " + ArchiveErr(aw));
}

Result Drain(ArchiveReaderCtx& ctx) {
    while (true) {
        if (g_cancel.load(std::memory_order_relaxed)) {
            return Result::Fail(ErrorKind::Cancelled, ECANCELED, "Canceled by signal");
        }
        const ssize_t n = ctx.reader->Read(std::span<std::uint8_t>(ctx.buffer.data(), ctx.buffer.size()));
        if (n == 0) return Result::Ok();
        if (n < 0) {
            const int e = errno;
            if (e == ECANCELED) {
                return Result::Fail(ErrorKind::Cancelled, ECANCELED, "Canceled by signal");
            }
            return Result::Fail(ErrorKind::ReadError, e,
                                std::string("reading trailing bytes: ") + std::strerror(e));
        }
        ctx.bytes_fed += static_cast<std::uint64_t>(n);
    }
}

} // namespace

Result TarStreamExtractor::ExtractToDir(IReader& tar_stream, const std::string& dst_dir) const {
    namespace fs = std::filesystem;

    const fs::path base_dir = fs::absolute(fs::path(dst_dir));

    std::error_code ec;
    if (!fs::exists(base_dir, ec) || ec) {
        return Result::Fail(ErrorKind::WriteError, -1, "Destination directory does not exist: " + dst_dir);
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorKind::WriteError, -1, "Destination path is not a directory: " + dst_dir);
    }

    // Must outlive the read handle declared below.
    ArchiveReaderCtx ctx(tar_stream);

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::WriteError, -1, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (OpenArchiveFromReader(ar.get(), ctx) != ARCHIVE_OK) {
        return ReadSideFailure(ctx, ar.get(), "archive_read_open2");
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorKind::WriteError, -1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under base_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);

    std::uint64_t extracted = 0;
    std::uint64_t entries = 0;
    std::uint64_t next_progress = opt_.progress_interval_bytes;

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return ReadSideFailure(ctx, ar.get(), "archive_read_next_header");
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return ReadSideFailure(ctx, ar.get(), "archive_read_data_skip");
            }
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("entry: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return WriteSideFailure(aw.get(), "archive_write_header");

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return ReadSideFailure(ctx, ar.get(), "archive_read_data_block");

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return WriteSideFailure(aw.get(), "archive_write_data_block");

            extracted += static_cast<std::uint64_t>(size);
            if (opt_.progress_interval_bytes > 0 && extracted >= next_progress) {
                LogDebug("extract progress: %llu bytes", (unsigned long long)extracted);
                next_progress = extracted + opt_.progress_interval_bytes;
            }
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return WriteSideFailure(aw.get(), "archive_write_finish_entry");
        ++entries;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return WriteSideFailure(aw.get(), "archive_write_close");
    }

    if (opt_.drain_trailing_bytes) {
        if (auto d = Drain(ctx); !d.ok) return d;
    }

    LogInfo("Extracted %llu entries (%llu bytes of file data) into %s",
            (unsigned long long)entries,
            (unsigned long long)extracted,
            base_dir.c_str());

    return Result::Ok();
}

} // namespace cloner
