#include "cloner/device_streamer.hpp"

#include "io/device_writer.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <cstring>
#include <string>
#include <vector>

namespace cloner {

namespace {

std::uint64_t NowMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

Result DeviceStreamer::StreamToDevice(IReader& source, const std::string& device_path) const {
    DeviceWriter writer;
    if (auto r = DeviceWriter::Open(device_path, writer); !r.ok) return r;
    LogDebug("Streaming payload into %s", device_path.c_str());
    return Copy(source, writer);
}

Result DeviceStreamer::Copy(IReader& reader, IWriter& writer) const {
    std::vector<std::uint8_t> buf(kBlockSize);

    std::uint64_t total_written = 0;
    std::uint64_t unsynced = 0;

    const std::uint64_t t0 = NowMs();

    while (true) {
        if (g_cancel.load(std::memory_order_relaxed)) {
            return Result::Fail(ErrorKind::Cancelled,
                                ECANCELED,
                                "Canceled by signal after " + std::to_string(total_written) + " bytes");
        }

        ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) {
            const int e = errno;
            if (e == ECANCELED || g_cancel.load(std::memory_order_relaxed)) {
                return Result::Fail(ErrorKind::Cancelled, ECANCELED, "Canceled by signal");
            }
            return Result::Fail(ErrorKind::ReadError,
                                e,
                                "Read failed after " + std::to_string(total_written) +
                                    " bytes (" + std::string(std::strerror(e)) + ")");
        }

        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.ok) return wr;

        total_written += static_cast<std::uint64_t>(n);

        if (opt_.fsync_interval_bytes != 0) {
            unsynced += static_cast<std::uint64_t>(n);
            if (unsynced >= opt_.fsync_interval_bytes) {
                auto fs = writer.FsyncNow();
                if (!fs.ok) return fs;
                unsynced = 0;
            }
        }
    }

    auto fs = writer.FsyncNow();
    if (!fs.ok) return fs;

    double sec = static_cast<double>(NowMs() - t0) / 1000.0;
    if (sec <= 0.0) sec = 0.001;
    const double mib_s = (static_cast<double>(total_written) / (1024.0 * 1024.0)) / sec;

    LogInfo("Total bytes written: %" PRIu64 " | Time: %.2fs | Avg: %.2f MiB/s",
            total_written,
            sec,
            mib_s);

    return Result::Ok();
}

} // namespace cloner
