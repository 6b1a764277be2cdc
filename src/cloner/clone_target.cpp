#include "cloner/clone_target.hpp"

#include "cloner/size_header.hpp"
#include "cloner/transfer.hpp"
#include "io/counting_reader.hpp"
#include "util/logger.hpp"

#include <memory>
#include <utility>

namespace cloner {

CloneTarget::CloneTarget(IChannel& channel,
                         const DestinationDispatcher& dispatcher,
                         metrics::Registry& registry,
                         CloneTargetOptions opt)
    : channel_(channel), dispatcher_(dispatcher), registry_(registry), opt_(std::move(opt)) {}

Result CloneTarget::Run() {
    if (auto r = ReadTotalSize(channel_, total_size_); !r.ok) return r;
    LogInfo("Size read: %llu", (unsigned long long)total_size_);

    // Phase two is a fresh open of the same channel.
    std::unique_ptr<IReader> payload;
    if (auto r = channel_.Open(payload); !r.ok) return r;

    Transfer transfer(total_size_, opt_.owner_uid);
    CountingReader relay(std::move(payload), &transfer.bytes_transferred);

    ProgressReporter reporter(transfer, registry_, opt_.progress);
    reporter.Start();

    const Destination dst = ResolveDestination(opt_.marker_path, opt_.block_device_path, opt_.target_dir);
    LogDebug("Destination: %s", DescribeDestination(dst).c_str());

    auto res = dispatcher_.Dispatch(dst, relay);
    reporter.Stop();
    bytes_transferred_ = relay.BytesRead();

    if (!res.ok) return res;

    LogInfo("clone complete: %llu of %llu bytes",
            (unsigned long long)bytes_transferred_,
            (unsigned long long)total_size_);
    return Result::Ok();
}

} // namespace cloner
