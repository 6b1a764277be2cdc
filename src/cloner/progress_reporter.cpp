#include "cloner/progress_reporter.hpp"

#include "util/logger.hpp"

namespace cloner {

ProgressReporter::ProgressReporter(const Transfer& transfer, metrics::Registry& registry)
    : ProgressReporter(transfer, registry, Options{}) {}

ProgressReporter::ProgressReporter(const Transfer& transfer,
                                   metrics::Registry& registry,
                                   const Options& opt)
    : transfer_(transfer),
      registry_(registry),
      progress_(registry.RegisterCounterVec(kProgressMetricName, kProgressMetricHelp, kProgressMetricLabel)),
      opt_(opt) {}

ProgressReporter::~ProgressReporter() { Stop(); }

void ProgressReporter::Start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (thread_.joinable() || stop_) return;
    thread_ = std::thread([this] { Run(); });
}

void ProgressReporter::Stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void ProgressReporter::Run() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        if (cv_.wait_for(lk, opt_.interval, [this] { return stop_; })) break;
        lk.unlock();
        (void)Tick();
        lk.lock();
    }
}

std::optional<ProgressSample> ProgressReporter::Tick() {
    if (transfer_.total_size == 0) return std::nullopt;

    const std::uint64_t done = transfer_.bytes_transferred.load(std::memory_order_acquire);
    ProgressSample sample;
    sample.percentage =
        static_cast<double>(done) / static_cast<double>(transfer_.total_size) * 100.0;
    sample.published_at = std::chrono::system_clock::now();

    const double last = progress_.Value(transfer_.owner_id);
    if (sample.percentage > last) {
        (void)progress_.Add(transfer_.owner_id, sample.percentage - last);
        if (opt_.sink) {
            if (auto r = opt_.sink->Publish(registry_); !r.ok) {
                LogWarn("metrics sink: %s", r.msg.c_str());
            }
        }
    }
    LogDebug("%.2f", sample.percentage);
    return sample;
}

} // namespace cloner
