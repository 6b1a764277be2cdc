#pragma once

#include "cloner/transfer.hpp"
#include "metrics/registry.hpp"
#include "metrics/sink.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace cloner {

inline constexpr const char* kProgressMetricName = "clone_progress";
inline constexpr const char* kProgressMetricHelp = "The clone progress in percentage";
inline constexpr const char* kProgressMetricLabel = "ownerUID";

struct ProgressSample {
    double percentage = 0.0;
    std::chrono::system_clock::time_point published_at;
};

// Samples a Transfer on a fixed cadence and feeds the clone_progress counter.
// The counter only ever receives positive deltas, so the exported value never
// goes down even when a sample is lower than what was already published.
class ProgressReporter {
  public:
    struct Options {
        std::chrono::milliseconds interval{1000};
        metrics::IMetricsSink* sink = nullptr;
    };

    ProgressReporter(const Transfer& transfer, metrics::Registry& registry);
    ProgressReporter(const Transfer& transfer, metrics::Registry& registry, const Options& opt);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void Start();
    // Idempotent. Waits for an in-flight tick to finish.
    void Stop();

    // One reporting step. Returns nullopt when total_size is 0.
    std::optional<ProgressSample> Tick();

  private:
    void Run();

    const Transfer& transfer_;
    metrics::Registry& registry_;
    metrics::CounterVec& progress_;
    Options opt_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;
};

} // namespace cloner
