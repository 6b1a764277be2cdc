#pragma once

#include "metrics/registry.hpp"
#include "util/result.hpp"

#include <string>

namespace cloner::metrics {

class IMetricsSink {
  public:
    virtual ~IMetricsSink() = default;
    virtual Result Publish(const Registry& registry) = 0;
};

// Rewrites a file with the current exposition text on every publish. The file
// is replaced with rename(2), so a scraper never reads a partial document.
class FileMetricsSink final : public IMetricsSink {
  public:
    explicit FileMetricsSink(std::string path);

    Result Publish(const Registry& registry) override;

  private:
    std::string path_;
};

} // namespace cloner::metrics
