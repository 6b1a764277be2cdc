#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cloner::metrics {

// A family of monotonic counters sharing a name, split by one label.
class CounterVec {
  public:
    CounterVec(std::string name, std::string help, std::string label_name);

    CounterVec(const CounterVec&) = delete;
    CounterVec& operator=(const CounterVec&) = delete;

    // Counters only go up: a negative or non-finite delta is refused and
    // leaves the value untouched.
    bool Add(const std::string& label_value, double delta);

    // 0 for a label that has never been incremented.
    double Value(const std::string& label_value) const;

    const std::string& Name() const { return name_; }
    const std::string& Help() const { return help_; }
    const std::string& LabelName() const { return label_name_; }

    void AppendExposition(std::string& out) const;

  private:
    std::string name_;
    std::string help_;
    std::string label_name_;

    mutable std::mutex mu_;
    std::map<std::string, double> values_;
};

class Registry {
  public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Returns the existing family when the name is already registered.
    CounterVec& RegisterCounterVec(const std::string& name,
                                   const std::string& help,
                                   const std::string& label_name);

    // Prometheus text exposition format (version 0.0.4).
    std::string Serialize() const;

  private:
    mutable std::mutex mu_;
    std::vector<std::unique_ptr<CounterVec>> families_;
};

} // namespace cloner::metrics
