#include "metrics/registry.hpp"

#include <cmath>
#include <cstdio>

namespace cloner::metrics {

namespace {

std::string EscapeLabelValue(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

std::string FormatValue(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

} // namespace

CounterVec::CounterVec(std::string name, std::string help, std::string label_name)
    : name_(std::move(name)), help_(std::move(help)), label_name_(std::move(label_name)) {}

bool CounterVec::Add(const std::string& label_value, double delta) {
    if (!std::isfinite(delta) || delta < 0.0) return false;
    std::lock_guard<std::mutex> lk(mu_);
    values_[label_value] += delta;
    return true;
}

double CounterVec::Value(const std::string& label_value) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = values_.find(label_value);
    return it == values_.end() ? 0.0 : it->second;
}

void CounterVec::AppendExposition(std::string& out) const {
    out += "# HELP " + name_ + " " + help_ + "\n";
    out += "# TYPE " + name_ + " counter\n";

    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [label, value] : values_) {
        out += name_ + "{" + label_name_ + "=\"" + EscapeLabelValue(label) + "\"} " + FormatValue(value) + "\n";
    }
}

CounterVec& Registry::RegisterCounterVec(const std::string& name,
                                         const std::string& help,
                                         const std::string& label_name) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& f : families_) {
        if (f->Name() == name) return *f;
    }
    families_.push_back(std::make_unique<CounterVec>(name, help, label_name));
    return *families_.back();
}

std::string Registry::Serialize() const {
    std::string out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& f : families_) {
        f->AppendExposition(out);
    }
    return out;
}

} // namespace cloner::metrics
