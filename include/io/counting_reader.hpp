#pragma once
#include "io/io.hpp"
#include <atomic>
#include <cstdint>
#include <memory>

namespace cloner {

// Pass-through reader that counts consumed bytes. When an external counter is
// given, the running total is published to it after every successful read so
// another thread can sample progress without touching the stream.
class CountingReader final : public IReader {
public:
    explicit CountingReader(std::unique_ptr<IReader> inner,
                            std::atomic<std::uint64_t>* external_counter = nullptr)
        : inner_(std::move(inner)), external_(external_counter) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = inner_->Read(out);
        if (n > 0) {
            read_ += static_cast<std::uint64_t>(n);
            if (external_) external_->store(read_, std::memory_order_release);
        }
        return n;
    }

    std::uint64_t BytesRead() const { return read_; }

private:
    std::unique_ptr<IReader> inner_;
    std::uint64_t read_ = 0;
    std::atomic<std::uint64_t>* external_ = nullptr;
};

} // namespace cloner
