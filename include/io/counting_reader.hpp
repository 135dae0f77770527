#pragma once
#include "io/io.hpp"

#include <atomic>
#include <cstdint>

namespace relay {

// Publishes the running byte count to an atomic another thread may poll.
class CountingReader final : public IReader {
public:
    explicit CountingReader(IReader& inner, std::atomic<std::uint64_t>* external_counter = nullptr)
        : inner_(inner), external_(external_counter) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = inner_.Read(out);
        if (n > 0) {
            read_ += static_cast<std::uint64_t>(n);
            if (external_) external_->store(read_, std::memory_order_relaxed);
        }
        return n;
    }

    std::uint64_t BytesRead() const { return read_; }

    std::optional<std::uint64_t> TotalSize() const override { return inner_.TotalSize(); }

private:
    IReader& inner_;
    std::uint64_t read_ = 0;
    std::atomic<std::uint64_t>* external_ = nullptr;
};

} // namespace relay
