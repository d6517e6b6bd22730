#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

// Monotonic request id source. Proxies derived from one root share the same
// counter; independent clients may share one deliberately or get their own.
class RequestIdCounter {
public:
    RequestIdCounter() = default;
    explicit RequestIdCounter(int64_t last) : last_(last) {}

    RequestIdCounter(const RequestIdCounter&)            = delete;
    RequestIdCounter& operator=(const RequestIdCounter&) = delete;

    // Increment-and-read; never returns the same value twice.
    int64_t next() noexcept { return last_.fetch_add(1, std::memory_order_relaxed) + 1; }

    [[nodiscard]] int64_t last() const noexcept { return last_.load(std::memory_order_relaxed); }

    // Counter used by proxies constructed without one.
    static std::shared_ptr<RequestIdCounter> process_default() {
        static const auto counter = std::make_shared<RequestIdCounter>();
        return counter;
    }

private:
    std::atomic<int64_t> last_{0};
};
