// ============================================================================
// pactum/core/clock.hpp - Time Source Abstraction
// ============================================================================
//
// The registry only ever asks "what time is it now?" to compare against task
// deadlines. Hosts plug in SystemClock; tests use ManualClock to sit exactly
// on a deadline boundary.
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace pactum {

// Seconds since the Unix epoch
using Timestamp = std::chrono::sys_seconds;

class Clock {
   public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp Now() const = 0;
};

// Wall clock truncated to whole seconds
class SystemClock : public Clock {
   public:
    [[nodiscard]] Timestamp Now() const override {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }
};

// Clock that only moves when told to
class ManualClock : public Clock {
   public:
    explicit ManualClock(Timestamp start = Timestamp{}) : now_(start.time_since_epoch().count()) {}

    [[nodiscard]] Timestamp Now() const override {
        return Timestamp{std::chrono::seconds{now_.load(std::memory_order_acquire)}};
    }

    void Set(Timestamp t) { now_.store(t.time_since_epoch().count(), std::memory_order_release); }

    void Advance(std::chrono::seconds delta) { now_.fetch_add(delta.count(), std::memory_order_acq_rel); }

   private:
    std::atomic<std::int64_t> now_;
};

}  // namespace pactum
