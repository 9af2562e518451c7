#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace tierkv {

// ── Clock ────────────────────────────────────────────────────────────────────
//
// Monotonic time source for TTL deadlines and lock records.  Shards read the
// time only through this interface, so tests drive expiry by hand.

class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }

    // Process-wide instance used when no clock is injected.
    [[nodiscard]] static const SteadyClock& instance() {
        static const SteadyClock clock;
        return clock;
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Stands still until advance() is called.  Safe to read from engine threads
// while a test thread advances it.  Starts one hour past the steady epoch so
// deadlines computed by subtraction never go negative.

class MockClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return time_point{duration{ticks_.load(std::memory_order_acquire)}};
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        ticks_.fetch_add(std::chrono::duration_cast<duration>(delta).count(),
                         std::memory_order_acq_rel);
    }

private:
    std::atomic<duration::rep> ticks_{
        std::chrono::duration_cast<duration>(std::chrono::hours{1}).count()};
};

// ── Wall clock ───────────────────────────────────────────────────────────────
//
// Unix time, for deadlines and timestamps that outlive the process
// (snapshots, WAL records).

[[nodiscard]] inline int64_t unix_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

[[nodiscard]] inline int64_t unix_now_ms() {
    return unix_now_ns() / 1'000'000;
}

} // namespace tierkv
