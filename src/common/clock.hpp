#pragma once

#include <atomic>
#include <chrono>

namespace memkv {

// ── Clock ────────────────────────────────────────────────────────────────────
//
// Time source for key expiry.  The keyspace asks for "now" and for TTL
// deadlines only through this interface, so tests can step time by hand.

class Clock {
public:
    using duration   = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    // now() + ttl, clamped to time_point::max() when the sum would not fit.
    // A clamped deadline never passes.
    [[nodiscard]] time_point deadline_after(std::chrono::milliseconds ttl) const {
        const time_point start = now();
        const auto headroom =
            std::chrono::duration_cast<std::chrono::milliseconds>(time_point::max() - start);
        return ttl >= headroom ? time_point::max() : start + ttl;
    }
};

// Production clock: std::chrono::steady_clock.
class SteadyClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Stands still until advance() is called.  Safe to advance while other
// threads read it.

class MockClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return time_point{duration{ticks_.load(std::memory_order_acquire)}};
    }

    void advance(std::chrono::milliseconds delta) {
        ticks_.fetch_add(std::chrono::duration_cast<duration>(delta).count(),
                         std::memory_order_acq_rel);
    }

private:
    std::atomic<duration::rep> ticks_{0};
};

} // namespace memkv
