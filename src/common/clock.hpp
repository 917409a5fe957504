#pragma once

#include <chrono>

namespace kvmock {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Time source for expiry bookkeeping and the blocking-pop driver.  Uses the
// system clock so that absolute UNIX instants (EXPIREAT) and relative
// expiries (EXPIRE) live on the same axis.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;
    using duration   = time_point::duration;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class MockClock final : public Clock {
public:
    MockClock() = default;
    explicit MockClock(time_point start) : now_(start) {}

    [[nodiscard]] time_point now() const override {
        return now_;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        now_ += std::chrono::duration_cast<time_point::duration>(delta);
    }

    void set(time_point tp) {
        now_ = tp;
    }

private:
    time_point now_{std::chrono::seconds{1'700'000'000}};
};

} // namespace kvmock
