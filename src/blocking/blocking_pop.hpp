#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <spdlog/spdlog.h>

#include "common/clock.hpp"

namespace kvmock::blocking {

// ── Sleeper abstraction ──────────────────────────────────────────────────────
//
// The synchronous driver waits between polling passes through this interface
// so tests can substitute a sleeper that only advances a MockClock.

class Sleeper {
public:
    virtual ~Sleeper() = default;

    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

// Production implementation: blocks the calling thread.
class ThreadSleeper final : public Sleeper {
public:
    void sleep_for(std::chrono::milliseconds duration) override;
};

// Test implementation: advances a MockClock instead of sleeping.
class MockSleeper final : public Sleeper {
public:
    explicit MockSleeper(MockClock& clock) : clock_(clock) {}

    void sleep_for(std::chrono::milliseconds duration) override {
        clock_.advance(duration);
        ++sleeps_;
    }

    [[nodiscard]] std::size_t sleeps() const noexcept { return sleeps_; }

private:
    MockClock&  clock_;
    std::size_t sleeps_ = 0;
};

// ── Pop primitives ───────────────────────────────────────────────────────────

struct PopResult {
    std::string key;
    std::string value;

    bool operator==(const PopResult&) const = default;
};

// Non-blocking single-key pop: the popped value, or std::nullopt.
using PopFn = std::function<std::optional<std::string>(const std::string& key)>;

// ── BlockingPopDriver ────────────────────────────────────────────────────────
//
// Emulates BLPOP-style commands by polling:
//   1. try `pop` on each key in order; the first hit wins;
//   2. if every key came back empty, wait `poll_interval` and go again;
//   3. give up once the elapsed time reaches the timeout.
//
// A timeout of 0 selects `default_timeout`.  Negative timeouts throw
// InvalidArgument.  The driver never waits on a producer signal; only the
// timeout ends the loop.

class BlockingPopDriver {
public:
    BlockingPopDriver(const Clock& clock,
                      Sleeper& sleeper,
                      std::chrono::seconds default_timeout,
                      std::chrono::milliseconds poll_interval,
                      std::shared_ptr<spdlog::logger> logger = {});

    // Poll until a pop succeeds or `timeout_seconds` elapse.
    [[nodiscard]] std::optional<PopResult>
    pop(const PopFn& pop, const std::vector<std::string>& keys,
        int64_t timeout_seconds) const;

    // Cooperative variant for Boost.Asio coroutines: waits on a steady_timer
    // between passes so other coroutines on the same executor can push.
    [[nodiscard]] boost::asio::awaitable<std::optional<PopResult>>
    async_pop(PopFn pop, std::vector<std::string> keys, int64_t timeout_seconds) const;

    // One pass over `keys`.
    [[nodiscard]] static std::optional<PopResult>
    pop_first_available(const PopFn& pop, const std::vector<std::string>& keys);

    // Map a caller-supplied timeout to the effective wait (0 → default).
    [[nodiscard]] std::chrono::milliseconds resolve_timeout(int64_t timeout_seconds) const;

    [[nodiscard]] std::chrono::seconds default_timeout() const noexcept { return default_timeout_; }
    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept { return poll_interval_; }

private:
    const Clock& clock_;
    Sleeper& sleeper_;
    std::chrono::seconds default_timeout_;
    std::chrono::milliseconds poll_interval_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace kvmock::blocking
