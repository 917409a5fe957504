#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "engine/engine.hpp"

namespace kvmock {

// ── Lock ─────────────────────────────────────────────────────────────────────
//
// Advisory lock stored as a plain string key: acquisition is SETNX of a
// per-instance token followed by PEXPIRE when `timeout` is positive.
// Blocking acquisition polls through the engine's Sleeper.
//
// Satisfies Lockable, so std::lock_guard / std::unique_lock work.

class Lock {
public:
    Lock(Engine& engine,
         std::string name,
         std::chrono::milliseconds timeout = std::chrono::milliseconds{0},
         std::chrono::milliseconds sleep = std::chrono::milliseconds{100},
         std::optional<std::chrono::milliseconds> blocking_timeout = std::nullopt);

    Lock(const Lock&)            = delete;
    Lock& operator=(const Lock&) = delete;

    // Returns true once the lock is held.  Non-blocking acquisition makes a
    // single attempt; blocking acquisition gives up after blocking_timeout.
    bool acquire(bool blocking = true);

    // Throws ResponseError if this instance does not hold the lock.
    void release();

    void lock();
    bool try_lock() { return acquire(false); }
    void unlock() { release(); }

    [[nodiscard]] bool owned() const noexcept { return held_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& token() const noexcept { return token_; }

private:
    Engine& engine_;
    std::string name_;
    std::string token_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds sleep_;
    std::optional<std::chrono::milliseconds> blocking_timeout_;
    bool held_ = false;
};

} // namespace kvmock
