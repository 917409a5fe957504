#include "engine/lock.hpp"

#include <atomic>
#include <cstdint>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"

namespace kvmock {

namespace {

std::string next_token() {
    static std::atomic<uint64_t> counter{0};
    return fmt::format("lock-{}", ++counter);
}

} // namespace

Lock::Lock(Engine& engine,
           std::string name,
           std::chrono::milliseconds timeout,
           std::chrono::milliseconds sleep,
           std::optional<std::chrono::milliseconds> blocking_timeout)
    : engine_(engine)
    , name_(std::move(name))
    , token_(next_token())
    , timeout_(timeout)
    , sleep_(sleep)
    , blocking_timeout_(blocking_timeout)
{
    if (sleep_.count() <= 0) {
        throw invalid_argument("lock sleep interval must be > 0");
    }
}

bool Lock::acquire(bool blocking) {
    const auto start = engine_.clock().now();

    for (;;) {
        if (engine_.setnx(name_, token_)) {
            if (timeout_.count() > 0) {
                engine_.pexpire(name_, timeout_.count());
            }
            held_ = true;
            return true;
        }
        if (!blocking) {
            return false;
        }
        if (blocking_timeout_ && engine_.clock().now() - start >= *blocking_timeout_) {
            return false;
        }
        engine_.sleeper().sleep_for(sleep_);
    }
}

void Lock::release() {
    if (!held_) {
        throw response_error("Cannot release an unlocked lock");
    }
    held_ = false;
    if (engine_.get(name_) != token_) {
        throw response_error(fmt::format("Cannot release lock '{}': no longer owned", name_));
    }
    engine_.del({name_});
}

void Lock::lock() {
    if (!acquire(true)) {
        throw response_error(fmt::format("timed out acquiring lock '{}'", name_));
    }
}

} // namespace kvmock
