#include "blocking/blocking_pop.hpp"

#include <thread>
#include <utility>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"

namespace kvmock::blocking {

void ThreadSleeper::sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

BlockingPopDriver::BlockingPopDriver(const Clock& clock,
                                     Sleeper& sleeper,
                                     std::chrono::seconds default_timeout,
                                     std::chrono::milliseconds poll_interval,
                                     std::shared_ptr<spdlog::logger> logger)
    : clock_(clock)
    , sleeper_(sleeper)
    , default_timeout_(default_timeout)
    , poll_interval_(poll_interval)
    , logger_(std::move(logger))
{
    if (poll_interval_.count() <= 0) {
        throw invalid_argument("blocking poll interval must be > 0");
    }
}

std::chrono::milliseconds BlockingPopDriver::resolve_timeout(int64_t timeout_seconds) const {
    if (timeout_seconds < 0) {
        throw invalid_argument(
            fmt::format("timeout is not an integer or out of range: {}", timeout_seconds));
    }
    if (timeout_seconds == 0) {
        return default_timeout_;
    }
    return std::chrono::seconds{timeout_seconds};
}

std::optional<PopResult>
BlockingPopDriver::pop_first_available(const PopFn& pop, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        if (auto value = pop(key)) {
            return PopResult{key, std::move(*value)};
        }
    }
    return std::nullopt;
}

std::optional<PopResult>
BlockingPopDriver::pop(const PopFn& pop, const std::vector<std::string>& keys,
                       int64_t timeout_seconds) const {
    const auto timeout = resolve_timeout(timeout_seconds);
    const auto start   = clock_.now();
    Clock::duration elapsed{0};

    while (elapsed < timeout) {
        if (auto result = pop_first_available(pop, keys)) {
            return result;
        }
        sleeper_.sleep_for(poll_interval_);
        elapsed = clock_.now() - start;
    }

    if (logger_) {
        logger_->debug("[blocking] no value on {} key(s) after {} ms",
                       keys.size(), timeout.count());
    }
    return std::nullopt;
}

boost::asio::awaitable<std::optional<PopResult>>
BlockingPopDriver::async_pop(PopFn pop, std::vector<std::string> keys,
                             int64_t timeout_seconds) const {
    const auto timeout = resolve_timeout(timeout_seconds);
    const auto start   = clock_.now();
    Clock::duration elapsed{0};

    boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};

    while (elapsed < timeout) {
        if (auto result = pop_first_available(pop, keys)) {
            co_return result;
        }
        timer.expires_after(poll_interval_);
        co_await timer.async_wait(boost::asio::use_awaitable);
        elapsed = clock_.now() - start;
    }

    if (logger_) {
        logger_->debug("[blocking] async pop on {} key(s) timed out after {} ms",
                       keys.size(), timeout.count());
    }
    co_return std::nullopt;
}

} // namespace kvmock::blocking
