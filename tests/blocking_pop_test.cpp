#include "blocking/blocking_pop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "test_util.hpp"

namespace kvmock::blocking {

using namespace std::chrono_literals;

namespace asio = boost::asio;

class BlockingPopTest : public ::testing::Test {
protected:
    MockClock         clock_;
    MockSleeper       sleeper_{clock_};
    BlockingPopDriver driver_{clock_, sleeper_, 5s, 100ms};

    std::map<std::string, std::deque<std::string>> queues_;

    PopFn pop_front() {
        return [this](const std::string& key) -> std::optional<std::string> {
            auto it = queues_.find(key);
            if (it == queues_.end() || it->second.empty()) {
                return std::nullopt;
            }
            std::string value = it->second.front();
            it->second.pop_front();
            return value;
        };
    }
};

// ── Immediate results ─────────────────────────────────────────────────────────

TEST_F(BlockingPopTest, ReturnsImmediatelyWhenValueIsReady) {
    queues_["q"] = {"a", "b"};
    const auto result = driver_.pop(pop_front(), {"q"}, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (PopResult{"q", "a"}));
    EXPECT_EQ(sleeper_.sleeps(), 0u);
}

TEST_F(BlockingPopTest, FirstNonEmptyKeyWins) {
    queues_["second"] = {"x"};
    queues_["third"]  = {"y"};
    const auto result = driver_.pop(pop_front(), {"first", "second", "third"}, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->key, "second");
    EXPECT_EQ(result->value, "x");
    EXPECT_EQ(queues_["third"].size(), 1u);
}

// ── Polling ───────────────────────────────────────────────────────────────────

TEST_F(BlockingPopTest, PicksUpValueThatArrivesWhilePolling) {
    const auto ready_at = clock_.now() + 300ms;
    PopFn pop = [&](const std::string&) -> std::optional<std::string> {
        if (clock_.now() >= ready_at) {
            return std::string{"late"};
        }
        return std::nullopt;
    };
    const auto result = driver_.pop(pop, {"q"}, 10);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "late");
    EXPECT_EQ(sleeper_.sleeps(), 3u);
}

TEST_F(BlockingPopTest, TimesOutAfterRequestedSeconds) {
    const auto start = clock_.now();
    EXPECT_FALSE(driver_.pop(pop_front(), {"q"}, 2).has_value());
    EXPECT_GE(clock_.now() - start, Clock::duration{2s});
    EXPECT_EQ(sleeper_.sleeps(), 20u);
}

TEST_F(BlockingPopTest, ZeroTimeoutUsesTheDefault) {
    const auto start = clock_.now();
    EXPECT_FALSE(driver_.pop(pop_front(), {"q"}, 0).has_value());
    EXPECT_GE(clock_.now() - start, Clock::duration{5s});
    EXPECT_EQ(sleeper_.sleeps(), 50u);
}

// ── Validation ────────────────────────────────────────────────────────────────

TEST_F(BlockingPopTest, NegativeTimeoutIsRejected) {
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, driver_.pop(pop_front(), {"q"}, -1));
    EXPECT_EQ(sleeper_.sleeps(), 0u);
}

TEST_F(BlockingPopTest, ResolveTimeout) {
    EXPECT_EQ(driver_.resolve_timeout(0), std::chrono::milliseconds{5000});
    EXPECT_EQ(driver_.resolve_timeout(3), std::chrono::milliseconds{3000});
}

TEST(BlockingPopDriverTest, NonPositivePollIntervalIsRejected) {
    MockClock clock;
    MockSleeper sleeper{clock};
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument,
                        BlockingPopDriver(clock, sleeper, 1s, 0ms));
}

// ── Coroutine variant ─────────────────────────────────────────────────────────

TEST_F(BlockingPopTest, AsyncPopSeesValuePushedByAnotherCoroutine) {
    asio::io_context ioc;
    std::optional<PopResult> result;

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        std::vector<std::string> keys{"q"};
        result = co_await driver_.async_pop(pop_front(), keys, 1);
    }, asio::detached);

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        asio::steady_timer timer{co_await asio::this_coro::executor};
        timer.expires_after(20ms);
        co_await timer.async_wait(asio::use_awaitable);
        queues_["q"].push_back("pushed");
    }, asio::detached);

    ioc.run();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (PopResult{"q", "pushed"}));
}

TEST_F(BlockingPopTest, AsyncPopTimesOutOnInjectedClock) {
    asio::io_context ioc;
    std::optional<PopResult> result{PopResult{"sentinel", "sentinel"}};

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        std::vector<std::string> keys{"q"};
        result = co_await driver_.async_pop(pop_front(), keys, 2);
    }, asio::detached);

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        asio::steady_timer timer{co_await asio::this_coro::executor};
        timer.expires_after(10ms);
        co_await timer.async_wait(asio::use_awaitable);
        clock_.advance(3s);
    }, asio::detached);

    ioc.run();

    EXPECT_FALSE(result.has_value());
}

} // namespace kvmock::blocking
