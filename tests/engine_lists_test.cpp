#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "engine_fixture.hpp"
#include "test_util.hpp"

namespace kvmock {

using namespace std::chrono_literals;

using Strings = std::vector<std::string>;

class EngineListsTest : public EngineTest {};

// ── Push / pop ────────────────────────────────────────────────────────────────

TEST_F(EngineListsTest, PushesReturnNewLength) {
    EXPECT_EQ(engine_.rpush("l", {"a", "b"}), 2u);
    EXPECT_EQ(engine_.lpush("l", {"x", "y"}), 4u);
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"y", "x", "a", "b"}));
}

TEST_F(EngineListsTest, EmptyPushIsRejected) {
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, engine_.lpush("l", {}));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, engine_.rpush("l", {}));
    EXPECT_FALSE(engine_.exists("l"));
}

TEST_F(EngineListsTest, PopsFromBothEnds) {
    engine_.rpush("l", {"a", "b", "c"});
    EXPECT_EQ(engine_.lpop("l"), "a");
    EXPECT_EQ(engine_.rpop("l"), "c");
    EXPECT_EQ(engine_.llen("l"), 1u);
}

TEST_F(EngineListsTest, PoppingLastElementRemovesKey) {
    engine_.rpush("l", {"only"});
    EXPECT_EQ(engine_.lpop("l"), "only");
    EXPECT_FALSE(engine_.exists("l"));
    EXPECT_EQ(engine_.lpop("l"), std::nullopt);
}

// ── Indexing ──────────────────────────────────────────────────────────────────

TEST_F(EngineListsTest, LrangeTranslatesIndices) {
    engine_.rpush("l", {"a", "b", "c", "d", "e"});
    EXPECT_EQ(engine_.lrange("l", -2, -1), (Strings{"d", "e"}));
    EXPECT_EQ(engine_.lrange("l", 1, 2), (Strings{"b", "c"}));
    EXPECT_TRUE(engine_.lrange("l", 10, 20).empty());
    EXPECT_TRUE(engine_.lrange("missing", 0, -1).empty());
}

TEST_F(EngineListsTest, Lindex) {
    engine_.rpush("l", {"a", "b", "c"});
    EXPECT_EQ(engine_.lindex("l", 0), "a");
    EXPECT_EQ(engine_.lindex("l", -1), "c");
    EXPECT_EQ(engine_.lindex("l", 3), std::nullopt);
    EXPECT_EQ(engine_.lindex("l", -4), std::nullopt);
}

TEST_F(EngineListsTest, Lset) {
    engine_.rpush("l", {"a", "b"});
    engine_.lset("l", -1, "z");
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"a", "z"}));
    EXPECT_KVMOCK_ERROR(ErrorKind::ResponseError, engine_.lset("l", 5, "x"));
    EXPECT_KVMOCK_ERROR(ErrorKind::ResponseError, engine_.lset("missing", 0, "x"));
}

// ── LREM / LTRIM ──────────────────────────────────────────────────────────────

TEST_F(EngineListsTest, LremDirections) {
    engine_.rpush("l", {"x", "a", "x", "b", "x"});
    EXPECT_EQ(engine_.lrem("l", "x", 1), 1u);
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"a", "x", "b", "x"}));
    EXPECT_EQ(engine_.lrem("l", "x", -1), 1u);
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"a", "x", "b"}));
    EXPECT_EQ(engine_.lrem("l", "x", 0), 1u);
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"a", "b"}));
}

TEST_F(EngineListsTest, LremExtremeCountsRemoveEveryMatch) {
    engine_.rpush("l", {"x", "a", "x", "b", "x"});
    EXPECT_EQ(engine_.lrem("l", "x", std::numeric_limits<int64_t>::min()), 3u);
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"a", "b"}));

    engine_.rpush("l", {"a"});
    EXPECT_EQ(engine_.lrem("l", "a", std::numeric_limits<int64_t>::max()), 2u);
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"b"}));
}

TEST_F(EngineListsTest, LremAllRemovesKey) {
    engine_.rpush("l", {"x", "x"});
    EXPECT_EQ(engine_.lrem("l", "x"), 2u);
    EXPECT_FALSE(engine_.exists("l"));
}

TEST_F(EngineListsTest, Ltrim) {
    engine_.rpush("l", {"a", "b", "c", "d"});
    engine_.ltrim("l", 1, -2);
    EXPECT_EQ(engine_.lrange("l", 0, -1), (Strings{"b", "c"}));
    engine_.ltrim("l", 5, 10);
    EXPECT_FALSE(engine_.exists("l"));
}

// ── RPOPLPUSH ─────────────────────────────────────────────────────────────────

TEST_F(EngineListsTest, Rpoplpush) {
    engine_.rpush("src", {"a", "b"});
    EXPECT_EQ(engine_.rpoplpush("src", "dst"), "b");
    EXPECT_EQ(engine_.rpoplpush("src", "dst"), "a");
    EXPECT_FALSE(engine_.exists("src"));
    EXPECT_EQ(engine_.lrange("dst", 0, -1), (Strings{"a", "b"}));
    EXPECT_EQ(engine_.rpoplpush("src", "dst"), std::nullopt);
}

TEST_F(EngineListsTest, RpoplpushChecksDestinationFirst) {
    engine_.rpush("src", {"a"});
    engine_.set("dst", "string");
    EXPECT_KVMOCK_ERROR(ErrorKind::TypeMismatch, engine_.rpoplpush("src", "dst"));
    EXPECT_EQ(engine_.llen("src"), 1u);
}

TEST_F(EngineListsTest, ListCommandsOnSetAreTypeMismatch) {
    engine_.sadd("s", {"a"});
    EXPECT_KVMOCK_ERROR(ErrorKind::TypeMismatch, engine_.lpush("s", {"x"}));
    EXPECT_KVMOCK_ERROR(ErrorKind::TypeMismatch, engine_.llen("s"));
}

// ── Blocking pops ─────────────────────────────────────────────────────────────

TEST_F(EngineListsTest, BlpopReturnsFirstAvailableKey) {
    engine_.rpush("b", {"1", "2"});
    const auto result = engine_.blpop({"a", "b"}, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->key, "b");
    EXPECT_EQ(result->value, "1");
    EXPECT_EQ(sleeper_.sleeps(), 0u);
}

TEST_F(EngineListsTest, BrpopTakesFromTheTail) {
    engine_.rpush("q", {"1", "2"});
    const auto result = engine_.brpop({"q"}, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "2");
}

TEST_F(EngineListsTest, BlpopTimesOutOnVirtualClock) {
    const auto start = clock_.now();
    EXPECT_EQ(engine_.blpop({"empty"}, 2), std::nullopt);
    EXPECT_GE(clock_.now() - start, Clock::duration{2s});
}

TEST_F(EngineListsTest, BlpopZeroTimeoutUsesConfiguredDefault) {
    const auto start = clock_.now();
    EXPECT_EQ(engine_.blpop({"empty"}, 0), std::nullopt);
    EXPECT_GE(clock_.now() - start, Clock::duration{5s});
}

TEST_F(EngineListsTest, BlpopNegativeTimeoutIsRejected) {
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, engine_.blpop({"q"}, -1));
}

TEST_F(EngineListsTest, Brpoplpush) {
    engine_.rpush("src", {"a", "b"});
    EXPECT_EQ(engine_.brpoplpush("src", "dst", 1), "b");
    EXPECT_EQ(engine_.lrange("dst", 0, -1), (Strings{"b"}));
    EXPECT_EQ(engine_.brpoplpush("empty", "dst", 1), std::nullopt);
}

TEST(EngineAsyncListsTest, AsyncBlpopWakesOnPush) {
    namespace asio = boost::asio;

    EngineConfig config;
    config.blocking_poll_interval = 5ms;
    Engine engine{config};

    asio::io_context ioc;
    std::optional<PopResult> result;

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        std::vector<std::string> keys{"jobs"};
        result = co_await engine.async_blpop(keys, 2);
    }, asio::detached);

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        asio::steady_timer timer{co_await asio::this_coro::executor};
        timer.expires_after(20ms);
        co_await timer.async_wait(asio::use_awaitable);
        engine.rpush("jobs", {"job-1"});
    }, asio::detached);

    ioc.run();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->key, "jobs");
    EXPECT_EQ(result->value, "job-1");
    EXPECT_FALSE(engine.exists("jobs"));
}

} // namespace kvmock
