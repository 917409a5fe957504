#include "command/dispatcher.hpp"
#include "command/script.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine_fixture.hpp"
#include "reply_printer.hpp"
#include "test_util.hpp"

namespace kvmock::command {

// ── Fake script runner ────────────────────────────────────────────────────────

// Interprets a tiny fixed vocabulary instead of a scripting language:
//   "setget"  SET keys[0] args[0], then GET keys[0]
//   "incr"    INCR keys[0]
//   "echo"    returns the key and argument counts
class FakeRunner final : public ScriptRunner {
public:
    Reply run(const std::string& source, const Args& keys, const Args& args,
              const CallFn& call) override {
        ++runs;
        last_keys = keys;
        last_args = args;
        if (source == "setget") {
            call("set", {keys.at(0), args.at(0)});
            return call("get", {keys.at(0)});
        }
        if (source == "incr") {
            return call("incr", {keys.at(0)});
        }
        return array({integer(static_cast<int64_t>(keys.size())),
                      integer(static_cast<int64_t>(args.size()))});
    }

    int  runs = 0;
    Args last_keys;
    Args last_args;
};

class DispatcherTest : public EngineTest {
protected:
    CommandDispatcher dispatcher_{engine_};
};

// ── Routing ───────────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, UnknownCommand) {
    EXPECT_KVMOCK_ERROR(ErrorKind::UnknownCommand, dispatcher_.call("frobnicate", {"x"}));
    EXPECT_FALSE(dispatcher_.has_command("frobnicate"));
}

TEST_F(DispatcherTest, WrongArity) {
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.call("get", {}));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.call("get", {"a", "b"}));
}

TEST_F(DispatcherTest, NamesAreCaseInsensitive) {
    EXPECT_EQ(dispatcher_.call("SET", {"k", "v"}), ok());
    EXPECT_EQ(dispatcher_.call("GeT", {"k"}), bulk("v"));
    EXPECT_TRUE(dispatcher_.has_command("ZADD"));
}

TEST_F(DispatcherTest, CommandNamesAreSorted) {
    const auto names = dispatcher_.command_names();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_NE(std::find(names.begin(), names.end(), "zrangebyscore"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "evalsha"), names.end());
}

TEST_F(DispatcherTest, EngineErrorsPropagate) {
    dispatcher_.call("rpush", {"l", "a"});
    EXPECT_KVMOCK_ERROR(ErrorKind::TypeMismatch, dispatcher_.call("get", {"l"}));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.call("expire", {"l", "soon"}));
}

// ── Strings and keys ──────────────────────────────────────────────────────────

TEST_F(DispatcherTest, SetOptions) {
    EXPECT_EQ(dispatcher_.call("set", {"k", "v", "NX"}), ok());
    EXPECT_EQ(dispatcher_.call("set", {"k", "w", "nx"}), nil());
    EXPECT_EQ(dispatcher_.call("set", {"k", "w", "EX", "10"}), ok());
    EXPECT_EQ(dispatcher_.call("ttl", {"k"}), integer(10));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.call("set", {"k", "v", "KEEPTTL"}));
}

TEST_F(DispatcherTest, TtlReplies) {
    EXPECT_EQ(dispatcher_.call("ttl", {"missing"}), integer(-2));
    dispatcher_.call("set", {"k", "v"});
    EXPECT_EQ(dispatcher_.call("ttl", {"k"}), nil());
}

TEST_F(DispatcherTest, KeyCommands) {
    dispatcher_.call("mset", {"a", "1", "b", "2"});
    EXPECT_EQ(dispatcher_.call("exists", {"a", "b", "c"}), integer(2));
    EXPECT_EQ(dispatcher_.call("type", {"a"}), status("string"));
    EXPECT_EQ(dispatcher_.call("mget", {"a", "c"}), array({bulk("1"), nil()}));
    EXPECT_EQ(dispatcher_.call("del", {"a", "c"}), integer(1));
    EXPECT_EQ(dispatcher_.call("dbsize"), integer(1));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.call("mset", {"a", "1", "b"}));
}

TEST_F(DispatcherTest, PublishAndPing) {
    EXPECT_EQ(dispatcher_.call("publish", {"news", "hi"}), integer(0));
    EXPECT_EQ(engine_.published("news"), (std::vector<std::string>{"hi"}));
    EXPECT_EQ(dispatcher_.call("ping"), status("PONG"));
    EXPECT_EQ(dispatcher_.call("multi"), ok());
    EXPECT_EQ(dispatcher_.call("exec"), ok());
}

// ── Hashes and lists ──────────────────────────────────────────────────────────

TEST_F(DispatcherTest, HsetAcceptsSeveralPairs) {
    EXPECT_EQ(dispatcher_.call("hset", {"h", "a", "1", "b", "2"}), integer(2));
    EXPECT_EQ(dispatcher_.call("hgetall", {"h"}),
              array({bulk("a"), bulk("1"), bulk("b"), bulk("2")}));
    EXPECT_EQ(dispatcher_.call("hincrbyfloat", {"h", "a", "0.5"}), number(1.5));
}

TEST_F(DispatcherTest, LremTakesCountBeforeElement) {
    dispatcher_.call("rpush", {"l", "x", "a", "x"});
    EXPECT_EQ(dispatcher_.call("lrem", {"l", "1", "x"}), integer(1));
    EXPECT_EQ(dispatcher_.call("lrange", {"l", "0", "-1"}), array({bulk("a"), bulk("x")}));
}

TEST_F(DispatcherTest, BlpopReplies) {
    dispatcher_.call("rpush", {"q", "job"});
    EXPECT_EQ(dispatcher_.call("blpop", {"other", "q", "1"}), array({bulk("q"), bulk("job")}));
    EXPECT_EQ(dispatcher_.call("blpop", {"q", "1"}), nil());
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.call("blpop", {"q", "soon"}));
}

// ── Sorted sets ───────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, LegacyZaddTakesScoreThenMember) {
    EXPECT_EQ(dispatcher_.convention(), Convention::Legacy);
    EXPECT_EQ(dispatcher_.call("zadd", {"z", "1", "a", "2", "b"}), integer(2));
    EXPECT_EQ(dispatcher_.call("zscore", {"z", "a"}), number(1.0));
    EXPECT_EQ(dispatcher_.call("zscore", {"z", "nope"}), nil());
}

TEST_F(DispatcherTest, LegacyZaddKeepsNumericMembersApartFromScores) {
    EXPECT_EQ(dispatcher_.call("zadd", {"z", "5", "10"}), integer(1));
    EXPECT_EQ(engine_.zscore("z", "10"), 5.0);
    EXPECT_EQ(engine_.zscore("z", "5"), std::nullopt);
}

TEST_F(DispatcherTest, LegacyZaddRejectsMemberFirstPairs) {
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.call("zadd", {"z", "a", "1"}));
    EXPECT_FALSE(engine_.exists("z"));
}

TEST_F(DispatcherTest, StrictZaddTakesScoreThenMember) {
    CommandDispatcher strict{engine_, Convention::Strict};
    EXPECT_EQ(strict.convention(), Convention::Strict);
    EXPECT_EQ(strict.call("zadd", {"z", "1", "a", "2", "b"}), integer(2));
    EXPECT_EQ(engine_.zscore("z", "a"), 1.0);
    EXPECT_EQ(engine_.zscore("z", "b"), 2.0);
}

TEST_F(DispatcherTest, WithscoresRepliesAreFlat) {
    dispatcher_.call("zadd", {"z", "1", "a", "2", "b", "3", "c"});
    EXPECT_EQ(dispatcher_.call("zrange", {"z", "0", "-1"}),
              array({bulk("a"), bulk("b"), bulk("c")}));
    EXPECT_EQ(dispatcher_.call("zrange", {"z", "0", "1", "WITHSCORES"}),
              array({bulk("a"), number(1.0), bulk("b"), number(2.0)}));
    EXPECT_EQ(dispatcher_.call("zrevrange", {"z", "0", "0", "withscores"}),
              array({bulk("c"), number(3.0)}));
}

TEST_F(DispatcherTest, RangeByScoreWithLimit) {
    dispatcher_.call("zadd", {"z", "1", "a", "2", "b", "3", "c"});
    EXPECT_EQ(dispatcher_.call("zrangebyscore", {"z", "-inf", "+inf", "LIMIT", "1", "1"}),
              array({bulk("b")}));
    EXPECT_EQ(dispatcher_.call("zrevrangebyscore", {"z", "+inf", "2", "WITHSCORES"}),
              array({bulk("c"), number(3.0), bulk("b"), number(2.0)}));
}

TEST_F(DispatcherTest, LimitCountsNearInt64Max) {
    dispatcher_.call("zadd", {"z", "1", "a", "2", "b"});
    EXPECT_EQ(dispatcher_.call("zrangebyscore",
                               {"z", "-inf", "+inf", "LIMIT", "1", "9223372036854775807"}),
              array({bulk("b")}));

    dispatcher_.call("rpush", {"l", "3", "1", "2"});
    EXPECT_EQ(dispatcher_.call("sort", {"l", "LIMIT", "1", "9223372036854775807"}),
              array({bulk("2"), bulk("3")}));
}

TEST_F(DispatcherTest, ZincrbyTakesIncrementBeforeMember) {
    EXPECT_EQ(dispatcher_.call("zincrby", {"z", "2.5", "m"}), number(2.5));
    EXPECT_EQ(dispatcher_.call("zrank", {"z", "m"}), integer(0));
}

TEST_F(DispatcherTest, ZunionstoreAggregate) {
    dispatcher_.call("zadd", {"A", "1", "x", "5", "y"});
    dispatcher_.call("zadd", {"B", "3", "x", "2", "z"});
    EXPECT_EQ(dispatcher_.call("zunionstore", {"dst", "2", "A", "B", "AGGREGATE", "MIN"}), integer(3));
    EXPECT_EQ(dispatcher_.call("zrange", {"dst", "0", "-1", "WITHSCORES"}),
              array({bulk("x"), number(1.0), bulk("z"), number(2.0), bulk("y"), number(5.0)}));
    EXPECT_KVMOCK_ERROR(ErrorKind::UnsupportedAggregate,
                        dispatcher_.call("zinterstore", {"dst", "2", "A", "B", "AGGREGATE", "avg"}));
    EXPECT_KVMOCK_ERROR(ErrorKind::Unimplemented,
                        dispatcher_.call("zinterstore", {"dst", "2", "A", "B", "WEIGHTS", "1", "2"}));
}

// ── Scan / sort ───────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, ScanReplyCarriesCursor) {
    dispatcher_.call("mset", {"k1", "v", "k2", "v", "k3", "v"});
    EXPECT_EQ(dispatcher_.call("scan", {"0", "COUNT", "2"}),
              array({bulk("2"), array({bulk("k1"), bulk("k2")})}));
    EXPECT_EQ(dispatcher_.call("scan", {"2", "count", "2"}),
              array({bulk("0"), array({bulk("k3")})}));
}

TEST_F(DispatcherTest, ZscanFlattensScores) {
    dispatcher_.call("zadd", {"z", "1", "a", "2", "b"});
    EXPECT_EQ(dispatcher_.call("zscan", {"z", "0", "MATCH", "b*"}),
              array({bulk("0"), array({bulk("b"), number(2.0)})}));
}

TEST_F(DispatcherTest, SortWithStore) {
    dispatcher_.call("rpush", {"ids", "3", "1", "2"});
    EXPECT_EQ(dispatcher_.call("sort", {"ids", "DESC", "LIMIT", "0", "2"}),
              array({bulk("3"), bulk("2")}));
    EXPECT_EQ(dispatcher_.call("sort", {"ids", "STORE", "out"}), integer(3));
    EXPECT_EQ(engine_.lrange("out", 0, -1), (std::vector<std::string>{"1", "2", "3"}));
}

// ── Scripts ───────────────────────────────────────────────────────────────────

TEST_F(DispatcherTest, ScriptLoadUsesSha1) {
    EXPECT_EQ(dispatcher_.call("script", {"LOAD", "abc"}),
              bulk("a9993e364706816aba3e25717850c26c9cd0d89d"));
    EXPECT_EQ(dispatcher_.call("script", {"exists", "a9993e364706816aba3e25717850c26c9cd0d89d", "ffff"}),
              array({integer(1), integer(0)}));
    EXPECT_EQ(dispatcher_.call("script", {"flush"}), ok());
    EXPECT_EQ(dispatcher_.call("script", {"exists", "a9993e364706816aba3e25717850c26c9cd0d89d"}),
              array({integer(0)}));
    EXPECT_KVMOCK_ERROR(ErrorKind::Unimplemented, dispatcher_.call("script", {"kill"}));
}

TEST_F(DispatcherTest, EvalshaOfUnknownScript) {
    EXPECT_KVMOCK_ERROR(ErrorKind::ResponseError, dispatcher_.evalsha("deadbeef", 0, {}));
}

TEST_F(DispatcherTest, EvalWithoutRunnerStillRegisters) {
    EXPECT_KVMOCK_ERROR(ErrorKind::Unimplemented, dispatcher_.eval("echo", 0, {}));
    const std::string sha = engine_.script_load("echo");
    EXPECT_EQ(engine_.script_exists({sha}), (std::vector<bool>{true}));
}

TEST_F(DispatcherTest, EvalRunsThroughDispatcher) {
    auto runner = std::make_shared<FakeRunner>();
    dispatcher_.set_script_runner(runner);

    EXPECT_EQ(dispatcher_.eval("setget", 1, {"k", "v"}), bulk("v"));
    EXPECT_EQ(engine_.get("k"), "v");
    EXPECT_EQ(runner->last_keys, (Args{"k"}));
    EXPECT_EQ(runner->last_args, (Args{"v"}));

    EXPECT_EQ(dispatcher_.call("eval", {"echo", "2", "a", "b", "c"}), array({integer(2), integer(1)}));
}

TEST_F(DispatcherTest, NumkeysBounds) {
    dispatcher_.set_script_runner(std::make_shared<FakeRunner>());
    EXPECT_EQ(dispatcher_.eval("echo", -3, {"a", "b"}), array({integer(0), integer(2)}));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.eval("echo", 3, {"a"}));
}

TEST_F(DispatcherTest, ScriptErrorsPropagate) {
    dispatcher_.set_script_runner(std::make_shared<FakeRunner>());
    engine_.set("word", "abc");
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, dispatcher_.eval("incr", 1, {"word"}));
}

TEST_F(DispatcherTest, RegisteredScriptLoadsOnFirstCall) {
    auto runner = std::make_shared<FakeRunner>();
    dispatcher_.set_script_runner(runner);

    Script script = dispatcher_.register_script("incr");
    EXPECT_EQ(engine_.script_source(script.sha()), nullptr);

    EXPECT_EQ(script({"n"}), integer(1));
    EXPECT_NE(engine_.script_source(script.sha()), nullptr);

    engine_.script_flush();
    EXPECT_EQ(script({"n"}), integer(2));
    EXPECT_EQ(runner->runs, 2);
}

} // namespace kvmock::command
