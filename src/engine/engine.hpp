#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <spdlog/spdlog.h>

#include "blocking/blocking_pop.hpp"
#include "common/clock.hpp"
#include "common/engine_config.hpp"
#include "scan/cursor_pager.hpp"
#include "store/keyspace.hpp"
#include "store/value.hpp"
#include "zset/sorted_set.hpp"

namespace kvmock {

using zset::ScoredMember;
using blocking::PopResult;

// TTL reply for a key that does not exist.
inline constexpr int64_t kTtlKeyMissing = -2;

// ── Aggregate ────────────────────────────────────────────────────────────────

enum class Aggregate : uint8_t {
    Sum = 0,
    Min = 1,
    Max = 2,
};

// "sum" / "min" / "max", case-insensitive; empty selects Sum.
// Anything else throws UnsupportedAggregate.
[[nodiscard]] Aggregate parse_aggregate(std::string_view name);

// ── Option bundles ───────────────────────────────────────────────────────────

struct SetOptions {
    std::optional<int64_t> ex; // expiry in seconds
    std::optional<int64_t> px; // expiry in milliseconds (wins over ex)
    bool nx = false;           // only set if the key is absent
    bool xx = false;           // only set if the key is present
};

struct SortOptions {
    std::optional<int64_t>     start;  // both or neither of start/num
    std::optional<int64_t>     num;
    std::optional<std::string> by;     // weight key pattern with '*', or "nosort"
    std::vector<std::string>   get;    // lookup patterns; "#" is the element
    bool desc  = false;
    bool alpha = false;
};

using HashEntry = std::pair<std::string, std::string>;

// ── Engine ───────────────────────────────────────────────────────────────────
//
// In-process emulation of a key-value store's command surface: typed values
// under one namespace, manual expiry, sorted sets, cursor scans and polling
// blocking pops.  All commands execute immediately; expiry happens only when
// do_expire() is called.
//
// NOT thread-safe; callers that share an engine across threads must wrap
// every call in one external lock.

class Engine {
public:
    // Uses the system clock and real sleeps.
    explicit Engine(EngineConfig config = {},
                    std::shared_ptr<spdlog::logger> logger = {});

    // Uses caller-supplied time sources (tests: MockClock + MockSleeper).
    // Both must outlive the engine.
    Engine(EngineConfig config,
           const Clock& clock,
           blocking::Sleeper& sleeper,
           std::shared_ptr<spdlog::logger> logger = {});

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Connection ───────────────────────────────────────────────────────────

    [[nodiscard]] std::string echo(std::string message) const { return message; }
    [[nodiscard]] std::string ping() const { return "PONG"; }

    // ── Transactions (commands are never buffered: all no-ops) ──────────────

    void watch(const std::vector<std::string>& /*keys*/ = {}) {}
    void unwatch() {}
    void multi() {}
    void execute() {}

    // ── Keys ─────────────────────────────────────────────────────────────────

    // "none", "string", "list", "set", "hash" or "zset".
    [[nodiscard]] std::string_view type(const std::string& key) const;
    [[nodiscard]] std::vector<std::string> keys(std::string_view pattern = "*") const;
    std::size_t del(const std::vector<std::string>& keys);
    [[nodiscard]] bool exists(const std::string& key) const;
    [[nodiscard]] std::size_t dbsize() const noexcept { return keyspace_.size(); }

    bool expire(const std::string& key, int64_t seconds);
    bool pexpire(const std::string& key, int64_t milliseconds);
    bool expireat(const std::string& key, int64_t unix_seconds);

    // kTtlKeyMissing if absent, std::nullopt if no expiry is set, otherwise
    // the remaining time clamped below at -1.
    [[nodiscard]] std::optional<int64_t> ttl(const std::string& key) const;
    [[nodiscard]] std::optional<int64_t> pttl(const std::string& key) const;

    // Evict every key whose expiry has passed.  Returns the number evicted.
    std::size_t do_expire();

    // Drop every key, expiry and pub/sub log.
    void flushdb();

    // ── Strings ──────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
    bool set(const std::string& key, std::string value, const SetOptions& options = {});
    std::optional<std::string> getset(const std::string& key, std::string value);
    bool setex(const std::string& key, int64_t seconds, std::string value);
    bool psetex(const std::string& key, int64_t milliseconds, std::string value);
    bool setnx(const std::string& key, std::string value);
    bool mset(const std::vector<HashEntry>& pairs);
    bool msetnx(const std::vector<HashEntry>& pairs);
    [[nodiscard]] std::vector<std::optional<std::string>> mget(const std::vector<std::string>& keys) const;
    int64_t incr(const std::string& key, int64_t amount = 1);
    int64_t incrby(const std::string& key, int64_t amount = 1) { return incr(key, amount); }
    int64_t decr(const std::string& key, int64_t amount = 1) { return incr(key, -amount); }
    int64_t decrby(const std::string& key, int64_t amount = 1) { return decr(key, amount); }

    // ── Hashes ───────────────────────────────────────────────────────────────

    [[nodiscard]] bool hexists(const std::string& key, const std::string& field) const;
    [[nodiscard]] std::optional<std::string> hget(const std::string& key, const std::string& field) const;
    [[nodiscard]] Hash hgetall(const std::string& key) const;
    std::size_t hdel(const std::string& key, const std::vector<std::string>& fields);
    [[nodiscard]] std::size_t hlen(const std::string& key) const;
    void hmset(const std::string& key, const std::vector<HashEntry>& entries);
    [[nodiscard]] std::vector<std::optional<std::string>> hmget(const std::string& key,
                                                                const std::vector<std::string>& fields) const;
    bool hset(const std::string& key, const std::string& field, std::string value);
    bool hsetnx(const std::string& key, const std::string& field, std::string value);
    int64_t hincrby(const std::string& key, const std::string& field, int64_t increment = 1);
    double hincrbyfloat(const std::string& key, const std::string& field, double increment = 1.0);
    [[nodiscard]] std::vector<std::string> hkeys(const std::string& key) const;
    [[nodiscard]] std::vector<std::string> hvals(const std::string& key) const;

    // ── Lists ────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<std::string> lrange(const std::string& key, int64_t start, int64_t stop) const;
    [[nodiscard]] std::optional<std::string> lindex(const std::string& key, int64_t index) const;
    [[nodiscard]] std::size_t llen(const std::string& key) const;
    std::optional<std::string> lpop(const std::string& key);
    std::optional<std::string> rpop(const std::string& key);
    std::size_t lpush(const std::string& key, const std::vector<std::string>& values);
    std::size_t rpush(const std::string& key, const std::vector<std::string>& values);
    std::size_t lrem(const std::string& key, const std::string& value, int64_t count = 0);
    void ltrim(const std::string& key, int64_t start, int64_t stop);
    std::optional<std::string> rpoplpush(const std::string& source, const std::string& destination);
    void lset(const std::string& key, int64_t index, std::string value);

    // Blocking pops poll through the BlockingPopDriver; timeout is in seconds,
    // 0 selects the configured default.
    std::optional<PopResult> blpop(const std::vector<std::string>& keys, int64_t timeout = 0);
    std::optional<PopResult> brpop(const std::vector<std::string>& keys, int64_t timeout = 0);
    std::optional<std::string> brpoplpush(const std::string& source, const std::string& destination,
                                          int64_t timeout = 0);

    boost::asio::awaitable<std::optional<PopResult>>
    async_blpop(std::vector<std::string> keys, int64_t timeout = 0);
    boost::asio::awaitable<std::optional<PopResult>>
    async_brpop(std::vector<std::string> keys, int64_t timeout = 0);

    // ── Sort ─────────────────────────────────────────────────────────────────

    // Sorted elements of a list or set, or the GET lookups for each element
    // (flattened, one entry per pattern per element).
    [[nodiscard]] std::vector<std::optional<std::string>> sort(const std::string& key,
                                                               const SortOptions& options = {}) const;
    // Same, stored as a list under `destination`.  Returns its length.
    std::size_t sort_store(const std::string& key, const SortOptions& options,
                           const std::string& destination);

    // ── Scan ─────────────────────────────────────────────────────────────────

    [[nodiscard]] scan::Page<std::string> scan(std::string_view cursor = "0",
                                               const std::optional<std::string>& match = {},
                                               int64_t count = scan::kDefaultPageSize) const;
    [[nodiscard]] scan::Page<std::string> sscan(const std::string& key,
                                                std::string_view cursor = "0",
                                                const std::optional<std::string>& match = {},
                                                int64_t count = scan::kDefaultPageSize) const;
    [[nodiscard]] scan::Page<HashEntry> hscan(const std::string& key,
                                              std::string_view cursor = "0",
                                              const std::optional<std::string>& match = {},
                                              int64_t count = scan::kDefaultPageSize) const;
    [[nodiscard]] scan::Page<ScoredMember> zscan(const std::string& key,
                                                 std::string_view cursor = "0",
                                                 const std::optional<std::string>& match = {},
                                                 int64_t count = scan::kDefaultPageSize) const;

    // ── Sets ─────────────────────────────────────────────────────────────────

    std::size_t sadd(const std::string& key, const std::vector<std::string>& members);
    [[nodiscard]] std::size_t scard(const std::string& key) const;
    [[nodiscard]] Set sdiff(const std::vector<std::string>& keys) const;
    std::size_t sdiffstore(const std::string& destination, const std::vector<std::string>& keys);
    [[nodiscard]] Set sinter(const std::vector<std::string>& keys) const;
    std::size_t sinterstore(const std::string& destination, const std::vector<std::string>& keys);
    [[nodiscard]] Set sunion(const std::vector<std::string>& keys) const;
    std::size_t sunionstore(const std::string& destination, const std::vector<std::string>& keys);
    [[nodiscard]] bool sismember(const std::string& key, const std::string& member) const;
    [[nodiscard]] Set smembers(const std::string& key) const;
    bool smove(const std::string& source, const std::string& destination, const std::string& member);
    std::optional<std::string> spop(const std::string& key);
    std::optional<std::string> srandmember(const std::string& key);
    // number > 0: up to `number` distinct members; number < 0: |number|
    // members, repeats allowed.
    std::vector<std::string> srandmember(const std::string& key, int64_t number);
    std::size_t srem(const std::string& key, const std::vector<std::string>& members);

    // ── Sorted sets ──────────────────────────────────────────────────────────

    // Returns the number of members newly added.
    std::size_t zadd(const std::string& key, const std::vector<ScoredMember>& members);
    // Flat pairs in the configured convention: (member, score) for Legacy,
    // (score, member) for Strict.  Odd lengths throw InvalidArgument.
    std::size_t zadd_args(const std::string& key, const std::vector<std::string>& args);
    [[nodiscard]] std::size_t zcard(const std::string& key) const;
    [[nodiscard]] std::size_t zcount(const std::string& key, double min, double max) const;
    double zincrby(const std::string& key, const std::string& member, double amount = 1.0);
    std::size_t zinterstore(const std::string& destination, const std::vector<std::string>& keys,
                            std::string_view aggregate = {});
    std::size_t zunionstore(const std::string& destination, const std::vector<std::string>& keys,
                            std::string_view aggregate = {});
    [[nodiscard]] std::vector<ScoredMember> zrange(const std::string& key, int64_t start, int64_t end,
                                                   bool desc = false) const;
    [[nodiscard]] std::vector<ScoredMember> zrevrange(const std::string& key, int64_t start,
                                                      int64_t end) const;
    [[nodiscard]] std::vector<ScoredMember> zrangebyscore(const std::string& key, double min, double max,
                                                          std::optional<int64_t> start = {},
                                                          std::optional<int64_t> num = {}) const;
    [[nodiscard]] std::vector<ScoredMember> zrevrangebyscore(const std::string& key, double max, double min,
                                                             std::optional<int64_t> start = {},
                                                             std::optional<int64_t> num = {}) const;
    [[nodiscard]] std::optional<std::size_t> zrank(const std::string& key, const std::string& member) const;
    [[nodiscard]] std::optional<std::size_t> zrevrank(const std::string& key, const std::string& member) const;
    std::size_t zrem(const std::string& key, const std::vector<std::string>& members);
    std::size_t zremrangebyrank(const std::string& key, int64_t start, int64_t end);
    std::size_t zremrangebyscore(const std::string& key, double min, double max);
    [[nodiscard]] std::optional<double> zscore(const std::string& key, const std::string& member) const;

    // ── Scripts (registry only; execution goes through the dispatcher) ──────

    // Register `script` and return its SHA-1 hex digest.
    std::string script_load(const std::string& script);
    [[nodiscard]] std::vector<bool> script_exists(const std::vector<std::string>& shas) const;
    void script_flush();
    [[noreturn]] void script_kill();
    // Source registered under `sha`, or nullptr.
    [[nodiscard]] const std::string* script_source(const std::string& sha) const;

    // ── Pub/Sub ──────────────────────────────────────────────────────────────

    // Append to the channel log.  Returns the receiver count (always 0).
    std::size_t publish(const std::string& channel, std::string message);
    [[nodiscard]] const std::vector<std::string>& published(const std::string& channel) const;

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }
    [[nodiscard]] const KeySpace& keyspace() const noexcept { return keyspace_; }
    [[nodiscard]] const blocking::BlockingPopDriver& blocking_driver() const noexcept { return blocking_; }
    [[nodiscard]] blocking::Sleeper& sleeper() noexcept { return sleeper_; }

private:
    bool write_string(const std::string& key, std::string value,
                      std::optional<std::chrono::milliseconds> expire_after);
    bool expire_after(const std::string& key, Clock::duration delta);
    [[nodiscard]] std::vector<std::string> sort_items(const std::string& key) const;
    [[nodiscard]] std::vector<const Set*> collect_sets(const std::vector<std::string>& keys,
                                                      std::string_view operation) const;
    [[nodiscard]] std::vector<const ZSet*> collect_zsets(const std::vector<std::string>& keys,
                                                        std::string_view operation) const;
    std::size_t store_set(const std::string& destination, Set result);
    std::size_t store_zset(const std::string& destination, ZSet result);
    std::optional<std::string> pop_list(const std::string& key, bool left, std::string_view operation);
    [[nodiscard]] std::optional<std::string> lookup_string(const std::string& key) const;
    [[nodiscard]] static int64_t add_or_throw(int64_t current, int64_t delta);

    EngineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<Clock> owned_clock_;
    std::unique_ptr<blocking::Sleeper> owned_sleeper_;
    const Clock& clock_;
    blocking::Sleeper& sleeper_;
    KeySpace keyspace_;
    blocking::BlockingPopDriver blocking_;
    std::unordered_map<std::string, std::vector<std::string>> pubsub_;
    std::map<std::string, std::string> scripts_;
    std::mt19937_64 rng_;
};

} // namespace kvmock
