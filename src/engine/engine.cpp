#include "engine/engine.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"
#include "common/glob.hpp"
#include "common/strings.hpp"

namespace kvmock {

namespace {

std::mt19937_64 make_rng(uint64_t seed) {
    if (seed != 0) {
        return std::mt19937_64{seed};
    }
    std::random_device device;
    return std::mt19937_64{(static_cast<uint64_t>(device()) << 32) | device()};
}

} // namespace

Aggregate parse_aggregate(std::string_view name) {
    if (name.empty() || iequals(name, "sum")) {
        return Aggregate::Sum;
    }
    if (iequals(name, "min")) {
        return Aggregate::Min;
    }
    if (iequals(name, "max")) {
        return Aggregate::Max;
    }
    throw Error(ErrorKind::UnsupportedAggregate,
                fmt::format("Unsupported aggregate: {}", name));
}

// ── Construction ─────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config))
    , logger_(std::move(logger))
    , owned_clock_(std::make_unique<SystemClock>())
    , owned_sleeper_(std::make_unique<blocking::ThreadSleeper>())
    , clock_(*owned_clock_)
    , sleeper_(*owned_sleeper_)
    , keyspace_(clock_, logger_)
    , blocking_(clock_, sleeper_, config_.blocking_timeout, config_.blocking_poll_interval, logger_)
    , rng_(make_rng(config_.random_seed))
{
    if (logger_) {
        logger_->info("[engine] created convention={} blocking_timeout={}s poll={}ms",
                      config_.strict() ? "strict" : "legacy",
                      config_.blocking_timeout.count(),
                      config_.blocking_poll_interval.count());
    }
}

Engine::Engine(EngineConfig config,
               const Clock& clock,
               blocking::Sleeper& sleeper,
               std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config))
    , logger_(std::move(logger))
    , clock_(clock)
    , sleeper_(sleeper)
    , keyspace_(clock_, logger_)
    , blocking_(clock_, sleeper_, config_.blocking_timeout, config_.blocking_poll_interval, logger_)
    , rng_(make_rng(config_.random_seed))
{
}

// ── Keys ─────────────────────────────────────────────────────────────────────

std::string_view Engine::type(const std::string& key) const {
    const auto t = keyspace_.type(key);
    return t ? to_string(*t) : std::string_view{"none"};
}

std::vector<std::string> Engine::keys(std::string_view pattern) const {
    std::vector<std::string> result;
    for (auto& key : keyspace_.keys()) {
        if (glob_match(pattern, key)) {
            result.push_back(std::move(key));
        }
    }
    return result;
}

std::size_t Engine::del(const std::vector<std::string>& keys) {
    std::size_t removed = 0;
    for (const auto& key : keys) {
        if (keyspace_.erase(key)) {
            ++removed;
        }
    }
    return removed;
}

bool Engine::exists(const std::string& key) const {
    return keyspace_.exists(key);
}

bool Engine::expire_after(const std::string& key, Clock::duration delta) {
    return keyspace_.set_expiry(key, clock_.now() + delta);
}

bool Engine::expire(const std::string& key, int64_t seconds) {
    return expire_after(key, std::chrono::seconds{seconds});
}

bool Engine::pexpire(const std::string& key, int64_t milliseconds) {
    return expire_after(key, std::chrono::milliseconds{milliseconds});
}

bool Engine::expireat(const std::string& key, int64_t unix_seconds) {
    return keyspace_.set_expiry(key, Clock::time_point{std::chrono::seconds{unix_seconds}});
}

std::optional<int64_t> Engine::ttl(const std::string& key) const {
    if (!keyspace_.exists(key)) {
        return kTtlKeyMissing;
    }
    const auto left = keyspace_.remaining(key);
    if (!left) {
        return std::nullopt;
    }
    const auto seconds = std::chrono::floor<std::chrono::seconds>(*left).count();
    return std::max<int64_t>(-1, seconds);
}

std::optional<int64_t> Engine::pttl(const std::string& key) const {
    if (!keyspace_.exists(key)) {
        return kTtlKeyMissing;
    }
    const auto left = keyspace_.remaining(key);
    if (!left) {
        return std::nullopt;
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(*left).count();
    return std::max<int64_t>(-1, millis);
}

std::size_t Engine::do_expire() {
    return keyspace_.sweep();
}

void Engine::flushdb() {
    keyspace_.clear();
    pubsub_.clear();
    if (logger_) {
        logger_->info("[engine] flushdb");
    }
}

// ── Pub/Sub ──────────────────────────────────────────────────────────────────

std::size_t Engine::publish(const std::string& channel, std::string message) {
    pubsub_[channel].push_back(std::move(message));
    return 0;
}

const std::vector<std::string>& Engine::published(const std::string& channel) const {
    static const std::vector<std::string> kEmpty;
    auto it = pubsub_.find(channel);
    return it == pubsub_.end() ? kEmpty : it->second;
}

// ── Shared helpers ───────────────────────────────────────────────────────────

std::optional<std::string> Engine::lookup_string(const std::string& key) const {
    const Value* value = keyspace_.find(key);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return *s;
    }
    return std::nullopt;
}

int64_t Engine::add_or_throw(int64_t current, int64_t delta) {
    int64_t result = 0;
    if (__builtin_add_overflow(current, delta, &result)) {
        throw invalid_argument("increment or decrement would overflow");
    }
    return result;
}

} // namespace kvmock
