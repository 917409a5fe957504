#include "engine/engine.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include "common/error.hpp"
#include "common/strings.hpp"
#include "store/range.hpp"

namespace kvmock {

namespace {

double combine(Aggregate aggregate, double acc, double score) {
    double result = score;
    switch (aggregate) {
    case Aggregate::Sum: result = acc + score; break;
    case Aggregate::Min: result = std::min(acc, score); break;
    case Aggregate::Max: result = std::max(acc, score); break;
    }
    // inf + -inf
    return std::isnan(result) ? 0.0 : result;
}

void check_score(double score) {
    if (std::isnan(score)) {
        throw invalid_argument("score is not a valid float");
    }
}

std::vector<ScoredMember> apply_limit(std::vector<ScoredMember> entries,
                                      std::optional<int64_t> start,
                                      std::optional<int64_t> num) {
    if (!start) {
        return entries;
    }
    const auto len = static_cast<int64_t>(entries.size());
    const auto window = translate_limit(len, *start, *num);
    // num may be as large as INT64_MAX; compare against the remainder.
    const int64_t end = window.num >= len - window.start ? len : window.start + window.num;
    if (window.num <= 0 || window.start >= end) {
        return {};
    }
    return std::vector<ScoredMember>(std::make_move_iterator(entries.begin() + window.start),
                                     std::make_move_iterator(entries.begin() + end));
}

void check_limit(const std::optional<int64_t>& start, const std::optional<int64_t>& num) {
    if (start.has_value() != num.has_value()) {
        throw invalid_argument("`start` and `num` must both be specified");
    }
}

} // namespace

// ── Sorted sets ──────────────────────────────────────────────────────────────

std::vector<const ZSet*> Engine::collect_zsets(const std::vector<std::string>& keys,
                                               std::string_view operation) const {
    std::vector<const ZSet*> zsets;
    zsets.reserve(keys.size());
    for (const auto& key : keys) {
        zsets.push_back(keyspace_.get_typed<ZSet>(key, operation));
    }
    return zsets;
}

std::size_t Engine::store_zset(const std::string& destination, ZSet result) {
    const std::size_t size = result.size();
    keyspace_.put(destination, Value{std::move(result)});
    return size;
}

std::size_t Engine::zadd(const std::string& key, const std::vector<ScoredMember>& members) {
    if (members.empty()) {
        throw invalid_argument("ZADD requires at least one score/member pair");
    }
    for (const auto& entry : members) {
        check_score(entry.score);
    }
    auto* zset = keyspace_.get_typed<ZSet>(key, "ZADD", true);
    std::size_t added = 0;
    for (const auto& entry : members) {
        if (zset->insert(entry.member, entry.score)) {
            ++added;
        }
    }
    return added;
}

std::size_t Engine::zadd_args(const std::string& key, const std::vector<std::string>& args) {
    if (args.size() % 2 != 0) {
        throw invalid_argument("ZADD requires an equal number of values and scores");
    }
    const std::size_t score_at  = config_.strict() ? 0 : 1;
    const std::size_t member_at = 1 - score_at;

    std::vector<ScoredMember> members;
    members.reserve(args.size() / 2);
    for (std::size_t i = 0; i < args.size(); i += 2) {
        members.push_back({args[i + member_at], parse_double(args[i + score_at], "score")});
    }
    return zadd(key, members);
}

std::size_t Engine::zcard(const std::string& key) const {
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZCARD");
    return zset ? zset->size() : 0;
}

std::size_t Engine::zcount(const std::string& key, double min, double max) const {
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZCOUNT");
    return zset ? zset->scorerange(min, max).size() : 0;
}

double Engine::zincrby(const std::string& key, const std::string& member, double amount) {
    const auto* existing = keyspace_.get_typed<ZSet>(key, "ZINCRBY");
    const double score = (existing ? existing->score(member).value_or(0.0) : 0.0) + amount;
    check_score(score);

    keyspace_.get_typed<ZSet>(key, "ZINCRBY", true)->insert(member, score);
    return score;
}

std::size_t Engine::zunionstore(const std::string& destination,
                                const std::vector<std::string>& keys,
                                std::string_view aggregate) {
    const Aggregate how = parse_aggregate(aggregate);
    const auto zsets = collect_zsets(keys, "ZUNIONSTORE");

    ZSet result;
    for (const ZSet* zset : zsets) {
        if (!zset) {
            continue;
        }
        for (const auto& [member, score] : zset->entries()) {
            const auto prior = result.score(member);
            result.insert(member, prior ? combine(how, *prior, score) : score);
        }
    }
    return store_zset(destination, std::move(result));
}

std::size_t Engine::zinterstore(const std::string& destination,
                                const std::vector<std::string>& keys,
                                std::string_view aggregate) {
    const Aggregate how = parse_aggregate(aggregate);
    const auto zsets = collect_zsets(keys, "ZINTERSTORE");

    ZSet result;
    const bool any_missing = zsets.empty() ||
        std::any_of(zsets.begin(), zsets.end(), [](const ZSet* z) { return z == nullptr; });

    if (!any_missing) {
        for (const auto& [member, score] : zsets.front()->entries()) {
            double acc = score;
            bool everywhere = true;
            for (auto it = std::next(zsets.begin()); it != zsets.end(); ++it) {
                const auto other = (*it)->score(member);
                if (!other) {
                    everywhere = false;
                    break;
                }
                acc = combine(how, acc, *other);
            }
            if (everywhere) {
                result.insert(member, acc);
            }
        }
    }
    return store_zset(destination, std::move(result));
}

std::vector<ScoredMember> Engine::zrange(const std::string& key, int64_t start, int64_t end,
                                         bool desc) const {
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZRANGE");
    if (!zset) {
        return {};
    }
    const auto r = translate_range(static_cast<int64_t>(zset->size()), start, end);
    return zset->range(r.start, r.end, desc);
}

std::vector<ScoredMember> Engine::zrevrange(const std::string& key, int64_t start, int64_t end) const {
    return zrange(key, start, end, true);
}

std::vector<ScoredMember> Engine::zrangebyscore(const std::string& key, double min, double max,
                                                std::optional<int64_t> start,
                                                std::optional<int64_t> num) const {
    check_limit(start, num);
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZRANGEBYSCORE");
    if (!zset) {
        return {};
    }
    return apply_limit(zset->scorerange(min, max), start, num);
}

std::vector<ScoredMember> Engine::zrevrangebyscore(const std::string& key, double max, double min,
                                                   std::optional<int64_t> start,
                                                   std::optional<int64_t> num) const {
    check_limit(start, num);
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZREVRANGEBYSCORE");
    if (!zset) {
        return {};
    }
    auto entries = zset->scorerange(min, max);
    std::reverse(entries.begin(), entries.end());
    return apply_limit(std::move(entries), start, num);
}

std::optional<std::size_t> Engine::zrank(const std::string& key, const std::string& member) const {
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZRANK");
    return zset ? zset->rank(member) : std::nullopt;
}

std::optional<std::size_t> Engine::zrevrank(const std::string& key, const std::string& member) const {
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZREVRANK");
    if (!zset) {
        return std::nullopt;
    }
    const auto rank = zset->rank(member);
    if (!rank) {
        return std::nullopt;
    }
    return zset->size() - *rank - 1;
}

std::size_t Engine::zrem(const std::string& key, const std::vector<std::string>& members) {
    auto* zset = keyspace_.get_typed<ZSet>(key, "ZREM");
    if (!zset) {
        return 0;
    }
    std::size_t removed = 0;
    for (const auto& member : members) {
        if (zset->remove(member)) {
            ++removed;
        }
    }
    keyspace_.drop_if_empty(key);
    return removed;
}

std::size_t Engine::zremrangebyrank(const std::string& key, int64_t start, int64_t end) {
    auto* zset = keyspace_.get_typed<ZSet>(key, "ZREMRANGEBYRANK");
    if (!zset) {
        return 0;
    }
    const auto r = translate_range(static_cast<int64_t>(zset->size()), start, end);
    std::size_t removed = 0;
    for (const auto& entry : zset->range(r.start, r.end)) {
        if (zset->remove(entry.member)) {
            ++removed;
        }
    }
    keyspace_.drop_if_empty(key);
    return removed;
}

std::size_t Engine::zremrangebyscore(const std::string& key, double min, double max) {
    auto* zset = keyspace_.get_typed<ZSet>(key, "ZREMRANGEBYSCORE");
    if (!zset) {
        return 0;
    }
    std::size_t removed = 0;
    for (const auto& entry : zset->scorerange(min, max)) {
        if (zset->remove(entry.member)) {
            ++removed;
        }
    }
    keyspace_.drop_if_empty(key);
    return removed;
}

std::optional<double> Engine::zscore(const std::string& key, const std::string& member) const {
    const auto* zset = keyspace_.get_typed<ZSet>(key, "ZSCORE");
    return zset ? zset->score(member) : std::nullopt;
}

} // namespace kvmock
