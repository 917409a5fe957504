#include "command/dispatcher.hpp"

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"
#include "common/strings.hpp"

namespace kvmock::command {

namespace {

using N = NormalizedArgs;

// ── Argument helpers ─────────────────────────────────────────────────────────

const std::string& arg(const N& n, std::size_t i) {
    return n.positional.at(i);
}

int64_t int_arg(const N& n, std::size_t i, std::string_view what) {
    return parse_int64(arg(n, i), what);
}

double float_arg(const N& n, std::size_t i, std::string_view what) {
    return parse_double(arg(n, i), what);
}

Args tail(const N& n, std::size_t from) {
    if (from >= n.positional.size()) {
        return {};
    }
    return Args(n.positional.begin() + static_cast<std::ptrdiff_t>(from), n.positional.end());
}

std::vector<HashEntry> pairs_from(const N& n, std::size_t from, std::string_view command) {
    const Args flat = tail(n, from);
    if (flat.empty() || flat.size() % 2 != 0) {
        throw invalid_argument(fmt::format("wrong number of arguments for '{}' command", command));
    }
    std::vector<HashEntry> pairs;
    pairs.reserve(flat.size() / 2);
    for (std::size_t i = 0; i < flat.size(); i += 2) {
        pairs.emplace_back(flat[i], flat[i + 1]);
    }
    return pairs;
}

std::optional<std::string> option_value(const N& n, std::string_view name) {
    const Keyword* keyword = n.find(name);
    if (!keyword || keyword->values.empty()) {
        return std::nullopt;
    }
    return keyword->values.front();
}

// ── Reply helpers ────────────────────────────────────────────────────────────

Reply size_reply(std::size_t n) {
    return integer(static_cast<int64_t>(n));
}

Reply set_reply(const Set& set) {
    return bulk_array(std::vector<std::string>(set.begin(), set.end()));
}

Reply scored_reply(const std::vector<ScoredMember>& entries, bool withscores) {
    std::vector<Reply> items;
    items.reserve(entries.size());
    for (const auto& entry : entries) {
        if (withscores) {
            items.push_back(array({bulk(entry.member), number(entry.score)}));
        } else {
            items.push_back(bulk(entry.member));
        }
    }
    return array(std::move(items));
}

Reply optional_integer(const std::optional<int64_t>& value) {
    return value ? integer(*value) : nil();
}

Reply rank_reply(const std::optional<std::size_t>& rank) {
    return rank ? size_reply(*rank) : nil();
}

Reply pop_reply(const std::optional<PopResult>& popped) {
    if (!popped) {
        return nil();
    }
    return array({bulk(popped->key), bulk(popped->value)});
}

Reply page_reply(const std::string& cursor, std::vector<Reply> items) {
    return array({bulk(cursor), array(std::move(items))});
}

// Blocking pops: key [key ...] timeout
std::pair<Args, int64_t> keys_and_timeout(const N& n) {
    Args keys = n.positional;
    const int64_t timeout = parse_int64(keys.back(), "timeout");
    keys.pop_back();
    return {std::move(keys), timeout};
}

} // namespace

// ── Connection / transactions ────────────────────────────────────────────────

void CommandDispatcher::register_connection_commands() {
    add("echo", exactly(1), [](Engine& e, const N& n) { return bulk(e.echo(arg(n, 0))); });
    add("ping", exactly(0), [](Engine& e, const N&) { return status(e.ping()); });

    add("watch", at_least(1), [](Engine& e, const N& n) { e.watch(n.positional); return ok(); });
    add("unwatch", exactly(0), [](Engine& e, const N&) { e.unwatch(); return ok(); });
    add("multi", exactly(0), [](Engine& e, const N&) { e.multi(); return ok(); });
    add("exec", exactly(0), [](Engine& e, const N&) { e.execute(); return ok(); });
    add("execute", exactly(0), [](Engine& e, const N&) { e.execute(); return ok(); });

    add("publish", exactly(2), [](Engine& e, const N& n) {
        return size_reply(e.publish(arg(n, 0), arg(n, 1)));
    });
}

// ── Keys ─────────────────────────────────────────────────────────────────────

void CommandDispatcher::register_key_commands() {
    add("type", exactly(1), [](Engine& e, const N& n) {
        return status(std::string{e.type(arg(n, 0))});
    });
    add("keys", between(0, 1), [](Engine& e, const N& n) {
        return bulk_array(e.keys(n.positional.empty() ? "*" : arg(n, 0)));
    });
    add("del", at_least(1), [](Engine& e, const N& n) { return size_reply(e.del(n.positional)); });
    add("exists", at_least(1), [](Engine& e, const N& n) {
        std::size_t found = 0;
        for (const auto& key : n.positional) {
            found += e.exists(key) ? 1 : 0;
        }
        return size_reply(found);
    });
    add("expire", exactly(2), [](Engine& e, const N& n) {
        return boolean(e.expire(arg(n, 0), int_arg(n, 1, "seconds")));
    });
    add("pexpire", exactly(2), [](Engine& e, const N& n) {
        return boolean(e.pexpire(arg(n, 0), int_arg(n, 1, "milliseconds")));
    });
    add("expireat", exactly(2), [](Engine& e, const N& n) {
        return boolean(e.expireat(arg(n, 0), int_arg(n, 1, "timestamp")));
    });
    add("ttl", exactly(1), [](Engine& e, const N& n) { return optional_integer(e.ttl(arg(n, 0))); });
    add("pttl", exactly(1), [](Engine& e, const N& n) { return optional_integer(e.pttl(arg(n, 0))); });
    add("flushdb", exactly(0), [](Engine& e, const N&) { e.flushdb(); return ok(); });
    add("dbsize", exactly(0), [](Engine& e, const N&) { return size_reply(e.dbsize()); });

    add("sort", at_least(1), normalize_sort, [](Engine& e, const N& n) {
        SortOptions options;
        options.by = option_value(n, "by");
        if (const Keyword* limit = n.find("limit")) {
            options.start = parse_int64(limit->values.at(0), "offset");
            options.num   = parse_int64(limit->values.at(1), "count");
        }
        for (const Keyword* get : n.all("get")) {
            options.get.push_back(get->values.front());
        }
        options.desc  = n.has("desc") && !n.has("asc");
        options.alpha = n.has("alpha");

        if (const auto destination = option_value(n, "store")) {
            return size_reply(e.sort_store(arg(n, 0), options, *destination));
        }
        return bulk_array(e.sort(arg(n, 0), options));
    });
}

// ── Strings ──────────────────────────────────────────────────────────────────

void CommandDispatcher::register_string_commands() {
    add("get", exactly(1), [](Engine& e, const N& n) { return bulk_or_nil(e.get(arg(n, 0))); });

    add("set", at_least(2), normalize_set, [](Engine& e, const N& n) {
        SetOptions options;
        if (const auto ex = option_value(n, "ex")) {
            options.ex = parse_int64(*ex, "expire time");
        }
        if (const auto px = option_value(n, "px")) {
            options.px = parse_int64(*px, "expire time");
        }
        options.nx = n.has("nx");
        options.xx = n.has("xx");
        return e.set(arg(n, 0), arg(n, 1), options) ? ok() : nil();
    });

    add("getset", exactly(2), [](Engine& e, const N& n) {
        return bulk_or_nil(e.getset(arg(n, 0), arg(n, 1)));
    });
    add("setex", exactly(3), [](Engine& e, const N& n) {
        e.setex(arg(n, 0), int_arg(n, 1, "seconds"), arg(n, 2));
        return ok();
    });
    add("psetex", exactly(3), [](Engine& e, const N& n) {
        e.psetex(arg(n, 0), int_arg(n, 1, "milliseconds"), arg(n, 2));
        return ok();
    });
    add("setnx", exactly(2), [](Engine& e, const N& n) {
        return boolean(e.setnx(arg(n, 0), arg(n, 1)));
    });
    add("mset", at_least(2), [](Engine& e, const N& n) {
        e.mset(pairs_from(n, 0, "mset"));
        return ok();
    });
    add("msetnx", at_least(2), [](Engine& e, const N& n) {
        return boolean(e.msetnx(pairs_from(n, 0, "msetnx")));
    });
    add("mget", at_least(1), [](Engine& e, const N& n) { return bulk_array(e.mget(n.positional)); });

    add("incr", exactly(1), [](Engine& e, const N& n) { return integer(e.incr(arg(n, 0))); });
    add("incrby", exactly(2), [](Engine& e, const N& n) {
        return integer(e.incrby(arg(n, 0), int_arg(n, 1, "increment")));
    });
    add("decr", exactly(1), [](Engine& e, const N& n) { return integer(e.decr(arg(n, 0))); });
    add("decrby", exactly(2), [](Engine& e, const N& n) {
        return integer(e.decrby(arg(n, 0), int_arg(n, 1, "decrement")));
    });
}

// ── Hashes ───────────────────────────────────────────────────────────────────

void CommandDispatcher::register_hash_commands() {
    add("hexists", exactly(2), [](Engine& e, const N& n) {
        return boolean(e.hexists(arg(n, 0), arg(n, 1)));
    });
    add("hget", exactly(2), [](Engine& e, const N& n) {
        return bulk_or_nil(e.hget(arg(n, 0), arg(n, 1)));
    });
    add("hgetall", exactly(1), [](Engine& e, const N& n) {
        std::vector<Reply> flat;
        for (const auto& [field, value] : e.hgetall(arg(n, 0))) {
            flat.push_back(bulk(field));
            flat.push_back(bulk(value));
        }
        return array(std::move(flat));
    });
    add("hdel", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.hdel(arg(n, 0), tail(n, 1)));
    });
    add("hlen", exactly(1), [](Engine& e, const N& n) { return size_reply(e.hlen(arg(n, 0))); });
    add("hmset", at_least(3), [](Engine& e, const N& n) {
        e.hmset(arg(n, 0), pairs_from(n, 1, "hmset"));
        return ok();
    });
    add("hmget", at_least(2), [](Engine& e, const N& n) {
        return bulk_array(e.hmget(arg(n, 0), tail(n, 1)));
    });
    add("hset", at_least(3), [](Engine& e, const N& n) {
        std::size_t added = 0;
        for (const auto& [field, value] : pairs_from(n, 1, "hset")) {
            added += e.hset(arg(n, 0), field, value) ? 1 : 0;
        }
        return size_reply(added);
    });
    add("hsetnx", exactly(3), [](Engine& e, const N& n) {
        return boolean(e.hsetnx(arg(n, 0), arg(n, 1), arg(n, 2)));
    });
    add("hincrby", exactly(3), [](Engine& e, const N& n) {
        return integer(e.hincrby(arg(n, 0), arg(n, 1), int_arg(n, 2, "increment")));
    });
    add("hincrbyfloat", exactly(3), [](Engine& e, const N& n) {
        return number(e.hincrbyfloat(arg(n, 0), arg(n, 1), float_arg(n, 2, "increment")));
    });
    add("hkeys", exactly(1), [](Engine& e, const N& n) { return bulk_array(e.hkeys(arg(n, 0))); });
    add("hvals", exactly(1), [](Engine& e, const N& n) { return bulk_array(e.hvals(arg(n, 0))); });
}

// ── Lists ────────────────────────────────────────────────────────────────────

void CommandDispatcher::register_list_commands() {
    add("lrange", exactly(3), [](Engine& e, const N& n) {
        return bulk_array(e.lrange(arg(n, 0), int_arg(n, 1, "start"), int_arg(n, 2, "stop")));
    });
    add("lindex", exactly(2), [](Engine& e, const N& n) {
        return bulk_or_nil(e.lindex(arg(n, 0), int_arg(n, 1, "index")));
    });
    add("llen", exactly(1), [](Engine& e, const N& n) { return size_reply(e.llen(arg(n, 0))); });
    add("lpop", exactly(1), [](Engine& e, const N& n) { return bulk_or_nil(e.lpop(arg(n, 0))); });
    add("rpop", exactly(1), [](Engine& e, const N& n) { return bulk_or_nil(e.rpop(arg(n, 0))); });
    add("lpush", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.lpush(arg(n, 0), tail(n, 1)));
    });
    add("rpush", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.rpush(arg(n, 0), tail(n, 1)));
    });
    // LREM key count element
    add("lrem", exactly(3), [](Engine& e, const N& n) {
        return size_reply(e.lrem(arg(n, 0), arg(n, 2), int_arg(n, 1, "count")));
    });
    add("ltrim", exactly(3), [](Engine& e, const N& n) {
        e.ltrim(arg(n, 0), int_arg(n, 1, "start"), int_arg(n, 2, "stop"));
        return ok();
    });
    add("rpoplpush", exactly(2), [](Engine& e, const N& n) {
        return bulk_or_nil(e.rpoplpush(arg(n, 0), arg(n, 1)));
    });
    add("lset", exactly(3), [](Engine& e, const N& n) {
        e.lset(arg(n, 0), int_arg(n, 1, "index"), arg(n, 2));
        return ok();
    });

    add("blpop", at_least(2), [](Engine& e, const N& n) {
        auto [keys, timeout] = keys_and_timeout(n);
        return pop_reply(e.blpop(keys, timeout));
    });
    add("brpop", at_least(2), [](Engine& e, const N& n) {
        auto [keys, timeout] = keys_and_timeout(n);
        return pop_reply(e.brpop(keys, timeout));
    });
    add("brpoplpush", exactly(3), [](Engine& e, const N& n) {
        return bulk_or_nil(e.brpoplpush(arg(n, 0), arg(n, 1), int_arg(n, 2, "timeout")));
    });
}

// ── Sets ─────────────────────────────────────────────────────────────────────

void CommandDispatcher::register_set_commands() {
    add("sadd", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.sadd(arg(n, 0), tail(n, 1)));
    });
    add("scard", exactly(1), [](Engine& e, const N& n) { return size_reply(e.scard(arg(n, 0))); });
    add("sdiff", at_least(1), [](Engine& e, const N& n) { return set_reply(e.sdiff(n.positional)); });
    add("sinter", at_least(1), [](Engine& e, const N& n) { return set_reply(e.sinter(n.positional)); });
    add("sunion", at_least(1), [](Engine& e, const N& n) { return set_reply(e.sunion(n.positional)); });
    add("sdiffstore", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.sdiffstore(arg(n, 0), tail(n, 1)));
    });
    add("sinterstore", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.sinterstore(arg(n, 0), tail(n, 1)));
    });
    add("sunionstore", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.sunionstore(arg(n, 0), tail(n, 1)));
    });
    add("sismember", exactly(2), [](Engine& e, const N& n) {
        return boolean(e.sismember(arg(n, 0), arg(n, 1)));
    });
    add("smembers", exactly(1), [](Engine& e, const N& n) { return set_reply(e.smembers(arg(n, 0))); });
    add("smove", exactly(3), [](Engine& e, const N& n) {
        return boolean(e.smove(arg(n, 0), arg(n, 1), arg(n, 2)));
    });
    add("spop", exactly(1), [](Engine& e, const N& n) { return bulk_or_nil(e.spop(arg(n, 0))); });
    add("srandmember", between(1, 2), [](Engine& e, const N& n) {
        if (n.positional.size() == 1) {
            return bulk_or_nil(e.srandmember(arg(n, 0)));
        }
        return bulk_array(e.srandmember(arg(n, 0), int_arg(n, 1, "count")));
    });
    add("srem", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.srem(arg(n, 0), tail(n, 1)));
    });
}

// ── Sorted sets ──────────────────────────────────────────────────────────────

void CommandDispatcher::register_zset_commands() {
    // normalize_zadd has already put every pair in (member, score) order.
    add("zadd", at_least(3), normalize_zadd, [](Engine& e, const N& n) {
        std::vector<ScoredMember> members;
        for (std::size_t i = 1; i + 1 < n.positional.size(); i += 2) {
            members.push_back({arg(n, i), float_arg(n, i + 1, "score")});
        }
        return size_reply(e.zadd(arg(n, 0), members));
    });
    add("zcard", exactly(1), [](Engine& e, const N& n) { return size_reply(e.zcard(arg(n, 0))); });
    add("zcount", exactly(3), [](Engine& e, const N& n) {
        return size_reply(e.zcount(arg(n, 0), float_arg(n, 1, "min"), float_arg(n, 2, "max")));
    });
    // ZINCRBY key increment member
    add("zincrby", exactly(3), [](Engine& e, const N& n) {
        return number(e.zincrby(arg(n, 0), arg(n, 2), float_arg(n, 1, "increment")));
    });
    add("zunionstore", at_least(3), normalize_zstore, [](Engine& e, const N& n) {
        return size_reply(e.zunionstore(arg(n, 0), tail(n, 1),
                                        option_value(n, "aggregate").value_or("")));
    });
    add("zinterstore", at_least(3), normalize_zstore, [](Engine& e, const N& n) {
        return size_reply(e.zinterstore(arg(n, 0), tail(n, 1),
                                        option_value(n, "aggregate").value_or("")));
    });

    add("zrange", between(3, 4), normalize_zrange, [](Engine& e, const N& n) {
        return scored_reply(e.zrange(arg(n, 0), int_arg(n, 1, "start"), int_arg(n, 2, "stop")),
                            n.has("withscores"));
    }, flatten_pairs);
    add("zrevrange", between(3, 4), normalize_zrange, [](Engine& e, const N& n) {
        return scored_reply(e.zrevrange(arg(n, 0), int_arg(n, 1, "start"), int_arg(n, 2, "stop")),
                            n.has("withscores"));
    }, flatten_pairs);

    add("zrangebyscore", at_least(3), normalize_range_by_score, [](Engine& e, const N& n) {
        std::optional<int64_t> start;
        std::optional<int64_t> num;
        if (const Keyword* limit = n.find("limit")) {
            start = parse_int64(limit->values.at(0), "offset");
            num   = parse_int64(limit->values.at(1), "count");
        }
        return scored_reply(e.zrangebyscore(arg(n, 0), float_arg(n, 1, "min"),
                                            float_arg(n, 2, "max"), start, num),
                            n.has("withscores"));
    }, flatten_pairs);
    add("zrevrangebyscore", at_least(3), normalize_range_by_score, [](Engine& e, const N& n) {
        std::optional<int64_t> start;
        std::optional<int64_t> num;
        if (const Keyword* limit = n.find("limit")) {
            start = parse_int64(limit->values.at(0), "offset");
            num   = parse_int64(limit->values.at(1), "count");
        }
        return scored_reply(e.zrevrangebyscore(arg(n, 0), float_arg(n, 1, "max"),
                                               float_arg(n, 2, "min"), start, num),
                            n.has("withscores"));
    }, flatten_pairs);

    add("zrank", exactly(2), [](Engine& e, const N& n) { return rank_reply(e.zrank(arg(n, 0), arg(n, 1))); });
    add("zrevrank", exactly(2), [](Engine& e, const N& n) {
        return rank_reply(e.zrevrank(arg(n, 0), arg(n, 1)));
    });
    add("zrem", at_least(2), [](Engine& e, const N& n) {
        return size_reply(e.zrem(arg(n, 0), tail(n, 1)));
    });
    add("zremrangebyrank", exactly(3), [](Engine& e, const N& n) {
        return size_reply(e.zremrangebyrank(arg(n, 0), int_arg(n, 1, "start"), int_arg(n, 2, "stop")));
    });
    add("zremrangebyscore", exactly(3), [](Engine& e, const N& n) {
        return size_reply(e.zremrangebyscore(arg(n, 0), float_arg(n, 1, "min"), float_arg(n, 2, "max")));
    });
    add("zscore", exactly(2), [](Engine& e, const N& n) {
        const auto score = e.zscore(arg(n, 0), arg(n, 1));
        return score ? number(*score) : nil();
    });
}

// ── Scan ─────────────────────────────────────────────────────────────────────

void CommandDispatcher::register_scan_commands() {
    auto count_of = [](const N& n) {
        const auto count = option_value(n, "count");
        return count ? parse_int64(*count, "count") : scan::kDefaultPageSize;
    };
    auto with_leading = [](std::size_t leading) -> NormalizeFn {
        return [leading](const Args& args, Convention) { return normalize_scan(args, leading); };
    };

    add("scan", at_least(1), with_leading(1), [count_of](Engine& e, const N& n) {
        auto page = e.scan(arg(n, 0), option_value(n, "match"), count_of(n));
        std::vector<Reply> items;
        for (const auto& key : page.items) {
            items.push_back(bulk(key));
        }
        return page_reply(page.cursor, std::move(items));
    });
    add("sscan", at_least(2), with_leading(2), [count_of](Engine& e, const N& n) {
        auto page = e.sscan(arg(n, 0), arg(n, 1), option_value(n, "match"), count_of(n));
        std::vector<Reply> items;
        for (const auto& member : page.items) {
            items.push_back(bulk(member));
        }
        return page_reply(page.cursor, std::move(items));
    });
    add("hscan", at_least(2), with_leading(2), [count_of](Engine& e, const N& n) {
        auto page = e.hscan(arg(n, 0), arg(n, 1), option_value(n, "match"), count_of(n));
        std::vector<Reply> items;
        for (const auto& [field, value] : page.items) {
            items.push_back(bulk(field));
            items.push_back(bulk(value));
        }
        return page_reply(page.cursor, std::move(items));
    });
    add("zscan", at_least(2), with_leading(2), [count_of](Engine& e, const N& n) {
        auto page = e.zscan(arg(n, 0), arg(n, 1), option_value(n, "match"), count_of(n));
        std::vector<Reply> items;
        for (const auto& entry : page.items) {
            items.push_back(bulk(entry.member));
            items.push_back(number(entry.score));
        }
        return page_reply(page.cursor, std::move(items));
    });
}

// ── Scripts ──────────────────────────────────────────────────────────────────

void CommandDispatcher::register_script_commands() {
    add("script", at_least(1), [](Engine& e, const N& n) {
        const std::string sub = to_lower(arg(n, 0));
        if (sub == "load" && n.positional.size() == 2) {
            return bulk(e.script_load(arg(n, 1)));
        }
        if (sub == "exists") {
            std::vector<Reply> flags;
            for (bool found : e.script_exists(tail(n, 1))) {
                flags.push_back(boolean(found));
            }
            return array(std::move(flags));
        }
        if (sub == "flush" && n.positional.size() == 1) {
            e.script_flush();
            return ok();
        }
        if (sub == "kill" && n.positional.size() == 1) {
            e.script_kill();
        }
        throw invalid_argument(fmt::format("unknown SCRIPT subcommand or wrong arguments: '{}'",
                                           arg(n, 0)));
    });

    add("eval", at_least(2), [this](Engine&, const N& n) {
        return eval(arg(n, 0), int_arg(n, 1, "numkeys"), tail(n, 2));
    });
    add("evalsha", at_least(2), [this](Engine&, const N& n) {
        return evalsha(arg(n, 0), int_arg(n, 1, "numkeys"), tail(n, 2));
    });
}

} // namespace kvmock::command
