#include "engine/engine.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"

namespace kvmock {

namespace {

const Set kEmptySet;

const Set& or_empty(const Set* set) {
    return set ? *set : kEmptySet;
}

} // namespace

// ── Sets ─────────────────────────────────────────────────────────────────────

std::vector<const Set*> Engine::collect_sets(const std::vector<std::string>& keys,
                                             std::string_view operation) const {
    if (keys.empty()) {
        throw invalid_argument(fmt::format("{} takes at least one key", operation));
    }
    std::vector<const Set*> sets;
    sets.reserve(keys.size());
    for (const auto& key : keys) {
        sets.push_back(keyspace_.get_typed<Set>(key, operation));
    }
    return sets;
}

std::size_t Engine::store_set(const std::string& destination, Set result) {
    const std::size_t size = result.size();
    keyspace_.put(destination, Value{std::move(result)});
    return size;
}

std::size_t Engine::sadd(const std::string& key, const std::vector<std::string>& members) {
    if (members.empty()) {
        throw invalid_argument("SADD requires at least one member");
    }
    auto* set = keyspace_.get_typed<Set>(key, "SADD", true);
    std::size_t added = 0;
    for (const auto& member : members) {
        if (set->insert(member).second) {
            ++added;
        }
    }
    return added;
}

std::size_t Engine::scard(const std::string& key) const {
    const auto* set = keyspace_.get_typed<Set>(key, "SCARD");
    return set ? set->size() : 0;
}

Set Engine::sdiff(const std::vector<std::string>& keys) const {
    const auto sets = collect_sets(keys, "SDIFF");
    Set result = or_empty(sets.front());
    for (auto it = std::next(sets.begin()); it != sets.end() && !result.empty(); ++it) {
        for (const auto& member : or_empty(*it)) {
            result.erase(member);
        }
    }
    return result;
}

Set Engine::sinter(const std::vector<std::string>& keys) const {
    const auto sets = collect_sets(keys, "SINTER");
    Set result = or_empty(sets.front());
    for (auto it = std::next(sets.begin()); it != sets.end() && !result.empty(); ++it) {
        Set next;
        std::set_intersection(result.begin(), result.end(),
                              or_empty(*it).begin(), or_empty(*it).end(),
                              std::inserter(next, next.end()));
        result = std::move(next);
    }
    return result;
}

Set Engine::sunion(const std::vector<std::string>& keys) const {
    const auto sets = collect_sets(keys, "SUNION");
    Set result;
    for (const Set* set : sets) {
        if (set) {
            result.insert(set->begin(), set->end());
        }
    }
    return result;
}

std::size_t Engine::sdiffstore(const std::string& destination, const std::vector<std::string>& keys) {
    return store_set(destination, sdiff(keys));
}

std::size_t Engine::sinterstore(const std::string& destination, const std::vector<std::string>& keys) {
    return store_set(destination, sinter(keys));
}

std::size_t Engine::sunionstore(const std::string& destination, const std::vector<std::string>& keys) {
    return store_set(destination, sunion(keys));
}

bool Engine::sismember(const std::string& key, const std::string& member) const {
    const auto* set = keyspace_.get_typed<Set>(key, "SISMEMBER");
    return set && set->count(member) > 0;
}

Set Engine::smembers(const std::string& key) const {
    return or_empty(keyspace_.get_typed<Set>(key, "SMEMBERS"));
}

bool Engine::smove(const std::string& source, const std::string& destination,
                   const std::string& member) {
    auto* src = keyspace_.get_typed<Set>(source, "SMOVE");
    static_cast<void>(keyspace_.get_typed<Set>(destination, "SMOVE"));

    if (!src || src->erase(member) == 0) {
        return false;
    }
    keyspace_.get_typed<Set>(destination, "SMOVE", true)->insert(member);
    keyspace_.drop_if_empty(source);
    return true;
}

std::optional<std::string> Engine::spop(const std::string& key) {
    auto* set = keyspace_.get_typed<Set>(key, "SPOP");
    if (!set || set->empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, set->size() - 1);
    auto it = std::next(set->begin(), static_cast<std::ptrdiff_t>(pick(rng_)));
    std::string member = *it;
    set->erase(it);
    keyspace_.drop_if_empty(key);
    return member;
}

std::optional<std::string> Engine::srandmember(const std::string& key) {
    const auto* set = keyspace_.get_typed<Set>(key, "SRANDMEMBER");
    if (!set || set->empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, set->size() - 1);
    return *std::next(set->begin(), static_cast<std::ptrdiff_t>(pick(rng_)));
}

std::vector<std::string> Engine::srandmember(const std::string& key, int64_t number) {
    const auto* set = keyspace_.get_typed<Set>(key, "SRANDMEMBER");
    std::vector<std::string> result;
    if (!set || set->empty() || number == 0) {
        return result;
    }

    if (number > 0) {
        const auto wanted = std::min<std::size_t>(static_cast<std::size_t>(number), set->size());
        result.reserve(wanted);
        std::sample(set->begin(), set->end(), std::back_inserter(result), wanted, rng_);
        std::shuffle(result.begin(), result.end(), rng_);
        return result;
    }

    // Negative count: |number| independent draws, repeats allowed.
    std::vector<const std::string*> members;
    members.reserve(set->size());
    for (const auto& member : *set) {
        members.push_back(&member);
    }
    std::uniform_int_distribution<std::size_t> pick(0, members.size() - 1);
    const auto draws = static_cast<std::size_t>(-number);
    result.reserve(draws);
    for (std::size_t i = 0; i < draws; ++i) {
        result.push_back(*members[pick(rng_)]);
    }
    return result;
}

std::size_t Engine::srem(const std::string& key, const std::vector<std::string>& members) {
    auto* set = keyspace_.get_typed<Set>(key, "SREM");
    if (!set) {
        return 0;
    }
    std::size_t removed = 0;
    for (const auto& member : members) {
        removed += set->erase(member);
    }
    keyspace_.drop_if_empty(key);
    return removed;
}

} // namespace kvmock
