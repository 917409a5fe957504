#include "engine/engine.hpp"

#include <algorithm>

namespace kvmock {

// ── Scan ─────────────────────────────────────────────────────────────────────
//
// Every call rebuilds a sorted snapshot; the cursor is an offset into it.

scan::Page<std::string> Engine::scan(std::string_view cursor,
                                     const std::optional<std::string>& match,
                                     int64_t count) const {
    return scan::next_page(
        [this] {
            auto keys = keyspace_.keys();
            std::sort(keys.begin(), keys.end());
            return keys;
        },
        cursor, count, match);
}

scan::Page<std::string> Engine::sscan(const std::string& key,
                                      std::string_view cursor,
                                      const std::optional<std::string>& match,
                                      int64_t count) const {
    return scan::next_page(
        [&] {
            const Set members = smembers(key);
            return std::vector<std::string>(members.begin(), members.end());
        },
        cursor, count, match);
}

scan::Page<HashEntry> Engine::hscan(const std::string& key,
                                    std::string_view cursor,
                                    const std::optional<std::string>& match,
                                    int64_t count) const {
    return scan::next_page(
        [&] {
            const Hash hash = hgetall(key);
            return std::vector<HashEntry>(hash.begin(), hash.end());
        },
        cursor, count, match,
        [](const HashEntry& entry) -> const std::string& { return entry.first; });
}

scan::Page<ScoredMember> Engine::zscan(const std::string& key,
                                       std::string_view cursor,
                                       const std::optional<std::string>& match,
                                       int64_t count) const {
    return scan::next_page(
        [&] {
            const auto* zset = keyspace_.get_typed<ZSet>(key, "ZSCAN");
            return zset ? zset->entries() : std::vector<ScoredMember>{};
        },
        cursor, count, match,
        [](const ScoredMember& entry) -> const std::string& { return entry.member; });
}

} // namespace kvmock
