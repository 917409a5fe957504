#include "engine/engine.hpp"

#include <cmath>
#include <utility>

#include "common/error.hpp"
#include "common/strings.hpp"

namespace kvmock {

namespace {

const std::string* find_field(const Hash* hash, const std::string& field) {
    if (!hash) {
        return nullptr;
    }
    auto it = hash->find(field);
    return it == hash->end() ? nullptr : &it->second;
}

} // namespace

// ── Hashes ───────────────────────────────────────────────────────────────────

bool Engine::hexists(const std::string& key, const std::string& field) const {
    const auto* hash = keyspace_.get_typed<Hash>(key, "HEXISTS");
    return hash && hash->count(field) > 0;
}

std::optional<std::string> Engine::hget(const std::string& key, const std::string& field) const {
    const auto* hash = keyspace_.get_typed<Hash>(key, "HGET");
    if (!hash) {
        return std::nullopt;
    }
    auto it = hash->find(field);
    if (it == hash->end()) {
        return std::nullopt;
    }
    return it->second;
}

Hash Engine::hgetall(const std::string& key) const {
    const auto* hash = keyspace_.get_typed<Hash>(key, "HGETALL");
    return hash ? *hash : Hash{};
}

std::size_t Engine::hdel(const std::string& key, const std::vector<std::string>& fields) {
    auto* hash = keyspace_.get_typed<Hash>(key, "HDEL");
    if (!hash) {
        return 0;
    }
    std::size_t removed = 0;
    for (const auto& field : fields) {
        removed += hash->erase(field);
    }
    keyspace_.drop_if_empty(key);
    return removed;
}

std::size_t Engine::hlen(const std::string& key) const {
    const auto* hash = keyspace_.get_typed<Hash>(key, "HLEN");
    return hash ? hash->size() : 0;
}

void Engine::hmset(const std::string& key, const std::vector<HashEntry>& entries) {
    if (entries.empty()) {
        throw invalid_argument("HMSET requires at least one field/value pair");
    }
    auto* hash = keyspace_.get_typed<Hash>(key, "HMSET", true);
    for (const auto& [field, value] : entries) {
        hash->insert_or_assign(field, value);
    }
}

std::vector<std::optional<std::string>>
Engine::hmget(const std::string& key, const std::vector<std::string>& fields) const {
    const auto* hash = keyspace_.get_typed<Hash>(key, "HMGET");
    std::vector<std::optional<std::string>> result;
    result.reserve(fields.size());
    for (const auto& field : fields) {
        if (!hash) {
            result.emplace_back();
            continue;
        }
        auto it = hash->find(field);
        result.push_back(it == hash->end() ? std::nullopt : std::optional<std::string>{it->second});
    }
    return result;
}

bool Engine::hset(const std::string& key, const std::string& field, std::string value) {
    auto* hash = keyspace_.get_typed<Hash>(key, "HSET", true);
    return hash->insert_or_assign(field, std::move(value)).second;
}

bool Engine::hsetnx(const std::string& key, const std::string& field, std::string value) {
    auto* hash = keyspace_.get_typed<Hash>(key, "HSETNX", true);
    return hash->try_emplace(field, std::move(value)).second;
}

int64_t Engine::hincrby(const std::string& key, const std::string& field, int64_t increment) {
    // Parse before creating so a bad field value leaves no empty hash behind.
    const std::string* current = find_field(keyspace_.get_typed<Hash>(key, "HINCRBY"), field);
    const int64_t before = current ? parse_int64(*current, "hash value") : 0;
    const int64_t after  = add_or_throw(before, increment);

    auto* hash = keyspace_.get_typed<Hash>(key, "HINCRBY", true);
    hash->insert_or_assign(field, std::to_string(after));
    return after;
}

double Engine::hincrbyfloat(const std::string& key, const std::string& field, double increment) {
    const std::string* current = find_field(keyspace_.get_typed<Hash>(key, "HINCRBYFLOAT"), field);
    const double before = current ? parse_double(*current, "hash value") : 0.0;
    const double after  = before + increment;
    if (!std::isfinite(after)) {
        throw invalid_argument("increment would produce NaN or Infinity");
    }

    auto* hash = keyspace_.get_typed<Hash>(key, "HINCRBYFLOAT", true);
    hash->insert_or_assign(field, format_double(after));
    return after;
}

std::vector<std::string> Engine::hkeys(const std::string& key) const {
    std::vector<std::string> result;
    if (const auto* hash = keyspace_.get_typed<Hash>(key, "HKEYS")) {
        result.reserve(hash->size());
        for (const auto& [field, _] : *hash) {
            result.push_back(field);
        }
    }
    return result;
}

std::vector<std::string> Engine::hvals(const std::string& key) const {
    std::vector<std::string> result;
    if (const auto* hash = keyspace_.get_typed<Hash>(key, "HVALS")) {
        result.reserve(hash->size());
        for (const auto& [_, value] : *hash) {
            result.push_back(value);
        }
    }
    return result;
}

} // namespace kvmock
