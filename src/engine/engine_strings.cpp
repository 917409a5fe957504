#include "engine/engine.hpp"

#include <utility>

#include "common/error.hpp"
#include "common/strings.hpp"

namespace kvmock {

// ── Strings ──────────────────────────────────────────────────────────────────

std::optional<std::string> Engine::get(const std::string& key) const {
    const auto* value = keyspace_.get_typed<std::string>(key, "GET");
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

bool Engine::write_string(const std::string& key, std::string value,
                          std::optional<std::chrono::milliseconds> expire_after) {
    keyspace_.put(key, Value{std::move(value)});
    if (expire_after) {
        keyspace_.set_expiry(key, clock_.now() + *expire_after);
    }
    return true;
}

bool Engine::set(const std::string& key, std::string value, const SetOptions& options) {
    if (options.nx && options.xx) {
        return false;
    }
    const bool present = keyspace_.exists(key);
    if ((options.nx && present) || (options.xx && !present)) {
        return false;
    }

    std::optional<std::chrono::milliseconds> expiry;
    if (options.ex) {
        expiry = std::chrono::seconds{*options.ex};
    }
    if (options.px) {
        expiry = std::chrono::milliseconds{*options.px};
    }
    if (expiry && expiry->count() <= 0) {
        throw response_error("invalid expire time in SETEX");
    }
    return write_string(key, std::move(value), expiry);
}

std::optional<std::string> Engine::getset(const std::string& key, std::string value) {
    auto previous = get(key);
    set(key, std::move(value));
    return previous;
}

bool Engine::setex(const std::string& key, int64_t seconds, std::string value) {
    SetOptions options;
    options.ex = seconds;
    return set(key, std::move(value), options);
}

bool Engine::psetex(const std::string& key, int64_t milliseconds, std::string value) {
    SetOptions options;
    options.px = milliseconds;
    return set(key, std::move(value), options);
}

bool Engine::setnx(const std::string& key, std::string value) {
    SetOptions options;
    options.nx = true;
    return set(key, std::move(value), options);
}

bool Engine::mset(const std::vector<HashEntry>& pairs) {
    for (const auto& [key, value] : pairs) {
        set(key, value);
    }
    return true;
}

bool Engine::msetnx(const std::vector<HashEntry>& pairs) {
    for (const auto& [key, value] : pairs) {
        if (keyspace_.exists(key)) {
            return false;
        }
    }
    return mset(pairs);
}

std::vector<std::optional<std::string>> Engine::mget(const std::vector<std::string>& keys) const {
    std::vector<std::optional<std::string>> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.push_back(lookup_string(key));
    }
    return result;
}

int64_t Engine::incr(const std::string& key, int64_t amount) {
    const auto* current = keyspace_.get_typed<std::string>(key, "INCR");
    const int64_t before = current ? parse_int64(*current, "value") : 0;
    const int64_t after  = add_or_throw(before, amount);
    keyspace_.replace_string(key, std::to_string(after));
    return after;
}

} // namespace kvmock
