#include "engine/engine.hpp"

#include <iterator>
#include <utility>

#include "common/error.hpp"
#include "store/range.hpp"

namespace kvmock {

namespace {

// Resolve a possibly negative list index; std::nullopt when out of range.
std::optional<std::size_t> resolve_index(std::size_t len, int64_t index) {
    const auto n = static_cast<int64_t>(len);
    if (index < 0) {
        index += n;
    }
    if (index < 0 || index >= n) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(index);
}

} // namespace

// ── Lists ────────────────────────────────────────────────────────────────────

std::vector<std::string> Engine::lrange(const std::string& key, int64_t start, int64_t stop) const {
    const auto* list = keyspace_.get_typed<List>(key, "LRANGE");
    if (!list) {
        return {};
    }
    const auto r = translate_range(static_cast<int64_t>(list->size()), start, stop);
    if (r.empty()) {
        return {};
    }
    return std::vector<std::string>(list->begin() + r.start, list->begin() + r.end + 1);
}

std::optional<std::string> Engine::lindex(const std::string& key, int64_t index) const {
    const auto* list = keyspace_.get_typed<List>(key, "LINDEX");
    if (!list) {
        return std::nullopt;
    }
    const auto pos = resolve_index(list->size(), index);
    if (!pos) {
        return std::nullopt;
    }
    return (*list)[*pos];
}

std::size_t Engine::llen(const std::string& key) const {
    const auto* list = keyspace_.get_typed<List>(key, "LLEN");
    return list ? list->size() : 0;
}

std::optional<std::string> Engine::pop_list(const std::string& key, bool left,
                                            std::string_view operation) {
    auto* list = keyspace_.get_typed<List>(key, operation);
    if (!list || list->empty()) {
        return std::nullopt;
    }
    std::string value;
    if (left) {
        value = std::move(list->front());
        list->pop_front();
    } else {
        value = std::move(list->back());
        list->pop_back();
    }
    keyspace_.drop_if_empty(key);
    return value;
}

std::optional<std::string> Engine::lpop(const std::string& key) {
    return pop_list(key, true, "LPOP");
}

std::optional<std::string> Engine::rpop(const std::string& key) {
    return pop_list(key, false, "RPOP");
}

std::size_t Engine::lpush(const std::string& key, const std::vector<std::string>& values) {
    if (values.empty()) {
        throw invalid_argument("LPUSH requires at least one value");
    }
    auto* list = keyspace_.get_typed<List>(key, "LPUSH", true);
    for (const auto& value : values) {
        list->push_front(value);
    }
    return list->size();
}

std::size_t Engine::rpush(const std::string& key, const std::vector<std::string>& values) {
    if (values.empty()) {
        throw invalid_argument("RPUSH requires at least one value");
    }
    auto* list = keyspace_.get_typed<List>(key, "RPUSH", true);
    list->insert(list->end(), values.begin(), values.end());
    return list->size();
}

std::size_t Engine::lrem(const std::string& key, const std::string& value, int64_t count) {
    auto* list = keyspace_.get_typed<List>(key, "LREM");
    if (!list) {
        return 0;
    }
    std::size_t removed = 0;
    // Negate in unsigned arithmetic so INT64_MIN has a magnitude.
    const auto limit = static_cast<std::size_t>(
        count < 0 ? 0 - static_cast<uint64_t>(count) : static_cast<uint64_t>(count));
    auto within_limit = [&] { return limit == 0 || removed < limit; };

    if (count >= 0) {
        for (auto it = list->begin(); it != list->end() && within_limit();) {
            if (*it == value) {
                it = list->erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    } else {
        for (auto it = list->end(); it != list->begin() && within_limit();) {
            --it;
            if (*it == value) {
                it = list->erase(it);
                ++removed;
            }
        }
    }
    keyspace_.drop_if_empty(key);
    return removed;
}

void Engine::ltrim(const std::string& key, int64_t start, int64_t stop) {
    auto* list = keyspace_.get_typed<List>(key, "LTRIM");
    if (!list) {
        return;
    }
    const auto r = translate_range(static_cast<int64_t>(list->size()), start, stop);
    if (r.empty()) {
        list->clear();
    } else {
        list->erase(list->begin() + r.end + 1, list->end());
        list->erase(list->begin(), list->begin() + r.start);
    }
    keyspace_.drop_if_empty(key);
}

std::optional<std::string> Engine::rpoplpush(const std::string& source,
                                             const std::string& destination) {
    // Type-check the destination before anything is popped.
    static_cast<void>(keyspace_.get_typed<List>(destination, "RPOPLPUSH"));

    auto value = pop_list(source, false, "RPOPLPUSH");
    if (value) {
        lpush(destination, {*value});
    }
    return value;
}

void Engine::lset(const std::string& key, int64_t index, std::string value) {
    auto* list = keyspace_.get_typed<List>(key, "LSET");
    if (!list) {
        throw response_error("no such key");
    }
    const auto pos = resolve_index(list->size(), index);
    if (!pos) {
        throw response_error("index out of range");
    }
    (*list)[*pos] = std::move(value);
}

// ── Blocking pops ────────────────────────────────────────────────────────────

std::optional<PopResult> Engine::blpop(const std::vector<std::string>& keys, int64_t timeout) {
    return blocking_.pop([this](const std::string& key) { return lpop(key); }, keys, timeout);
}

std::optional<PopResult> Engine::brpop(const std::vector<std::string>& keys, int64_t timeout) {
    return blocking_.pop([this](const std::string& key) { return rpop(key); }, keys, timeout);
}

std::optional<std::string> Engine::brpoplpush(const std::string& source,
                                              const std::string& destination,
                                              int64_t timeout) {
    static_cast<void>(keyspace_.get_typed<List>(destination, "BRPOPLPUSH"));

    auto popped = brpop({source}, timeout);
    if (!popped) {
        return std::nullopt;
    }
    lpush(destination, {popped->value});
    return std::move(popped->value);
}

boost::asio::awaitable<std::optional<PopResult>>
Engine::async_blpop(std::vector<std::string> keys, int64_t timeout) {
    co_return co_await blocking_.async_pop(
        [this](const std::string& key) { return lpop(key); }, std::move(keys), timeout);
}

boost::asio::awaitable<std::optional<PopResult>>
Engine::async_brpop(std::vector<std::string> keys, int64_t timeout) {
    co_return co_await blocking_.async_pop(
        [this](const std::string& key) { return rpop(key); }, std::move(keys), timeout);
}

} // namespace kvmock
