#include "store/keyspace.hpp"

#include <utility>

namespace kvmock {

KeySpace::KeySpace(const Clock& clock, std::shared_ptr<spdlog::logger> logger)
    : clock_(clock)
    , logger_(std::move(logger))
{
}

const Value* KeySpace::find(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<ValueType> KeySpace::type(const std::string& key) const {
    const Value* value = find(key);
    if (!value) {
        return std::nullopt;
    }
    return type_of(*value);
}

bool KeySpace::exists(const std::string& key) const {
    return values_.count(key) > 0;
}

std::vector<std::string> KeySpace::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [k, _] : values_) {
        result.push_back(k);
    }
    return result;
}

void KeySpace::put(const std::string& key, Value value) {
    expiries_.erase(key);
    if (is_empty_collection(value)) {
        values_.erase(key);
        return;
    }
    values_.insert_or_assign(key, std::move(value));
}

void KeySpace::replace_string(const std::string& key, std::string value) {
    values_.insert_or_assign(key, Value{std::move(value)});
}

bool KeySpace::erase(const std::string& key) {
    // Both erasures are noexcept; value and expiry disappear together.
    expiries_.erase(key);
    return values_.erase(key) > 0;
}

bool KeySpace::drop_if_empty(const std::string& key) {
    auto it = values_.find(key);
    if (it == values_.end() || !is_empty_collection(it->second)) {
        return false;
    }
    values_.erase(it);
    expiries_.erase(key);
    if (logger_) {
        logger_->debug("[keyspace] {} emptied and removed", key);
    }
    return true;
}

void KeySpace::clear() {
    values_.clear();
    expiries_.clear();
}

bool KeySpace::set_expiry(const std::string& key, Clock::time_point when) {
    if (!exists(key)) {
        return false;
    }
    expiries_.insert_or_assign(key, when);
    return true;
}

std::optional<Clock::time_point> KeySpace::expiry(const std::string& key) const {
    auto it = expiries_.find(key);
    if (it == expiries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Clock::duration> KeySpace::remaining(const std::string& key) const {
    const auto when = expiry(key);
    if (!when) {
        return std::nullopt;
    }
    return *when - clock_.now();
}

std::size_t KeySpace::sweep() {
    const auto now = clock_.now();
    std::size_t evicted = 0;

    for (auto it = expiries_.begin(); it != expiries_.end();) {
        if (it->second < now) {
            if (values_.erase(it->first) > 0) {
                ++evicted;
                if (logger_) {
                    logger_->debug("[keyspace] {} expired", it->first);
                }
            }
            it = expiries_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

} // namespace kvmock
