#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/clock.hpp"
#include "common/error.hpp"
#include "store/value.hpp"

namespace kvmock {

// ── KeySpace ─────────────────────────────────────────────────────────────────
//
// The single namespace key → typed value, plus the TTL registry
// key → absolute expiry instant.
//
// Invariants:
//   - a key holds one value type until it is deleted and recreated;
//   - empty collections are never stored;
//   - an expiry entry exists only for a present key (every delete or plain
//     overwrite drops it).
//
// Expired keys stay readable until sweep() runs; nothing here evicts keys
// implicitly.
//
// NOT thread-safe; callers serialise access to the owning engine.

class KeySpace {
public:
    explicit KeySpace(const Clock& clock,
                      std::shared_ptr<spdlog::logger> logger = {});

    KeySpace(const KeySpace&)            = delete;
    KeySpace& operator=(const KeySpace&) = delete;

    // ── Typed access ─────────────────────────────────────────────────────────

    // Returns the value stored under `key` when it is absent or already of
    // type T.  An absent key yields nullptr, unless `create` is set, in which
    // case an empty T is stored and returned.  Any other type throws
    // TypeMismatch naming `operation`.
    //
    // A created collection must be filled or released with drop_if_empty()
    // before the caller returns.
    template <typename T>
    T* get_typed(const std::string& key, std::string_view operation, bool create = false) {
        auto it = values_.find(key);
        if (it == values_.end()) {
            if (!create) {
                return nullptr;
            }
            it = values_.emplace(key, Value{std::in_place_type<T>}).first;
            return &std::get<T>(it->second);
        }
        if (auto* typed = std::get_if<T>(&it->second)) {
            return typed;
        }
        throw type_mismatch(operation, to_string(ValueTraits<T>::type));
    }

    template <typename T>
    const T* get_typed(const std::string& key, std::string_view operation) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return nullptr;
        }
        if (const auto* typed = std::get_if<T>(&it->second)) {
            return typed;
        }
        throw type_mismatch(operation, to_string(ValueTraits<T>::type));
    }

    // Raw lookup without a type check.
    [[nodiscard]] const Value* find(const std::string& key) const;

    // Type of `key`, or std::nullopt if absent.
    [[nodiscard]] std::optional<ValueType> type(const std::string& key) const;

    [[nodiscard]] bool exists(const std::string& key) const;

    // All keys (order is unspecified).
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    // ── Writes ───────────────────────────────────────────────────────────────

    // Plain write: replaces any value of any type and cancels the key's TTL.
    // An empty collection deletes the key instead.
    void put(const std::string& key, Value value);

    // Overwrite a string in place, keeping the key's TTL (INCR and friends).
    void replace_string(const std::string& key, std::string value);

    // Remove the key together with its expiry entry.
    // Returns true if the key existed.
    bool erase(const std::string& key);

    // Delete `key` if it holds an empty collection.  Returns true if deleted.
    bool drop_if_empty(const std::string& key);

    // Remove every key and expiry entry.
    void clear();

    // ── TTL registry ─────────────────────────────────────────────────────────

    // Store/overwrite the expiry instant.  No-op returning false if the key
    // is absent.
    bool set_expiry(const std::string& key, Clock::time_point when);

    // Expiry instant of `key`, or std::nullopt when none is set.
    [[nodiscard]] std::optional<Clock::time_point> expiry(const std::string& key) const;

    // Remaining time (expiry - now; negative once passed), or std::nullopt
    // when the key has no expiry entry.
    [[nodiscard]] std::optional<Clock::duration> remaining(const std::string& key) const;

    // Evict every key whose expiry instant lies strictly before now().
    // Returns the number of keys removed.
    std::size_t sweep();

    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

private:
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unordered_map<std::string, Value> values_;
    std::unordered_map<std::string, Clock::time_point> expiries_;
};

} // namespace kvmock
