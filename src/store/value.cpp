#include "store/value.hpp"

#include <type_traits>

namespace kvmock {

std::string_view to_string(ValueType type) noexcept {
    switch (type) {
        case ValueType::String: return "string";
        case ValueType::List:   return "list";
        case ValueType::Set:    return "set";
        case ValueType::Hash:   return "hash";
        case ValueType::ZSet:   return "zset";
    }
    return "none";
}

ValueType type_of(const Value& value) noexcept {
    return std::visit(
        [](const auto& v) -> ValueType {
            return ValueTraits<std::decay_t<decltype(v)>>::type;
        },
        value);
}

bool is_empty_collection(const Value& value) noexcept {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return false;
            } else {
                return v.empty();
            }
        },
        value);
}

} // namespace kvmock
