#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "common/error.hpp"
#include "common/glob.hpp"

namespace kvmock::scan {

inline constexpr int64_t kDefaultPageSize = 10;

// One page of a cursor enumeration.  `cursor` is "0" once the snapshot is
// exhausted; otherwise pass it back to fetch the next page.
template <typename T>
struct Page {
    std::string    cursor;
    std::vector<T> items;
};

// Parse a cursor token into a snapshot offset.  Throws InvalidArgument for
// anything that is not a non-negative decimal integer.
[[nodiscard]] uint64_t parse_cursor(std::string_view cursor);

// Default key extractor: the element itself is matched against the pattern.
struct Identity {
    template <typename T>
    const T& operator()(const T& value) const noexcept { return value; }
};

// ── next_page ────────────────────────────────────────────────────────────────
//
// Stateless pagination over a freshly produced snapshot:
//   1. snapshot() is called and must return a deterministically ordered
//      std::vector<T> (callers sort it);
//   2. the slice [offset, offset + page_size) is taken;
//   3. the slice is filtered by `pattern`, applied to key(element).
//
// Filtering after slicing means a page can hold fewer than page_size items,
// and mutations between calls can skip or repeat elements.
//
// Throws InvalidArgument if page_size <= 0 or the cursor is malformed.

template <typename Producer, typename KeyFn = Identity>
auto next_page(Producer&& snapshot,
               std::string_view cursor,
               int64_t page_size,
               const std::optional<std::string>& pattern,
               KeyFn key = {})
    -> Page<typename std::invoke_result_t<Producer&>::value_type>
{
    using T = typename std::invoke_result_t<Producer&>::value_type;

    if (page_size <= 0) {
        throw invalid_argument("if specified, count must be > 0");
    }
    const uint64_t offset = parse_cursor(cursor);
    const auto count = static_cast<uint64_t>(page_size);

    std::vector<T> values = snapshot();

    Page<T> page;
    page.cursor = offset + count >= values.size() ? "0" : std::to_string(offset + count);

    if (offset >= values.size()) {
        return page;
    }
    const auto first = values.begin() + static_cast<std::ptrdiff_t>(offset);
    const auto last  = values.begin() +
        static_cast<std::ptrdiff_t>(std::min<uint64_t>(offset + count, values.size()));

    for (auto it = first; it != last; ++it) {
        if (pattern && !glob_match(*pattern, key(*it))) {
            continue;
        }
        page.items.push_back(std::move(*it));
    }
    return page;
}

} // namespace kvmock::scan
