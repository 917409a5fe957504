#include "store/range.hpp"

#include <algorithm>

namespace kvmock {

IndexRange translate_range(int64_t len, int64_t start, int64_t end) noexcept {
    if (start < 0) {
        start += len;
    }
    start = std::max<int64_t>(0, std::min(start, len));

    if (end < 0) {
        end += len;
    }
    end = std::max<int64_t>(-1, std::min(end, len - 1));

    return IndexRange{start, end};
}

LimitWindow translate_limit(int64_t len, int64_t start, int64_t num) noexcept {
    if (start > len || num <= 0) {
        return LimitWindow{0, 0};
    }
    return LimitWindow{std::clamp<int64_t>(start, 0, len), num};
}

} // namespace kvmock
