#pragma once

#include <cstdint>

namespace kvmock {

// ── Index / range translation ────────────────────────────────────────────────
//
// Shared by list and sorted-set range commands.

// Inclusive interval produced by translate_range().  Empty when start > end.
struct IndexRange {
    int64_t start = 0;
    int64_t end   = -1;

    [[nodiscard]] bool empty() const noexcept { return start > end; }
    [[nodiscard]] int64_t length() const noexcept { return empty() ? 0 : end - start + 1; }
};

// Negative indices count from the end (add `len`).  start is clamped to
// [0, len] and end to [-1, len - 1].
//   translate_range(5, -2, -1) == {3, 4}
//   translate_range(5, 10, 20) == {5, 4}   (empty)
[[nodiscard]] IndexRange translate_range(int64_t len, int64_t start, int64_t end) noexcept;

// Offset/count window produced by translate_limit().
struct LimitWindow {
    int64_t start = 0;
    int64_t num   = 0;
};

// LIMIT offset/count: empty window when num <= 0 or start > len, otherwise
// start clamped to [0, len] with `num` elements requested from there.
[[nodiscard]] LimitWindow translate_limit(int64_t len, int64_t start, int64_t num) noexcept;

} // namespace kvmock
