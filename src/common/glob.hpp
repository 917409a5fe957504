#pragma once

#include <string_view>

namespace kvmock {

// Match `text` against a key pattern in which `*` stands for any (possibly
// empty) substring.  Every other character matches itself; the pattern must
// cover the whole text.
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text) noexcept;

} // namespace kvmock
