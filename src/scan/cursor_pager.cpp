#include "scan/cursor_pager.hpp"

#include <charconv>

#include <spdlog/fmt/fmt.h>

namespace kvmock::scan {

uint64_t parse_cursor(std::string_view cursor) {
    uint64_t value{};
    auto [ptr, ec] = std::from_chars(cursor.data(), cursor.data() + cursor.size(), value);
    if (cursor.empty() || ec != std::errc{} || ptr != cursor.data() + cursor.size()) {
        throw invalid_argument(fmt::format("invalid cursor '{}'", cursor));
    }
    return value;
}

} // namespace kvmock::scan
