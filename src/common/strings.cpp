#include "common/strings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"

namespace kvmock {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char l, unsigned char r) {
               return std::tolower(l) == std::tolower(r);
           });
}

int64_t parse_int64(std::string_view sv, std::string_view what) {
    int64_t value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw invalid_argument(
            fmt::format("{} is not an integer or out of range: '{}'", what, sv));
    }
    return value;
}

double parse_double(std::string_view sv, std::string_view what) {
    // from_chars does not accept a leading '+'.
    std::string_view digits = sv;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }

    double value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() ||
        std::isnan(value)) {
        throw invalid_argument(fmt::format("{} is not a valid float: '{}'", what, sv));
    }
    return value;
}

std::string format_double(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        return fmt::format("{}", value);
    }
    return std::string(buf.data(), ptr);
}

} // namespace kvmock
