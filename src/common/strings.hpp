#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace kvmock {

// ASCII lower-casing for command names and option keywords.
[[nodiscard]] std::string to_lower(std::string_view s);

// Case-insensitive ASCII comparison.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// Parse a signed decimal integer, throwing InvalidArgument naming `what`
// when the text is not exactly an integer.
[[nodiscard]] int64_t parse_int64(std::string_view sv, std::string_view what = "value");

// Parse a floating-point number ("inf", "+inf" and "-inf" included).
// NaN and trailing garbage throw InvalidArgument naming `what`.
[[nodiscard]] double parse_double(std::string_view sv, std::string_view what = "value");

// Shortest text that parses back to `value` ("3", "1.5", "inf", "-inf").
[[nodiscard]] std::string format_double(double value);

} // namespace kvmock
