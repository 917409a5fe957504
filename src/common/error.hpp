#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kvmock {

// ── ErrorKind ─────────────────────────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    TypeMismatch         = 0, // key holds a different kind of value
    InvalidArgument      = 1, // malformed range, count, timeout, pair list …
    UnsupportedAggregate = 2, // aggregate name other than sum/min/max
    UnknownCommand       = 3, // dispatcher has no entry for the name
    Unimplemented        = 4, // operation deliberately not emulated
    ResponseError        = 5, // the emulated store rejects well-formed input
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// ── Error ─────────────────────────────────────────────────────────────────────
//
// Every engine, pager, driver and dispatcher failure is reported by throwing
// this type.  Failures are raised before any shared structure is touched, so
// a caught Error never leaves partial state behind.

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Convenience factories used at throw sites.
[[nodiscard]] Error type_mismatch(std::string_view operation, std::string_view expected);
[[nodiscard]] Error invalid_argument(const std::string& message);
[[nodiscard]] Error response_error(const std::string& message);

} // namespace kvmock
