#pragma once

#include <string>
#include <string_view>

namespace kvmock {

// Lower-case hex SHA-1 of `data` (OpenSSL EVP).  Throws std::runtime_error
// if the digest cannot be computed.
[[nodiscard]] std::string sha1_hex(std::string_view data);

} // namespace kvmock
