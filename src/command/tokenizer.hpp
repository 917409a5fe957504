#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace kvmock::command {

// Split one input line into command tokens.  Tokens are separated by
// whitespace; a double-quoted run forms a single token (quotes removed,
// `\"` and `\\` unescaped) and may be empty.  An unterminated quote throws
// InvalidArgument.
[[nodiscard]] std::vector<std::string> tokenize(std::string_view line);

} // namespace kvmock::command
