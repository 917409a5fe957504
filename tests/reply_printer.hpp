#pragma once

#include <ostream>

#include "command/reply.hpp"

namespace kvmock::command {

// Readable gtest failure output for replies.
inline void PrintTo(const Reply& reply, std::ostream* os) {
    *os << format_reply(reply);
}

} // namespace kvmock::command
