#pragma once

#include <string>

#include "command/dispatcher.hpp"

namespace kvmock::command {

// A script bound to a dispatcher, as returned by register_script().  The
// digest is computed up front; the source is loaded into the engine the
// first time the script runs (or again after SCRIPT FLUSH).
class Script {
public:
    Script(CommandDispatcher& dispatcher, std::string source);

    Reply operator()(const Args& keys = {}, const Args& args = {});

    [[nodiscard]] const std::string& sha() const noexcept { return sha_; }
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    CommandDispatcher& dispatcher_;
    std::string source_;
    std::string sha_;
};

} // namespace kvmock::command
