#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace kvmock {

// ── Convention ────────────────────────────────────────────────────────────────
// Argument ordering of the emulated client flavour for flat ZADD arguments
// passed to Engine::zadd_args. Commands sent through the dispatcher always
// use the server's native (score, member) order.
//   Legacy – (member, score) pairs.
//   Strict – (score, member) pairs.

enum class Convention : uint8_t {
    Legacy = 0,
    Strict = 1,
};

// ── EngineConfig ──────────────────────────────────────────────────────────────
// Full configuration for one emulated store instance.

struct EngineConfig {
    Convention                convention = Convention::Legacy;
    std::chrono::seconds      blocking_timeout{1000};      // used when a blocking pop passes 0
    std::chrono::milliseconds blocking_poll_interval{10};  // sleep between pop passes
    uint64_t                  random_seed = 0;             // 0 = seed from std::random_device
    std::string               log_level = "info";

    [[nodiscard]] bool strict() const noexcept { return convention == Convention::Strict; }
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into an EngineConfig.
//
// On success: returns a validated EngineConfig.
// On error  : throws std::runtime_error with a human-readable message (the
//             help text when --help is given).
//
// Validates:
//   - --blocking-poll-ms > 0
//   - --blocking-timeout >= 0

[[nodiscard]] EngineConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with engine options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace kvmock
