#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "command/normalizer.hpp"
#include "command/reply.hpp"
#include "engine/engine.hpp"

namespace kvmock::command {

// Invoke a named command with its arguments (command name excluded).
using CallFn = std::function<Reply(const std::string& name, const Args& args)>;

// ── ScriptRunner ─────────────────────────────────────────────────────────────
//
// Executes script sources on behalf of EVAL/EVALSHA.  No interpreter ships
// with the engine; embedders install one with set_script_runner().  The
// runner reaches the store only through `call`, which goes through the full
// normalize → operate → respond pipeline.

class ScriptRunner {
public:
    virtual ~ScriptRunner() = default;

    virtual Reply run(const std::string& source,
                      const Args& keys,
                      const Args& args,
                      const CallFn& call) = 0;
};

// ── Registry entries ─────────────────────────────────────────────────────────

inline constexpr std::size_t kVariadic = std::numeric_limits<std::size_t>::max();

// Accepted argument counts, command name excluded.
struct Arity {
    std::size_t min = 0;
    std::size_t max = 0;

    [[nodiscard]] bool accepts(std::size_t n) const noexcept { return n >= min && n <= max; }
};

[[nodiscard]] constexpr Arity exactly(std::size_t n) noexcept { return {n, n}; }
[[nodiscard]] constexpr Arity at_least(std::size_t n) noexcept { return {n, kVariadic}; }
[[nodiscard]] constexpr Arity between(std::size_t lo, std::size_t hi) noexcept { return {lo, hi}; }

using NormalizeFn = std::function<NormalizedArgs(const Args&, Convention)>;
using InvokeFn    = std::function<Reply(Engine&, const NormalizedArgs&)>;
using RespondFn   = std::function<Reply(Reply)>;

struct CommandEntry {
    Arity       arity;
    NormalizeFn normalize;
    InvokeFn    invoke;
    RespondFn   respond;
};

class Script;

// ── CommandDispatcher ────────────────────────────────────────────────────────
//
// Invoke-by-name front end over one Engine.  The registry is built once at
// construction; call() lower-cases the name, checks arity, normalizes the
// arguments (taken in the server's native order), runs the operation and
// normalizes the reply.
//
// NOT thread-safe; shares the engine's single-caller contract.

class CommandDispatcher {
public:
    // Uses the engine's configured convention.
    explicit CommandDispatcher(Engine& engine,
                               std::shared_ptr<spdlog::logger> logger = {});

    CommandDispatcher(Engine& engine,
                      Convention convention,
                      std::shared_ptr<spdlog::logger> logger = {});

    CommandDispatcher(const CommandDispatcher&)            = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // Throws UnknownCommand for a name with no registry entry and
    // InvalidArgument for a wrong argument count.
    Reply call(std::string_view name, const Args& args = {});

    // Register `source` under its SHA-1 and run it.
    Reply eval(const std::string& source, int64_t numkeys, const Args& keys_and_args);

    // Run a registered script.  Unknown sha → ResponseError "Sha not
    // registered"; no runner installed → Unimplemented.  Negative numkeys
    // counts as 0.
    Reply evalsha(const std::string& sha, int64_t numkeys, const Args& keys_and_args);

    // Callable handle that loads `source` on first use.
    [[nodiscard]] Script register_script(std::string source);

    void set_script_runner(std::shared_ptr<ScriptRunner> runner) { runner_ = std::move(runner); }

    [[nodiscard]] bool has_command(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> command_names() const;

    [[nodiscard]] Convention convention() const noexcept { return convention_; }
    [[nodiscard]] Engine& engine() noexcept { return engine_; }

private:
    void add(const std::string& name, Arity arity, InvokeFn invoke);
    void add(const std::string& name, Arity arity, NormalizeFn normalize, InvokeFn invoke,
             RespondFn respond = pass_through);

    // Registration, grouped by value type (commands.cpp).
    void register_connection_commands();
    void register_key_commands();
    void register_string_commands();
    void register_hash_commands();
    void register_list_commands();
    void register_set_commands();
    void register_zset_commands();
    void register_scan_commands();
    void register_script_commands();

    Engine& engine_;
    Convention convention_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<ScriptRunner> runner_;
    std::unordered_map<std::string, CommandEntry> registry_;
};

} // namespace kvmock::command
