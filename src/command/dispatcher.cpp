#include "command/dispatcher.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "command/script.hpp"
#include "common/error.hpp"
#include "common/strings.hpp"

namespace kvmock::command {

CommandDispatcher::CommandDispatcher(Engine& engine, std::shared_ptr<spdlog::logger> logger)
    : CommandDispatcher(engine, engine.config().convention, std::move(logger))
{
}

CommandDispatcher::CommandDispatcher(Engine& engine,
                                     Convention convention,
                                     std::shared_ptr<spdlog::logger> logger)
    : engine_(engine)
    , convention_(convention)
    , logger_(std::move(logger))
{
    register_connection_commands();
    register_key_commands();
    register_string_commands();
    register_hash_commands();
    register_list_commands();
    register_set_commands();
    register_zset_commands();
    register_scan_commands();
    register_script_commands();

    if (logger_) {
        logger_->debug("[dispatch] {} commands registered ({} convention)",
                       registry_.size(),
                       convention_ == Convention::Strict ? "strict" : "legacy");
    }
}

void CommandDispatcher::add(const std::string& name, Arity arity, InvokeFn invoke) {
    add(name, arity, normalize_plain, std::move(invoke));
}

void CommandDispatcher::add(const std::string& name, Arity arity, NormalizeFn normalize,
                            InvokeFn invoke, RespondFn respond) {
    registry_.insert_or_assign(
        name, CommandEntry{arity, std::move(normalize), std::move(invoke), std::move(respond)});
}

// ── call ─────────────────────────────────────────────────────────────────────

Reply CommandDispatcher::call(std::string_view name, const Args& args) {
    const std::string command = to_lower(name);

    auto it = registry_.find(command);
    if (it == registry_.end()) {
        throw Error(ErrorKind::UnknownCommand, fmt::format("unknown command '{}'", name));
    }
    const CommandEntry& entry = it->second;

    if (!entry.arity.accepts(args.size())) {
        throw invalid_argument(
            fmt::format("wrong number of arguments for '{}' command", command));
    }

    if (logger_) {
        logger_->trace("[dispatch] {} ({} args)", command, args.size());
    }

    NormalizedArgs normalized = entry.normalize(args, convention_);
    return entry.respond(entry.invoke(engine_, normalized));
}

bool CommandDispatcher::has_command(std::string_view name) const {
    return registry_.count(to_lower(name)) > 0;
}

std::vector<std::string> CommandDispatcher::command_names() const {
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& [name, _] : registry_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ── Scripts ──────────────────────────────────────────────────────────────────

Reply CommandDispatcher::eval(const std::string& source, int64_t numkeys,
                              const Args& keys_and_args) {
    const std::string sha = engine_.script_load(source);
    return evalsha(sha, numkeys, keys_and_args);
}

Reply CommandDispatcher::evalsha(const std::string& sha, int64_t numkeys,
                                 const Args& keys_and_args) {
    const std::string* registered = engine_.script_source(sha);
    if (!registered) {
        throw response_error("Sha not registered");
    }
    if (!runner_) {
        throw Error(ErrorKind::Unimplemented, "no script runner installed");
    }

    const auto count = static_cast<std::size_t>(std::max<int64_t>(numkeys, 0));
    if (count > keys_and_args.size()) {
        throw invalid_argument("Number of keys can't be greater than number of args");
    }
    const auto split = keys_and_args.begin() + static_cast<std::ptrdiff_t>(count);
    const Args keys(keys_and_args.begin(), split);
    const Args args(split, keys_and_args.end());

    // The script may flush the registry while it runs.
    const std::string source = *registered;
    const CallFn call_back = [this](const std::string& name, const Args& call_args) {
        return call(name, call_args);
    };

    try {
        return runner_->run(source, keys, args, call_back);
    } catch (const Error& e) {
        if (logger_) {
            logger_->warn("[script] {} failed: {}", sha, e.what());
        }
        throw;
    }
}

Script CommandDispatcher::register_script(std::string source) {
    return Script{*this, std::move(source)};
}

} // namespace kvmock::command
