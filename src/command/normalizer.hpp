#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "command/reply.hpp"
#include "common/engine_config.hpp"

namespace kvmock::command {

using Args = std::vector<std::string>;

// ── NormalizedArgs ───────────────────────────────────────────────────────────
//
// Fixed-shape view of a command's arguments: positional operands in order,
// plus option keywords (lower-cased) with the tokens that followed them.
// Flags such as WITHSCORES carry no values.

struct Keyword {
    std::string              name;
    std::vector<std::string> values;
};

struct NormalizedArgs {
    std::vector<std::string> positional;
    std::vector<Keyword>     keywords;

    // Last occurrence of `name`, or nullptr.
    [[nodiscard]] const Keyword* find(std::string_view name) const;
    // Every occurrence of `name` in argument order (repeatable GET patterns).
    [[nodiscard]] std::vector<const Keyword*> all(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }
};

// ── Argument normalizers ─────────────────────────────────────────────────────
//
// Each takes the raw argument list (command name excluded) and throws
// InvalidArgument for an option it does not recognise or one that is
// missing its values.

// Every argument is positional.
[[nodiscard]] NormalizedArgs normalize_plain(const Args& args, Convention convention);

// key score member [score member ...] → key member score [member score ...].
// Dispatched commands always use the server's native pair order; the
// convention only shapes Engine::zadd_args. Odd pair lists throw
// InvalidArgument.
[[nodiscard]] NormalizedArgs normalize_zadd(const Args& args, Convention convention);

// key min max [LIMIT offset count] [WITHSCORES], keywords in any order.
[[nodiscard]] NormalizedArgs normalize_range_by_score(const Args& args, Convention convention);

// key start stop [WITHSCORES]
[[nodiscard]] NormalizedArgs normalize_zrange(const Args& args, Convention convention);

// destination numkeys key [key ...] [AGGREGATE SUM|MIN|MAX]
// → positional: destination key [key ...].  WEIGHTS throws Unimplemented.
[[nodiscard]] NormalizedArgs normalize_zstore(const Args& args, Convention convention);

// [key] cursor [MATCH pattern] [COUNT count]; `leading` is the number of
// positional operands (1 for SCAN, 2 for SSCAN/HSCAN/ZSCAN).
[[nodiscard]] NormalizedArgs normalize_scan(const Args& args, std::size_t leading);

// key value [EX seconds] [PX milliseconds] [NX] [XX]
[[nodiscard]] NormalizedArgs normalize_set(const Args& args, Convention convention);

// key [BY pattern] [LIMIT offset count] [GET pattern ...] [ASC|DESC] [ALPHA]
//     [STORE destination]
[[nodiscard]] NormalizedArgs normalize_sort(const Args& args, Convention convention);

// ── Response normalizers ─────────────────────────────────────────────────────

[[nodiscard]] inline Reply pass_through(Reply reply) { return reply; }

// [[member, score], ...] → [member, score, ...].  Replies that are not arrays
// of pairs are returned unchanged.
[[nodiscard]] Reply flatten_pairs(Reply reply);

} // namespace kvmock::command
