#include "command/normalizer.hpp"

#include <algorithm>
#include <initializer_list>

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"
#include "common/strings.hpp"

namespace kvmock::command {

// ── NormalizedArgs ───────────────────────────────────────────────────────────

const Keyword* NormalizedArgs::find(std::string_view name) const {
    for (auto it = keywords.rbegin(); it != keywords.rend(); ++it) {
        if (it->name == name) {
            return &*it;
        }
    }
    return nullptr;
}

std::vector<const Keyword*> NormalizedArgs::all(std::string_view name) const {
    std::vector<const Keyword*> found;
    for (const auto& keyword : keywords) {
        if (keyword.name == name) {
            found.push_back(&keyword);
        }
    }
    return found;
}

// ── Option scanning ──────────────────────────────────────────────────────────

namespace {

struct OptionSpec {
    std::string_view name;
    std::size_t      arity; // tokens consumed after the keyword
};

// Split `args` into `leading` positional operands followed by keyword
// options drawn from `options`, matched case-insensitively in any order.
NormalizedArgs scan_options(const Args& args, std::size_t leading,
                            std::initializer_list<OptionSpec> options) {
    NormalizedArgs out;
    const std::size_t split = std::min(leading, args.size());
    out.positional.assign(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(split));

    for (std::size_t i = split; i < args.size();) {
        const std::string name = to_lower(args[i]);
        const OptionSpec* spec = nullptr;
        for (const auto& option : options) {
            if (option.name == name) {
                spec = &option;
                break;
            }
        }
        if (!spec) {
            throw invalid_argument(fmt::format("unsupported option '{}'", args[i]));
        }
        if (args.size() - i - 1 < spec->arity) {
            throw invalid_argument(
                fmt::format("option '{}' requires {} argument(s)", args[i], spec->arity));
        }
        Keyword keyword{name, {}};
        for (std::size_t j = 1; j <= spec->arity; ++j) {
            keyword.values.push_back(args[i + j]);
        }
        out.keywords.push_back(std::move(keyword));
        i += 1 + spec->arity;
    }
    return out;
}

} // namespace

// ── Argument normalizers ─────────────────────────────────────────────────────

NormalizedArgs normalize_plain(const Args& args, Convention /*convention*/) {
    NormalizedArgs out;
    out.positional = args;
    return out;
}

NormalizedArgs normalize_zadd(const Args& args, Convention /*convention*/) {
    if (args.size() < 3 || (args.size() - 1) % 2 != 0) {
        throw invalid_argument("ZADD requires an equal number of values and scores");
    }
    NormalizedArgs out;
    out.positional.reserve(args.size());
    out.positional.push_back(args[0]);

    for (std::size_t i = 1; i < args.size(); i += 2) {
        out.positional.push_back(args[i + 1]);
        out.positional.push_back(args[i]);
    }
    return out;
}

NormalizedArgs normalize_range_by_score(const Args& args, Convention /*convention*/) {
    return scan_options(args, 3, {{"limit", 2}, {"withscores", 0}});
}

NormalizedArgs normalize_zrange(const Args& args, Convention /*convention*/) {
    return scan_options(args, 3, {{"withscores", 0}});
}

NormalizedArgs normalize_zstore(const Args& args, Convention /*convention*/) {
    if (args.size() < 2) {
        throw invalid_argument("destination and numkeys are required");
    }
    const int64_t numkeys = parse_int64(args[1], "numkeys");
    if (numkeys <= 0 || static_cast<std::size_t>(numkeys) > args.size() - 2) {
        throw invalid_argument(
            fmt::format("numkeys must be between 1 and the number of keys given: {}", args[1]));
    }

    Args rest;
    rest.reserve(args.size());
    rest.push_back(args[0]);
    rest.insert(rest.end(), args.begin() + 2, args.end());

    const auto leading = static_cast<std::size_t>(numkeys) + 1;
    for (std::size_t i = leading; i < rest.size(); ++i) {
        if (iequals(rest[i], "weights")) {
            throw Error(ErrorKind::Unimplemented, "WEIGHTS is not emulated");
        }
    }
    return scan_options(rest, leading, {{"aggregate", 1}});
}

NormalizedArgs normalize_scan(const Args& args, std::size_t leading) {
    return scan_options(args, leading, {{"match", 1}, {"count", 1}});
}

NormalizedArgs normalize_set(const Args& args, Convention /*convention*/) {
    return scan_options(args, 2, {{"ex", 1}, {"px", 1}, {"nx", 0}, {"xx", 0}});
}

NormalizedArgs normalize_sort(const Args& args, Convention /*convention*/) {
    return scan_options(args, 1, {{"by", 1}, {"limit", 2}, {"get", 1}, {"asc", 0},
                                  {"desc", 0}, {"alpha", 0}, {"store", 1}});
}

// ── Response normalizers ─────────────────────────────────────────────────────

Reply flatten_pairs(Reply reply) {
    auto* outer = std::get_if<ArrayReply>(&reply.value);
    if (!outer || outer->items.empty()) {
        return reply;
    }
    const bool pairs = std::all_of(outer->items.begin(), outer->items.end(), [](const Reply& item) {
        return std::holds_alternative<ArrayReply>(item.value);
    });
    if (!pairs) {
        return reply;
    }
    std::vector<Reply> flat;
    flat.reserve(outer->items.size() * 2);
    for (auto& item : outer->items) {
        auto& pair = std::get<ArrayReply>(item.value);
        for (auto& element : pair.items) {
            flat.push_back(std::move(element));
        }
    }
    return array(std::move(flat));
}

} // namespace kvmock::command
