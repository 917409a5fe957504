#include "engine/engine.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/error.hpp"
#include "common/strings.hpp"

namespace kvmock {

namespace {

std::string substitute(std::string_view pattern, std::string_view element) {
    std::string out;
    out.reserve(pattern.size() + element.size());
    for (char c : pattern) {
        if (c == '*') {
            out.append(element);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

// ── Sort ─────────────────────────────────────────────────────────────────────

std::vector<std::string> Engine::sort_items(const std::string& key) const {
    const Value* value = keyspace_.find(key);
    if (!value) {
        return {};
    }
    if (const auto* list = std::get_if<List>(value)) {
        return std::vector<std::string>(list->begin(), list->end());
    }
    if (const auto* set = std::get_if<Set>(value)) {
        return std::vector<std::string>(set->begin(), set->end());
    }
    throw type_mismatch("SORT", "list or set");
}

std::vector<std::optional<std::string>> Engine::sort(const std::string& key,
                                                     const SortOptions& options) const {
    if (options.start.has_value() != options.num.has_value()) {
        throw invalid_argument("start and num must both be specified together");
    }
    const bool nosort = options.by && *options.by == "nosort";
    if (options.by && !nosort && options.by->find('*') == std::string::npos) {
        throw invalid_argument(fmt::format("invalid value for \"by\": {}", *options.by));
    }

    std::vector<std::string> items = sort_items(key);
    if (items.empty() || (options.num && *options.num == 0)) {
        return {};
    }

    if (!nosort) {
        // Weight of each element: the element itself, or the string stored
        // under the BY pattern with '*' replaced by the element.
        std::vector<std::string> weights;
        weights.reserve(items.size());
        for (const auto& item : items) {
            weights.push_back(options.by ? lookup_string(substitute(*options.by, item)).value_or("")
                                         : item);
        }

        std::vector<std::size_t> order(items.size());
        std::iota(order.begin(), order.end(), std::size_t{0});

        if (options.alpha) {
            std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                return options.desc ? weights[b] < weights[a] : weights[a] < weights[b];
            });
        } else {
            std::vector<double> numeric;
            numeric.reserve(weights.size());
            for (const auto& weight : weights) {
                try {
                    numeric.push_back(weight.empty() ? 0.0 : parse_double(weight, "sort weight"));
                } catch (const Error&) {
                    throw response_error("One or more scores can't be converted into double");
                }
            }
            std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                return options.desc ? numeric[b] < numeric[a] : numeric[a] < numeric[b];
            });
        }

        std::vector<std::string> sorted;
        sorted.reserve(items.size());
        for (std::size_t i : order) {
            sorted.push_back(std::move(items[i]));
        }
        items = std::move(sorted);
    }

    if (options.start) {
        const auto len   = static_cast<int64_t>(items.size());
        const auto first = std::clamp<int64_t>(*options.start, 0, len);
        const auto last  = (*options.num < 0 || *options.num >= len - first)
                               ? len
                               : first + *options.num;
        items = std::vector<std::string>(std::make_move_iterator(items.begin() + first),
                                         std::make_move_iterator(items.begin() + last));
    }

    std::vector<std::optional<std::string>> result;
    if (options.get.empty()) {
        result.reserve(items.size());
        for (auto& item : items) {
            result.emplace_back(std::move(item));
        }
        return result;
    }

    result.reserve(items.size() * options.get.size());
    for (const auto& item : items) {
        for (const auto& pattern : options.get) {
            if (pattern == "#") {
                result.emplace_back(item);
            } else {
                result.push_back(lookup_string(substitute(pattern, item)));
            }
        }
    }
    return result;
}

std::size_t Engine::sort_store(const std::string& key, const SortOptions& options,
                               const std::string& destination) {
    List stored;
    for (auto& value : sort(key, options)) {
        stored.push_back(value ? std::move(*value) : std::string{});
    }
    const std::size_t size = stored.size();
    keyspace_.put(destination, Value{std::move(stored)});
    return size;
}

} // namespace kvmock
