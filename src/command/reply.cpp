#include "command/reply.hpp"

#include <type_traits>

#include <spdlog/fmt/fmt.h>

#include "common/strings.hpp"

namespace kvmock::command {

Reply bulk_array(const std::vector<std::string>& values) {
    std::vector<Reply> items;
    items.reserve(values.size());
    for (const auto& v : values) {
        items.push_back(bulk(v));
    }
    return array(std::move(items));
}

Reply bulk_array(const std::vector<std::optional<std::string>>& values) {
    std::vector<Reply> items;
    items.reserve(values.size());
    for (const auto& v : values) {
        items.push_back(bulk_or_nil(v));
    }
    return array(std::move(items));
}

namespace {

void format_into(const Reply& reply, std::size_t indent, std::string& out) {
    std::visit(
        [&](const auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, NilReply>) {
                out += "(nil)";
            } else if constexpr (std::is_same_v<T, StatusReply>) {
                out += r.text;
            } else if constexpr (std::is_same_v<T, IntegerReply>) {
                out += fmt::format("(integer) {}", r.value);
            } else if constexpr (std::is_same_v<T, DoubleReply>) {
                out += fmt::format("(double) {}", format_double(r.value));
            } else if constexpr (std::is_same_v<T, BulkReply>) {
                out += fmt::format("\"{}\"", r.value);
            } else if constexpr (std::is_same_v<T, ArrayReply>) {
                if (r.items.empty()) {
                    out += "(empty array)";
                    return;
                }
                const std::string label_width = std::to_string(r.items.size());
                for (std::size_t i = 0; i < r.items.size(); ++i) {
                    if (i > 0) {
                        out += '\n';
                        out.append(indent, ' ');
                    }
                    const std::string label = fmt::format("{:>{}}) ", i + 1, label_width.size());
                    out += label;
                    format_into(r.items[i], indent + label.size(), out);
                }
            }
        },
        reply.value);
}

} // namespace

std::string format_reply(const Reply& reply) {
    std::string out;
    format_into(reply, 0, out);
    return out;
}

} // namespace kvmock::command
