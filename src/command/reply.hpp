#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kvmock::command {

// ── Replies ──────────────────────────────────────────────────────────────────
//
// Result of one dispatched command.  Each reply shape is a plain struct; the
// whole thing is wrapped in a std::variant so callers can std::visit over it.
// Arrays nest, so the variant lives inside a struct.

struct Reply;

struct NilReply {
    bool operator==(const NilReply&) const = default;
};

struct StatusReply {
    std::string text;

    bool operator==(const StatusReply&) const = default;
};

struct IntegerReply {
    int64_t value = 0;

    bool operator==(const IntegerReply&) const = default;
};

struct DoubleReply {
    double value = 0.0;

    bool operator==(const DoubleReply&) const = default;
};

struct BulkReply {
    std::string value;

    bool operator==(const BulkReply&) const = default;
};

struct ArrayReply {
    std::vector<Reply> items;

    bool operator==(const ArrayReply& other) const;
};

struct Reply {
    std::variant<NilReply, StatusReply, IntegerReply, DoubleReply, BulkReply, ArrayReply> value;

    bool operator==(const Reply&) const = default;
};

inline bool ArrayReply::operator==(const ArrayReply& other) const {
    return items == other.items;
}

// ── Builders ─────────────────────────────────────────────────────────────────

[[nodiscard]] inline Reply nil() { return Reply{NilReply{}}; }
[[nodiscard]] inline Reply ok() { return Reply{StatusReply{"OK"}}; }
[[nodiscard]] inline Reply status(std::string text) { return Reply{StatusReply{std::move(text)}}; }
[[nodiscard]] inline Reply integer(int64_t value) { return Reply{IntegerReply{value}}; }
[[nodiscard]] inline Reply number(double value) { return Reply{DoubleReply{value}}; }
[[nodiscard]] inline Reply bulk(std::string value) { return Reply{BulkReply{std::move(value)}}; }
[[nodiscard]] inline Reply array(std::vector<Reply> items = {}) { return Reply{ArrayReply{std::move(items)}}; }

[[nodiscard]] inline Reply boolean(bool value) { return integer(value ? 1 : 0); }

[[nodiscard]] inline Reply bulk_or_nil(std::optional<std::string> value) {
    return value ? bulk(std::move(*value)) : nil();
}

[[nodiscard]] Reply bulk_array(const std::vector<std::string>& values);
[[nodiscard]] Reply bulk_array(const std::vector<std::optional<std::string>>& values);

// ── Formatting ───────────────────────────────────────────────────────────────

// Human-readable rendering for the CLI:
//   (nil)   OK   (integer) 3   (double) 1.5   "value"
//   arrays as numbered lines, nested arrays indented.
[[nodiscard]] std::string format_reply(const Reply& reply);

} // namespace kvmock::command
