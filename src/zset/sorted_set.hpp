#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kvmock::zset {

// A member together with its score, as returned by range queries.
struct ScoredMember {
    std::string member;
    double      score = 0.0;

    bool operator==(const ScoredMember&) const = default;
};

// ── SortedSet ────────────────────────────────────────────────────────────────
//
// Order-statistics index over unique members.  Entries are ordered by score
// ascending, ties broken by member in lexicographic (byte) order.
//
// Backing store: an AVL tree keyed by (score, member) whose nodes carry their
// subtree size, plus a hash index member → score.  insert/remove/rank are
// O(log n); range(i, j) is O(log n + j - i).
//
// NOT thread-safe; callers serialise access to the owning engine.

class SortedSet {
public:
    SortedSet() = default;
    ~SortedSet();

    SortedSet(const SortedSet& other);
    SortedSet& operator=(const SortedSet& other);
    SortedSet(SortedSet&&) noexcept            = default;
    SortedSet& operator=(SortedSet&&) noexcept = default;

    // Insert `member` or move it to `score`.
    // Returns true if the member was newly added, false if it already existed.
    bool insert(const std::string& member, double score);

    // Remove `member`.  Returns true if it was present.
    bool remove(std::string_view member);

    // Score of `member`, or std::nullopt if absent.
    [[nodiscard]] std::optional<double> score(std::string_view member) const;

    // 0-based ascending position of `member`, or std::nullopt if absent.
    [[nodiscard]] std::optional<std::size_t> rank(std::string_view member) const;

    // Entries whose rank lies in the inclusive interval [start, end].
    // Indices must already be translated (see store/range.hpp); an interval
    // with start > end yields nothing.  With `descending`, ranks are counted
    // from the highest entry and the result is returned highest first.
    [[nodiscard]] std::vector<ScoredMember> range(int64_t start, int64_t end,
                                                  bool descending = false) const;

    // Entries with min <= score <= max in ascending (score, member) order.
    [[nodiscard]] std::vector<ScoredMember> scorerange(double min, double max) const;

    // Every entry in ascending order.
    [[nodiscard]] std::vector<ScoredMember> entries() const;

    [[nodiscard]] bool contains(std::string_view member) const;
    [[nodiscard]] std::size_t size() const noexcept { return scores_.size(); }
    [[nodiscard]] bool empty() const noexcept { return scores_.empty(); }

private:
    struct Node {
        std::string           member;
        double                score = 0.0;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
        int                   height = 1;
        std::size_t           count  = 1; // nodes in this subtree
    };

    using NodePtr = std::unique_ptr<Node>;

    static NodePtr insert_node(NodePtr node, const std::string& member, double score);
    static NodePtr erase_node(NodePtr node, double score, std::string_view member);
    static NodePtr take_min(NodePtr& node);
    static NodePtr rebalance(NodePtr node);
    static NodePtr rotate_left(NodePtr node);
    static NodePtr rotate_right(NodePtr node);
    static void    update(Node& node) noexcept;
    static NodePtr clone(const Node* node);

    static void collect_ranks(const Node* node, std::size_t offset,
                              std::size_t lo, std::size_t hi,
                              std::vector<ScoredMember>& out);
    static void collect_scores(const Node* node, double min, double max,
                               std::vector<ScoredMember>& out);

    NodePtr root_;
    std::unordered_map<std::string, double> scores_;
};

} // namespace kvmock::zset
