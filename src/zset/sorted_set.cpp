#include "zset/sorted_set.hpp"

#include <algorithm>
#include <utility>

namespace kvmock::zset {

namespace {

// (score, member) total order.
bool key_less(double lscore, std::string_view lmember,
              double rscore, std::string_view rmember) noexcept {
    if (lscore != rscore) {
        return lscore < rscore;
    }
    return lmember < rmember;
}

template <typename NodeT>
int height_of(const NodeT* node) noexcept {
    return node ? node->height : 0;
}

template <typename NodeT>
std::size_t count_of(const NodeT* node) noexcept {
    return node ? node->count : 0;
}

} // namespace

// ── Copy / destroy ───────────────────────────────────────────────────────────

SortedSet::~SortedSet() = default;

SortedSet::SortedSet(const SortedSet& other)
    : root_(clone(other.root_.get()))
    , scores_(other.scores_)
{
}

SortedSet& SortedSet::operator=(const SortedSet& other) {
    if (this != &other) {
        root_   = clone(other.root_.get());
        scores_ = other.scores_;
    }
    return *this;
}

SortedSet::NodePtr SortedSet::clone(const Node* node) {
    if (!node) {
        return nullptr;
    }
    auto copy    = std::make_unique<Node>();
    copy->member = node->member;
    copy->score  = node->score;
    copy->height = node->height;
    copy->count  = node->count;
    copy->left   = clone(node->left.get());
    copy->right  = clone(node->right.get());
    return copy;
}

// ── Mutations ────────────────────────────────────────────────────────────────

bool SortedSet::insert(const std::string& member, double score) {
    auto it = scores_.find(member);
    if (it != scores_.end()) {
        if (it->second == score) {
            return false;
        }
        // Re-key the node: remove under the old score, insert under the new.
        root_ = erase_node(std::move(root_), it->second, member);
        root_ = insert_node(std::move(root_), member, score);
        it->second = score;
        return false;
    }

    root_ = insert_node(std::move(root_), member, score);
    scores_.emplace(member, score);
    return true;
}

bool SortedSet::remove(std::string_view member) {
    auto it = scores_.find(std::string(member));
    if (it == scores_.end()) {
        return false;
    }
    root_ = erase_node(std::move(root_), it->second, member);
    scores_.erase(it);
    return true;
}

// ── Queries ──────────────────────────────────────────────────────────────────

std::optional<double> SortedSet::score(std::string_view member) const {
    auto it = scores_.find(std::string(member));
    if (it == scores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SortedSet::contains(std::string_view member) const {
    return scores_.find(std::string(member)) != scores_.end();
}

std::optional<std::size_t> SortedSet::rank(std::string_view member) const {
    const auto s = score(member);
    if (!s) {
        return std::nullopt;
    }

    // Count the entries strictly less than (score, member).
    std::size_t rank = 0;
    const Node* node = root_.get();
    while (node) {
        if (key_less(*s, member, node->score, node->member)) {
            node = node->left.get();
        } else if (key_less(node->score, node->member, *s, member)) {
            rank += count_of(node->left.get()) + 1;
            node = node->right.get();
        } else {
            return rank + count_of(node->left.get());
        }
    }
    return std::nullopt; // index and tree disagree; unreachable
}

std::vector<ScoredMember> SortedSet::range(int64_t start, int64_t end,
                                           bool descending) const {
    std::vector<ScoredMember> out;
    const auto n = static_cast<int64_t>(size());
    if (n == 0 || start > end || start >= n || end < 0) {
        return out;
    }
    start = std::max<int64_t>(start, 0);
    end   = std::min<int64_t>(end, n - 1);

    if (!descending) {
        out.reserve(static_cast<std::size_t>(end - start + 1));
        collect_ranks(root_.get(), 0, static_cast<std::size_t>(start),
                      static_cast<std::size_t>(end), out);
        return out;
    }

    // Descending rank r maps to ascending rank n - 1 - r.
    const auto lo = static_cast<std::size_t>(n - 1 - end);
    const auto hi = static_cast<std::size_t>(n - 1 - start);
    out.reserve(hi - lo + 1);
    collect_ranks(root_.get(), 0, lo, hi, out);
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<ScoredMember> SortedSet::scorerange(double min, double max) const {
    std::vector<ScoredMember> out;
    if (min > max) {
        return out;
    }
    collect_scores(root_.get(), min, max, out);
    return out;
}

std::vector<ScoredMember> SortedSet::entries() const {
    if (empty()) {
        return {};
    }
    return range(0, static_cast<int64_t>(size()) - 1);
}

// ── Traversal helpers ────────────────────────────────────────────────────────

// In-order walk restricted to ascending ranks [lo, hi].  `offset` is the rank
// of the leftmost entry of this subtree.
void SortedSet::collect_ranks(const Node* node, std::size_t offset,
                              std::size_t lo, std::size_t hi,
                              std::vector<ScoredMember>& out) {
    if (!node) {
        return;
    }
    const std::size_t own = offset + count_of(node->left.get());
    if (lo < own) {
        collect_ranks(node->left.get(), offset, lo, hi, out);
    }
    if (lo <= own && own <= hi) {
        out.push_back(ScoredMember{node->member, node->score});
    }
    if (hi > own) {
        collect_ranks(node->right.get(), own + 1, lo, hi, out);
    }
}

void SortedSet::collect_scores(const Node* node, double min, double max,
                               std::vector<ScoredMember>& out) {
    if (!node) {
        return;
    }
    if (min <= node->score) {
        collect_scores(node->left.get(), min, max, out);
    }
    if (min <= node->score && node->score <= max) {
        out.push_back(ScoredMember{node->member, node->score});
    }
    if (node->score <= max) {
        collect_scores(node->right.get(), min, max, out);
    }
}

// ── AVL internals ────────────────────────────────────────────────────────────

void SortedSet::update(Node& node) noexcept {
    node.height = 1 + std::max(height_of(node.left.get()), height_of(node.right.get()));
    node.count  = 1 + count_of(node.left.get()) + count_of(node.right.get());
}

SortedSet::NodePtr SortedSet::rotate_left(NodePtr node) {
    NodePtr pivot = std::move(node->right);
    node->right   = std::move(pivot->left);
    update(*node);
    pivot->left = std::move(node);
    update(*pivot);
    return pivot;
}

SortedSet::NodePtr SortedSet::rotate_right(NodePtr node) {
    NodePtr pivot = std::move(node->left);
    node->left    = std::move(pivot->right);
    update(*node);
    pivot->right = std::move(node);
    update(*pivot);
    return pivot;
}

SortedSet::NodePtr SortedSet::rebalance(NodePtr node) {
    update(*node);
    const int balance = height_of(node->left.get()) - height_of(node->right.get());

    if (balance > 1) {
        if (height_of(node->left->left.get()) < height_of(node->left->right.get())) {
            node->left = rotate_left(std::move(node->left));
        }
        return rotate_right(std::move(node));
    }
    if (balance < -1) {
        if (height_of(node->right->right.get()) < height_of(node->right->left.get())) {
            node->right = rotate_right(std::move(node->right));
        }
        return rotate_left(std::move(node));
    }
    return node;
}

SortedSet::NodePtr SortedSet::insert_node(NodePtr node, const std::string& member,
                                          double score) {
    if (!node) {
        auto leaf    = std::make_unique<Node>();
        leaf->member = member;
        leaf->score  = score;
        return leaf;
    }
    if (key_less(score, member, node->score, node->member)) {
        node->left = insert_node(std::move(node->left), member, score);
    } else {
        node->right = insert_node(std::move(node->right), member, score);
    }
    return rebalance(std::move(node));
}

// Detach the minimum node of the subtree rooted at `node`, rebalancing the
// path back up.  Returns the detached node.
SortedSet::NodePtr SortedSet::take_min(NodePtr& node) {
    if (!node->left) {
        NodePtr min = std::move(node);
        node        = std::move(min->right);
        return min;
    }
    NodePtr min = take_min(node->left);
    node        = rebalance(std::move(node));
    return min;
}

SortedSet::NodePtr SortedSet::erase_node(NodePtr node, double score,
                                         std::string_view member) {
    if (!node) {
        return nullptr;
    }
    if (key_less(score, member, node->score, node->member)) {
        node->left = erase_node(std::move(node->left), score, member);
    } else if (key_less(node->score, node->member, score, member)) {
        node->right = erase_node(std::move(node->right), score, member);
    } else {
        if (!node->left) {
            return std::move(node->right);
        }
        if (!node->right) {
            return std::move(node->left);
        }
        NodePtr successor = take_min(node->right);
        successor->left   = std::move(node->left);
        successor->right  = std::move(node->right);
        node              = std::move(successor);
    }
    return rebalance(std::move(node));
}

} // namespace kvmock::zset
