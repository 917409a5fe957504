#include "zset/sorted_set.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace kvmock::zset {

class SortedSetTest : public ::testing::Test {
protected:
    SortedSet set_;

    void fill_abc() {
        set_.insert("a", 1.0);
        set_.insert("b", 2.0);
        set_.insert("c", 3.0);
    }

    static std::vector<std::string> members(const std::vector<ScoredMember>& entries) {
        std::vector<std::string> out;
        for (const auto& e : entries) {
            out.push_back(e.member);
        }
        return out;
    }
};

// ── insert / remove ───────────────────────────────────────────────────────────

TEST_F(SortedSetTest, InsertReportsNewMembers) {
    EXPECT_TRUE(set_.insert("a", 1.0));
    EXPECT_TRUE(set_.insert("b", 2.0));
    EXPECT_EQ(set_.size(), 2u);
}

TEST_F(SortedSetTest, UpdateMovesMemberWithoutGrowing) {
    fill_abc();
    EXPECT_FALSE(set_.insert("a", 10.0));
    EXPECT_EQ(set_.size(), 3u);
    EXPECT_EQ(set_.score("a"), 10.0);
    EXPECT_EQ(set_.rank("a"), 2u);
    EXPECT_EQ(set_.rank("b"), 0u);
}

TEST_F(SortedSetTest, ReinsertWithSameScoreIsNotNew) {
    fill_abc();
    EXPECT_FALSE(set_.insert("b", 2.0));
    EXPECT_EQ(set_.size(), 3u);
}

TEST_F(SortedSetTest, RemoveShiftsRanks) {
    fill_abc();
    EXPECT_TRUE(set_.remove("a"));
    EXPECT_FALSE(set_.remove("a"));
    EXPECT_EQ(set_.size(), 2u);
    EXPECT_FALSE(set_.contains("a"));
    EXPECT_EQ(set_.rank("b"), 0u);
    EXPECT_EQ(set_.rank("c"), 1u);
}

TEST_F(SortedSetTest, AbsentMemberHasNoScoreOrRank) {
    EXPECT_FALSE(set_.score("x").has_value());
    EXPECT_FALSE(set_.rank("x").has_value());
    EXPECT_TRUE(set_.empty());
}

// ── Ordering ──────────────────────────────────────────────────────────────────

TEST_F(SortedSetTest, TiesAreOrderedByMember) {
    set_.insert("b", 1.0);
    set_.insert("a", 1.0);
    set_.insert("c", 0.0);
    EXPECT_EQ(members(set_.entries()), (std::vector<std::string>{"c", "a", "b"}));
}

TEST_F(SortedSetTest, RangeByRank) {
    fill_abc();
    EXPECT_EQ(members(set_.range(1, 2)), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(members(set_.range(0, 0)), (std::vector<std::string>{"a"}));
    EXPECT_TRUE(set_.range(2, 1).empty());
    EXPECT_TRUE(set_.range(5, 9).empty());
}

TEST_F(SortedSetTest, DescendingRangeCountsFromTheTop) {
    fill_abc();
    EXPECT_EQ(members(set_.range(0, 0, true)), (std::vector<std::string>{"c"}));
    EXPECT_EQ(members(set_.range(0, 1, true)), (std::vector<std::string>{"c", "b"}));
    EXPECT_EQ(members(set_.range(1, 2, true)), (std::vector<std::string>{"b", "a"}));
}

TEST_F(SortedSetTest, ScoreRangeIsInclusive) {
    fill_abc();
    EXPECT_EQ(members(set_.scorerange(1.0, 2.0)), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(members(set_.scorerange(-std::numeric_limits<double>::infinity(),
                                      std::numeric_limits<double>::infinity())),
              (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(set_.scorerange(3.0, 1.0).empty());
    EXPECT_TRUE(set_.scorerange(1.5, 1.9).empty());
}

TEST_F(SortedSetTest, CopyIsIndependent) {
    fill_abc();
    SortedSet copy = set_;
    copy.remove("a");
    copy.insert("d", 0.5);
    EXPECT_EQ(set_.size(), 3u);
    EXPECT_EQ(members(set_.entries()), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(members(copy.entries()), (std::vector<std::string>{"d", "b", "c"}));
}

// ── Randomised cross-checks ───────────────────────────────────────────────────

TEST_F(SortedSetTest, RankIsABijectionOverEntries) {
    std::mt19937 rng{7};
    std::uniform_int_distribution<int> score_dist{0, 50};
    for (int i = 0; i < 300; ++i) {
        set_.insert("m" + std::to_string(i), score_dist(rng));
    }
    const auto all = set_.entries();
    ASSERT_EQ(all.size(), set_.size());
    for (std::size_t r = 0; r < all.size(); ++r) {
        EXPECT_EQ(set_.rank(all[r].member), r);
    }
}

TEST_F(SortedSetTest, MatchesReferenceModelUnderChurn) {
    std::mt19937 rng{42};
    std::uniform_int_distribution<int> member_dist{0, 99};
    std::uniform_int_distribution<int> score_dist{-20, 20};
    std::uniform_int_distribution<int> op_dist{0, 2};

    std::set<std::pair<double, std::string>> model;
    std::map<std::string, double> scores;

    for (int step = 0; step < 2000; ++step) {
        const std::string member = "k" + std::to_string(member_dist(rng));
        if (op_dist(rng) == 0) {
            const bool removed = set_.remove(member);
            auto it = scores.find(member);
            EXPECT_EQ(removed, it != scores.end());
            if (it != scores.end()) {
                model.erase({it->second, member});
                scores.erase(it);
            }
        } else {
            const double score = score_dist(rng);
            const bool added = set_.insert(member, score);
            auto it = scores.find(member);
            EXPECT_EQ(added, it == scores.end());
            if (it != scores.end()) {
                model.erase({it->second, member});
            }
            model.insert({score, member});
            scores[member] = score;
        }
    }

    std::vector<ScoredMember> expected;
    for (const auto& [score, member] : model) {
        expected.push_back(ScoredMember{member, score});
    }
    EXPECT_EQ(set_.entries(), expected);
}

TEST_F(SortedSetTest, ScoreRangeAgreesWithFilteredEntries) {
    std::mt19937 rng{3};
    std::uniform_int_distribution<int> score_dist{0, 30};
    for (int i = 0; i < 100; ++i) {
        set_.insert("m" + std::to_string(i), score_dist(rng));
    }
    const auto all = set_.entries();
    for (int trial = 0; trial < 50; ++trial) {
        const double lo = score_dist(rng);
        const double hi = score_dist(rng);
        std::vector<ScoredMember> expected;
        std::copy_if(all.begin(), all.end(), std::back_inserter(expected),
                     [&](const ScoredMember& e) { return lo <= e.score && e.score <= hi; });
        EXPECT_EQ(set_.scorerange(lo, hi), expected) << "[" << lo << ", " << hi << "]";
    }
}

} // namespace kvmock::zset
