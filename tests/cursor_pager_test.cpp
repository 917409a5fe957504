#include "scan/cursor_pager.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "test_util.hpp"

namespace kvmock::scan {

class CursorPagerTest : public ::testing::Test {
protected:
    static std::vector<std::string> numbered(int n) {
        std::vector<std::string> out;
        for (int i = 0; i < n; ++i) {
            out.push_back("k" + std::to_string(100 + i));
        }
        return out;
    }
};

// ── Full enumeration ──────────────────────────────────────────────────────────

TEST_F(CursorPagerTest, VisitsEveryElementExactlyOnce) {
    const auto items = numbered(25);
    std::set<std::string> seen;
    std::string cursor = "0";
    int pages = 0;
    do {
        auto page = next_page([&] { return items; }, cursor, 7, std::nullopt);
        for (auto& item : page.items) {
            EXPECT_TRUE(seen.insert(item).second) << "duplicate " << item;
        }
        cursor = page.cursor;
        ++pages;
    } while (cursor != "0");

    EXPECT_EQ(pages, 4);
    EXPECT_EQ(seen.size(), items.size());
}

TEST_F(CursorPagerTest, ExactMultipleEndsOnLastFullPage) {
    const auto items = numbered(20);
    auto first = next_page([&] { return items; }, "0", 10, std::nullopt);
    EXPECT_EQ(first.cursor, "10");
    EXPECT_EQ(first.items.size(), 10u);

    auto second = next_page([&] { return items; }, first.cursor, 10, std::nullopt);
    EXPECT_EQ(second.cursor, "0");
    EXPECT_EQ(second.items.size(), 10u);
}

TEST_F(CursorPagerTest, CursorPastTheEndYieldsEmptyFinalPage) {
    const auto items = numbered(3);
    auto page = next_page([&] { return items; }, "50", 10, std::nullopt);
    EXPECT_EQ(page.cursor, "0");
    EXPECT_TRUE(page.items.empty());
}

TEST_F(CursorPagerTest, EmptySnapshot) {
    auto page = next_page([] { return std::vector<std::string>{}; }, "0", 10, std::nullopt);
    EXPECT_EQ(page.cursor, "0");
    EXPECT_TRUE(page.items.empty());
}

// ── Filtering ─────────────────────────────────────────────────────────────────

TEST_F(CursorPagerTest, PatternFiltersAfterSlicing) {
    const std::vector<std::string> items{"a1", "b1", "a2", "b2"};
    const std::optional<std::string> pattern{"a*"};

    auto first = next_page([&] { return items; }, "0", 2, pattern);
    EXPECT_EQ(first.cursor, "2");
    EXPECT_EQ(first.items, (std::vector<std::string>{"a1"}));

    auto second = next_page([&] { return items; }, first.cursor, 2, pattern);
    EXPECT_EQ(second.cursor, "0");
    EXPECT_EQ(second.items, (std::vector<std::string>{"a2"}));
}

TEST_F(CursorPagerTest, KeyExtractorSelectsMatchedField) {
    using Entry = std::pair<std::string, double>;
    const std::vector<Entry> items{{"apple", 1.0}, {"banana", 2.0}, {"avocado", 3.0}};
    auto page = next_page([&] { return items; }, "0", 10, std::optional<std::string>{"a*"},
                          [](const Entry& e) -> const std::string& { return e.first; });
    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.items[0].first, "apple");
    EXPECT_EQ(page.items[1].first, "avocado");
}

TEST_F(CursorPagerTest, SnapshotIsTakenOnEveryCall) {
    int calls = 0;
    auto producer = [&] {
        ++calls;
        return numbered(5);
    };
    static_cast<void>(next_page(producer, "0", 2, std::nullopt));
    static_cast<void>(next_page(producer, "2", 2, std::nullopt));
    EXPECT_EQ(calls, 2);
}

// ── Validation ────────────────────────────────────────────────────────────────

TEST_F(CursorPagerTest, NonPositiveCountIsRejected) {
    const auto items = numbered(3);
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument,
                        next_page([&] { return items; }, "0", 0, std::nullopt));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument,
                        next_page([&] { return items; }, "0", -5, std::nullopt));
}

TEST_F(CursorPagerTest, MalformedCursorIsRejected) {
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, parse_cursor("abc"));
    EXPECT_KVMOCK_ERROR(ErrorKind::InvalidArgument, parse_cursor("-1"));
    EXPECT_EQ(parse_cursor("17"), 17u);
}

} // namespace kvmock::scan
