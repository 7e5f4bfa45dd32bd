/// @file test_ordered_map.cpp
/// @brief Unit tests for sfv::OrderedMap: keyed assignment, ordering, indices, equality.

#include <sfv/sfv.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace sfv;

using IntMap = OrderedMap<std::string, int>;

namespace {

std::vector<std::string> keys_of(const IntMap& m) {
    std::vector<std::string> out;
    for (const auto& [k, v] : m) out.push_back(k);
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Keyed access
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, EmptyByDefault) {
    IntMap m;
    EXPECT_TRUE(m.empty());
    EXPECT_EQ(m.size(), 0u);
    EXPECT_FALSE(m.get("a").has_value());
    EXPECT_EQ(m.find("a"), nullptr);
}

TEST(OrderedMap, SetThenGet) {
    IntMap m;
    m.set("a", 1);
    m.set("b", 2);
    ASSERT_TRUE(m.get("a").has_value());
    EXPECT_EQ(*m.get("a"), 1);
    EXPECT_EQ(*m.get("b"), 2);
    EXPECT_TRUE(m.contains("b"));
    EXPECT_FALSE(m.contains("c"));
}

TEST(OrderedMap, GetReturnsMostRecentSet) {
    IntMap m;
    m.set("a", 1);
    m.set("a", 2);
    m.set("a", 3);
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(*m.get("a"), 3);
}

TEST(OrderedMap, UnsetRemovesEntry) {
    IntMap m;
    m.set("a", 1);
    m.set("b", 2);
    m.set("a", std::nullopt);
    EXPECT_FALSE(m.get("a").has_value());
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b"}));
}

TEST(OrderedMap, UnsetAbsentKeyIsNoOp) {
    IntMap m;
    m.set("a", 1);
    m.set("zzz", std::nullopt);
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(*m.get("a"), 1);
}

TEST(OrderedMap, SetAfterUnsetRestoresValue) {
    IntMap m;
    m.set("a", 1);
    m.set("a", std::nullopt);
    m.set("a", 5);
    EXPECT_EQ(*m.get("a"), 5);
}

TEST(OrderedMap, RandomSetUnsetSequenceMatchesLastWrite) {
    IntMap m;
    std::vector<std::pair<std::string, std::optional<int>>> ops = {
        {"a", 1}, {"b", 2}, {"a", std::nullopt}, {"c", 3}, {"b", 4},
        {"a", 5}, {"c", std::nullopt}, {"d", 6}, {"d", 7}, {"b", std::nullopt},
    };
    for (const auto& [k, v] : ops) m.set(k, v);

    EXPECT_EQ(*m.get("a"), 5);
    EXPECT_FALSE(m.get("b").has_value());
    EXPECT_FALSE(m.get("c").has_value());
    EXPECT_EQ(*m.get("d"), 7);
    EXPECT_FALSE(m.get("never").has_value());
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "d"}));
}

TEST(OrderedMap, FindReturnsMutablePointer) {
    IntMap m;
    m.set("a", 1);
    int* p = m.find("a");
    ASSERT_NE(p, nullptr);
    *p = 10;
    EXPECT_EQ(*m.get("a"), 10);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Ordering
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, PreservesInsertionOrder) {
    IntMap m;
    m.set("z", 1);
    m.set("a", 2);
    m.set("m", 3);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"z", "a", "m"}));
}

TEST(OrderedMap, ReassignmentMovesEntryToEnd) {
    IntMap m;
    m.set("a", 1);
    m.set("b", 2);
    m.set("c", 3);
    EXPECT_EQ(m[m.start_index()].first, "a");

    m.set("a", 4);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_EQ(m[m.index_before(m.end_index())].first, "a");
    EXPECT_EQ(m[m.index_before(m.end_index())].second, 4);
}

TEST(OrderedMap, ReassignmentWithSameValueStillReorders) {
    IntMap m;
    m.set("a", 1);
    m.set("b", 2);
    m.set("a", 1);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "a"}));
}

TEST(OrderedMap, LiteralKeepsOrderAndDuplicates) {
    IntMap m{{"b", 1}, {"a", 2}, {"b", 3}};
    EXPECT_EQ(m.size(), 3u);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "a", "b"}));
    // Lookup sees the first match only.
    EXPECT_EQ(*m.get("b"), 1);
}

TEST(OrderedMap, SetOnLiteralDuplicateRemovesFirstMatchOnly) {
    IntMap m{{"b", 1}, {"a", 2}, {"b", 3}};
    m.set("b", 9);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b", "b"}));
    EXPECT_EQ(*m.get("b"), 3);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Index
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, IndexArithmetic) {
    IntMap m{{"a", 1}, {"b", 2}, {"c", 3}};
    auto start = m.start_index();
    auto end = m.end_index();
    EXPECT_EQ(start.distance_to(end), 3);
    EXPECT_EQ(end.distance_to(start), -3);
    EXPECT_LT(start, end);
    EXPECT_EQ(m.index_after(start), start.advanced_by(1));
    EXPECT_EQ(m.index(start, 2), m.index_before(end));
    EXPECT_EQ(m[m.index(start, 1)].first, "b");
    EXPECT_EQ(m[m.index(start, 2)].second, 3);
}

TEST(OrderedMap, EmptyMapStartEqualsEnd) {
    IntMap m;
    EXPECT_EQ(m.start_index(), m.end_index());
    EXPECT_EQ(m.start_index().distance_to(m.end_index()), 0);
}

TEST(OrderedMap, WalkByIndex) {
    IntMap m{{"a", 1}, {"b", 2}, {"c", 3}};
    int sum = 0;
    for (auto i = m.start_index(); i != m.end_index(); i = m.index_after(i))
        sum += m[i].second;
    EXPECT_EQ(sum, 6);
}

TEST(OrderedMap, AssignThroughIndexReplacesInPlace) {
    IntMap m{{"a", 1}, {"b", 2}};
    m[m.start_index()] = {"x", 9};
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"x", "b"}));
    EXPECT_EQ(*m.get("x"), 9);
    EXPECT_FALSE(m.contains("a"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Equality and hashing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, EqualWhenSameFinalSequence) {
    IntMap a;
    a.set("x", 1);
    a.set("y", 2);

    IntMap b;
    b.set("y", 0);
    b.set("x", 1);
    b.set("y", 2);  // moves y behind x

    EXPECT_EQ(a, b);
    EXPECT_EQ(a, (IntMap{{"x", 1}, {"y", 2}}));
}

TEST(OrderedMap, UnequalWhenOrderDiffers) {
    IntMap a{{"x", 1}, {"y", 2}};
    IntMap b{{"y", 2}, {"x", 1}};
    EXPECT_NE(a, b);
}

TEST(OrderedMap, UnequalWhenReassignmentReorders) {
    IntMap a;
    a.set("x", 1);
    a.set("y", 2);

    IntMap b = a;
    b.set("x", 1);  // same value, new position
    EXPECT_NE(a, b);
}

TEST(OrderedMap, UnequalWithLiteralDuplicates) {
    IntMap a{{"x", 1}, {"x", 1}};
    IntMap b{{"x", 1}};
    EXPECT_NE(a, b);
}

TEST(OrderedMap, HashFollowsEquality) {
    std::hash<IntMap> h;
    IntMap a{{"x", 1}, {"y", 2}};
    IntMap b;
    b.set("y", 2);
    b.set("x", 1);
    b.set("y", 2);
    EXPECT_EQ(a, b);
    EXPECT_EQ(h(a), h(b));

    IntMap swapped{{"y", 2}, {"x", 1}};
    EXPECT_NE(h(a), h(swapped));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Debug rendering
// ═══════════════════════════════════════════════════════════════════════════════

TEST(OrderedMap, DebugString) {
    IntMap m{{"a", 1}, {"b", 2}};
    EXPECT_EQ(m.to_debug_string(), "[a: 1, b: 2]");
    EXPECT_EQ(IntMap().to_debug_string(), "[]");
}

TEST(OrderedMap, ParametersDebugString) {
    Parameters p{{"q", Decimal::from_thousandths(900)}, {"lang", Token{"en"}}, {"x", true}};
    EXPECT_EQ(p.to_debug_string(), "[q: 0.900, lang: en, x: ?1]");
}
