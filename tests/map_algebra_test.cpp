#include "ordered_map.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ordmap {
namespace {

using Map = OrderedMap<int, std::string>;
using Alist = std::vector<std::pair<int, std::string>>;
using Case = MergeCase<std::string, std::string>;

auto sameString = [](const std::string& a, const std::string& b) { return a == b; };

TEST(MapAlgebra, MergeSeesEveryKeyOnce) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}, {4, "d"}});
    Map y = Map::ofAlist({{2, "B"}, {3, "C"}, {4, "d"}});

    std::vector<std::pair<int, MergeSide>> seen;
    auto merged = x.merge(y, [&seen](int k, const Case& side) {
        seen.emplace_back(k, side.side());
        std::string label = side.hasLeft() ? side.leftValue() : std::string("-");
        label += side.hasRight() ? side.rightValue() : std::string("-");
        return std::optional<std::string>(label);
    });

    std::vector<std::pair<int, MergeSide>> expected = {
        {1, MergeSide::Left}, {2, MergeSide::Both}, {3, MergeSide::Right}, {4, MergeSide::Both}};
    EXPECT_EQ(seen, expected);
    EXPECT_EQ(merged.toAlist(), Alist({{1, "a-"}, {2, "bB"}, {3, "-C"}, {4, "dd"}}));
    EXPECT_EQ(merged.length(), 4u);
}

TEST(MapAlgebra, MergeCanChangeValueTypeAndDropKeys) {
    Map x = Map::ofAlist({{1, "a"}, {2, "bb"}});
    OrderedMap<int, int> y = OrderedMap<int, int>::ofAlist({{2, 20}, {3, 30}});

    OrderedMap<int, std::size_t> merged = x.merge(y, [](int, const MergeCase<std::string, int>& side) {
        if (!side.isBoth()) return std::optional<std::size_t>();
        return std::optional<std::size_t>(side.leftValue().size() + static_cast<std::size_t>(side.rightValue()));
    });
    EXPECT_EQ(merged.length(), 1u);
    EXPECT_EQ(merged.find(2), std::optional<std::size_t>(22));
}

TEST(MapAlgebra, MergeEndoReturnsSameMapWhenLeftWins) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}, {3, "c"}});
    Map y = Map::ofAlist({{2, "B"}, {5, "E"}});

    auto keepLeft = [](int, const Case& side) -> std::optional<std::string> {
        if (side.hasLeft()) return side.leftValue();
        return std::nullopt;
    };
    EXPECT_TRUE(x.mergeEndo(y, keepLeft).isSame(x));
    EXPECT_TRUE(x.mergeEndo(Map::empty(), keepLeft).isSame(x));
}

TEST(MapAlgebra, MergeEndoRebuildsOnChange) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}});
    Map y = Map::ofAlist({{2, "B"}, {3, "C"}});

    auto preferRight = [](int, const Case& side) -> std::optional<std::string> {
        return side.hasRight() ? side.rightValue() : side.leftValue();
    };
    Map merged = x.mergeEndo(y, preferRight);
    EXPECT_FALSE(merged.isSame(x));
    EXPECT_EQ(merged.toAlist(), Alist({{1, "a"}, {2, "B"}, {3, "C"}}));

    auto dropLeftOnly = [](int, const Case& side) -> std::optional<std::string> {
        if (side.isLeft()) return std::nullopt;
        return side.hasLeft() ? side.leftValue() : side.rightValue();
    };
    Map dropped = x.mergeEndo(y, dropLeftOnly);
    EXPECT_EQ(dropped.toAlist(), Alist({{2, "b"}, {3, "C"}}));
    EXPECT_EQ(dropped.length(), 2u);
}

TEST(MapAlgebra, MergeEndoComparesPointersByIdentity) {
    using Ptrs = OrderedMap<int, std::shared_ptr<int>>;
    using PtrCase = MergeCase<std::shared_ptr<int>, std::shared_ptr<int>>;
    Ptrs x = Ptrs::ofAlist({{1, std::make_shared<int>(1)}});
    Ptrs y = Ptrs::ofAlist({{1, std::make_shared<int>(1)}});

    Ptrs kept = x.mergeEndo(y, [](int, const PtrCase& side) { return std::make_optional(side.leftValue()); });
    EXPECT_TRUE(kept.isSame(x));

    // Equal pointees, distinct objects.
    Ptrs taken = x.mergeEndo(y, [](int, const PtrCase& side) { return std::make_optional(side.rightValue()); });
    EXPECT_FALSE(taken.isSame(x));
}

TEST(MapAlgebra, MergeEndoIgnoresDroppedRightOnlyKeys) {
    Map x = Map::ofAlist({{1, "a"}});
    Map y = Map::ofAlist({{2, "B"}, {3, "C"}});

    Map merged = x.mergeEndo(y, [](int, const Case& side) -> std::optional<std::string> {
        if (side.isRight()) return std::nullopt;
        return side.leftValue();
    });
    EXPECT_TRUE(merged.isSame(x));
    EXPECT_EQ(merged.toAlist(), Alist({{1, "a"}}));
}

TEST(MapAlgebra, MergeEndoTakesValuesThatOnlyCompareEqual) {
    struct Tagged {
        int id;
        std::string tag;
        bool operator==(const Tagged& other) const { return id == other.id; }
    };
    using Tags = OrderedMap<int, Tagged>;
    using TagCase = MergeCase<Tagged, Tagged>;

    Tags x = Tags::ofAlist({{1, Tagged{1, "old"}}});
    Tags y = Tags::ofAlist({{1, Tagged{1, "new"}}});
    ASSERT_TRUE(x.findExn(1) == y.findExn(1));

    Tags merged = x.mergeEndo(y, [](int, const TagCase& side) { return std::make_optional(side.rightValue()); });
    EXPECT_FALSE(merged.isSame(x));
    EXPECT_EQ(merged.findExn(1).tag, "new");
}

TEST(MapAlgebra, UnionResolvesConflicts) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}});
    Map y = Map::ofAlist({{2, "B"}, {3, "C"}});

    Map joined = x.unionWith(y, [](int, const std::string& l, const std::string& r) {
        return std::optional<std::string>(l + r);
    });
    EXPECT_EQ(joined.toAlist(), Alist({{1, "a"}, {2, "bB"}, {3, "C"}}));

    Map withoutConflicts = x.unionWith(y, [](int, const std::string&, const std::string&) {
        return std::optional<std::string>();
    });
    EXPECT_EQ(withoutConflicts.toAlist(), Alist({{1, "a"}, {3, "C"}}));
    EXPECT_EQ(withoutConflicts.length(), 2u);

    auto never = [](int, const std::string&, const std::string&) { return std::optional<std::string>(); };
    EXPECT_TRUE(x.unionWith(Map::empty(), never).isSame(x));
    EXPECT_TRUE(Map::empty().unionWith(y, never).isSame(y));
}

TEST(MapAlgebra, MergeSkewedCombinesEveryConflict) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}, {3, "c"}});
    Map y = Map::ofAlist({{3, "C"}, {4, "D"}});

    Map skewed = x.mergeSkewed(y, [](int k, const std::string& l, const std::string& r) {
        return l + std::to_string(k) + r;
    });
    EXPECT_EQ(skewed.toAlist(), Alist({{1, "a"}, {2, "b"}, {3, "c3C"}, {4, "D"}}));
    EXPECT_EQ(skewed.length(), 4u);
}

TEST(MapAlgebra, Iter2WalksBothMapsInKeyOrder) {
    Map x = Map::ofAlist({{1, "a"}, {3, "c"}});
    OrderedMap<int, int> y = OrderedMap<int, int>::ofAlist({{2, 2}, {3, 3}});

    std::string trace;
    x.iter2(y, [&trace](int k, const MergeCase<std::string, int>& side) {
        trace += std::to_string(k);
        trace += side.isLeft() ? "L" : (side.isRight() ? "R" : "B");
    });
    EXPECT_EQ(trace, "1L2R3B");
}

TEST(MapAlgebra, PartitionSplitsByPredicate) {
    Map m = Map::ofAlist({{1, "a"}, {2, "b"}, {3, "c"}, {4, "d"}});
    auto parts = m.partition([](int k, const std::string&) { return k % 2 == 0; });

    EXPECT_EQ(parts.first.toAlist(), Alist({{2, "b"}, {4, "d"}}));
    EXPECT_EQ(parts.second.toAlist(), Alist({{1, "a"}, {3, "c"}}));
    EXPECT_EQ(parts.first.length(), 2u);
    EXPECT_EQ(parts.second.length(), 2u);

    auto everything = m.partition([](int, const std::string&) { return true; });
    EXPECT_TRUE(everything.first.isSame(m));
    EXPECT_TRUE(everything.second.isEmpty());
}

TEST(MapAlgebra, SymmetricDiffWithSelfIsEmpty) {
    Map m = Map::ofAlist({{1, "a"}, {2, "b"}});
    EXPECT_TRUE(m.symmetricDiff(m, sameString).empty());
    EXPECT_TRUE(m.symmetricDiff(Map::ofAlist({{2, "b"}, {1, "a"}}), sameString).empty());
}

TEST(MapAlgebra, SymmetricDiffReportsEachSide) {
    Map empty = Map::empty();
    Map one = Map::singleton(1, "x");

    auto added = empty.symmetricDiff(one, sameString);
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].first, 1);
    ASSERT_TRUE(std::holds_alternative<OnlyRight<std::string>>(added[0].second));
    EXPECT_EQ(std::get<OnlyRight<std::string>>(added[0].second).value, "x");

    auto removed = one.symmetricDiff(empty, sameString);
    ASSERT_EQ(removed.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<OnlyLeft<std::string>>(removed[0].second));
    EXPECT_EQ(std::get<OnlyLeft<std::string>>(removed[0].second).value, "x");
}

TEST(MapAlgebra, SymmetricDiffReportsUnequalData) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}, {3, "c"}});
    Map y = Map::ofAlist({{2, "B"}, {3, "c"}, {4, "d"}});

    auto diff = x.symmetricDiff(y, sameString);
    ASSERT_EQ(diff.size(), 3u);
    EXPECT_EQ(diff[0].first, 1);
    EXPECT_TRUE(std::holds_alternative<OnlyLeft<std::string>>(diff[0].second));

    EXPECT_EQ(diff[1].first, 2);
    ASSERT_TRUE(std::holds_alternative<Unequal<std::string>>(diff[1].second));
    const Unequal<std::string>& changed = std::get<Unequal<std::string>>(diff[1].second);
    EXPECT_EQ(changed.left, "b");
    EXPECT_EQ(changed.right, "B");

    EXPECT_EQ(diff[2].first, 4);
    EXPECT_TRUE(std::holds_alternative<OnlyRight<std::string>>(diff[2].second));

    auto ignoreCase = [](const std::string& a, const std::string& b) {
        return a.size() == b.size() && std::tolower(a[0]) == std::tolower(b[0]);
    };
    EXPECT_EQ(x.symmetricDiff(y, ignoreCase).size(), 2u);
}

} // namespace
} // namespace ordmap
