#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <optional>
#include <set>
#include <string_view>
#include <utility>

#include "Common/SortedHashArrayMap.hpp"

using namespace kirikae::collection;
using namespace std::string_view_literals;

namespace {

using KeyMap = SortedHashArrayMap<std::string_view, int, 4>;

const KeyMap& keyMap() {
    static const KeyMap map(
        std::pair{ "alpha"sv, 10 },
        std::pair{ "beta"sv, 20 },
        std::pair{ "gamma"sv, 30 },
        std::pair{ "Delta"sv, 40 });
    return map;
}

}  // namespace

TEST(SortedHashArrayMapTest, FindIndexReturnsDefinitionOrder) {
    EXPECT_EQ(keyMap().findIndex("alpha"sv), std::optional<std::size_t>(0));
    EXPECT_EQ(keyMap().findIndex("beta"sv), std::optional<std::size_t>(1));
    EXPECT_EQ(keyMap().findIndex("gamma"sv), std::optional<std::size_t>(2));
    EXPECT_EQ(keyMap().findIndex("Delta"sv), std::optional<std::size_t>(3));
    EXPECT_FALSE(keyMap().findIndex("delta"sv).has_value());
    EXPECT_FALSE(keyMap().findIndex(""sv).has_value());
}

TEST(SortedHashArrayMapTest, FindValue) {
    ASSERT_NE(keyMap().findValue("gamma"sv), nullptr);
    EXPECT_EQ(*keyMap().findValue("gamma"sv), 30);
    EXPECT_EQ(keyMap().findValue("GAMMA"sv), nullptr);
}

TEST(SortedHashArrayMapTest, FindIndexIgnoreCase) {
    EXPECT_EQ(keyMap().findIndexIgnoreCase("DELTA"), std::optional<std::size_t>(3));
    EXPECT_EQ(keyMap().findIndexIgnoreCase("Beta"), std::optional<std::size_t>(1));
    EXPECT_FALSE(keyMap().findIndexIgnoreCase("epsilon").has_value());

    // 大文字小文字だけが異なるキーは定義順で先のものを返す
    const SortedHashArrayMap<std::string_view, int, 3> map(
        std::pair{ "Key"sv, 1 },
        std::pair{ "key"sv, 2 },
        std::pair{ "KEY"sv, 3 });
    EXPECT_EQ(map.findIndexIgnoreCase("kEy"), std::optional<std::size_t>(0));
    EXPECT_EQ(map.findIndex("KEY"sv), std::optional<std::size_t>(2));
}

TEST(SortedHashArrayMapTest, BuildFromArrays) {
    const std::array<std::pair<std::string_view, int>, 2> array{ {
        { "x"sv, 1 },
        { "y"sv, 2 },
    } };
    const SortedHashArrayMap<std::string_view, int, 2> fromArray(array);
    EXPECT_EQ(fromArray.findIndex("y"sv), std::optional<std::size_t>(1));

    const std::pair<std::string_view, int> raw[] = { { "p"sv, 5 }, { "q"sv, 6 }, { "r"sv, 7 } };
    const SortedHashArrayMap<std::string_view, int, 3> fromRaw(raw);
    EXPECT_EQ(*fromRaw.findValue("r"sv), 7);
}

TEST(SortedHashArrayMapTest, MakeInfersTypes) {
    const auto map = makeSortedHashArrayMap(
        std::pair{ 3, "three"sv },
        std::pair{ 1, "one"sv });
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(*map.findValue(1), "one");
    EXPECT_EQ(map.findIndex(3), std::optional<std::size_t>(0));
    EXPECT_EQ(map.findValue(2), nullptr);
}

TEST(SortedHashArrayMapTest, IteratesEveryEntry) {
    std::set<std::size_t> indices;
    int total = 0;
    for (const auto& entry : keyMap()) {
        indices.insert(entry.originalIndex);
        total += entry.value;
    }
    EXPECT_EQ(keyMap().size(), 4u);
    EXPECT_EQ(indices, (std::set<std::size_t>{ 0, 1, 2, 3 }));
    EXPECT_EQ(total, 100);
}
