#include <gtest/gtest.h>
#include <stepgraph/errors.hpp>
#include <stepgraph/grouped_deps.hpp>
#include "test_helpers.hpp"
#include <stdexcept>
#include <unordered_set>
#include <vector>

using namespace stepgraph;
using test_utils::key;

class GroupedDepsTest : public ::testing::Test {
protected:
    NodeKey a = key("f", "a");
    NodeKey b = key("f", "b");
    NodeKey c = key("f", "c");
    NodeKey d = key("g", "d");
    NodeKey e = key("g", "e");
};

TEST_F(GroupedDepsTest, EmptyStore) {
    GroupedDeps deps;
    EXPECT_TRUE(deps.is_empty());
    EXPECT_EQ(deps.num_groups(), 0u);
    EXPECT_EQ(deps.num_elements(), 0u);
    EXPECT_FALSE(deps.contains(a));
    EXPECT_TRUE(deps.compress().is_empty());
}

TEST_F(GroupedDepsTest, GroupsKeepRequestOrder) {
    GroupedDeps deps;
    deps.append_singleton(a);
    std::vector<NodeKey> group{b, c, d};
    deps.append_group(group);
    deps.append_singleton(e);

    EXPECT_EQ(deps.num_groups(), 3u);
    EXPECT_EQ(deps.num_elements(), 5u);

    auto first = deps.get_group(0);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], a);

    auto second = deps.get_group(1);
    ASSERT_EQ(second.size(), 3u);
    EXPECT_EQ(second[0], b);
    EXPECT_EQ(second[2], d);

    std::vector<NodeKey> flat(deps.all_elements().begin(), deps.all_elements().end());
    EXPECT_EQ(flat, (std::vector<NodeKey>{a, b, c, d, e}));

    std::size_t groups = 0;
    for (auto g : deps) {
        EXPECT_FALSE(g.empty());
        ++groups;
    }
    EXPECT_EQ(groups, 3u);
}

TEST_F(GroupedDepsTest, ReservingCapacityKeepsContents) {
    GroupedDeps deps;
    deps.append_singleton(a);
    deps.ensure_capacity_for_additional_groups(16);
    deps.append_singleton(b);

    EXPECT_EQ(deps.num_groups(), 2u);
    EXPECT_TRUE(deps.contains(a));
    EXPECT_TRUE(deps.contains(b));
}

TEST_F(GroupedDepsTest, EmptyGroupIsIgnored) {
    GroupedDeps deps;
    deps.append_group(std::vector<NodeKey>{});
    EXPECT_TRUE(deps.is_empty());
    EXPECT_EQ(deps.num_elements(), 0u);
}

TEST_F(GroupedDepsTest, GetGroupOutOfRangeThrows) {
    GroupedDeps deps;
    deps.append_singleton(a);
    EXPECT_THROW(deps.get_group(1), std::out_of_range);
}

TEST_F(GroupedDepsTest, OneKeyGroupIsStoredAsSingleton) {
    GroupedDeps via_group;
    via_group.append_group(std::vector<NodeKey>{a});
    GroupedDeps via_singleton;
    via_singleton.append_singleton(a);

    EXPECT_EQ(via_group, via_singleton);
    EXPECT_TRUE(via_group.compress().same_representation(via_singleton.compress()));
    EXPECT_EQ(via_group.compress().shape(), CompressedDeps::Shape::SINGLETON);
}

TEST_F(GroupedDepsTest, EqualityIgnoresOrderInsideGroups) {
    GroupedDeps first;
    first.append_group(std::vector<NodeKey>{a, b, c});
    first.append_singleton(d);

    GroupedDeps second;
    second.append_group(std::vector<NodeKey>{c, a, b});
    second.append_singleton(d);

    EXPECT_EQ(first, second);
}

TEST_F(GroupedDepsTest, EqualityRespectsGrouping) {
    GroupedDeps grouped;
    grouped.append_group(std::vector<NodeKey>{a, b});

    GroupedDeps split;
    split.append_singleton(a);
    split.append_singleton(b);

    GroupedDeps reordered_groups;
    reordered_groups.append_singleton(b);
    reordered_groups.append_singleton(a);

    EXPECT_NE(grouped, split);
    EXPECT_NE(split, reordered_groups);
}

TEST_F(GroupedDepsTest, HashIsUnsupported) {
    GroupedDeps deps;
    deps.append_singleton(a);
    EXPECT_THROW(deps.hash(), UnsupportedOperation);
    EXPECT_THROW(std::hash<GroupedDeps>{}(deps), UnsupportedOperation);
}

TEST_F(GroupedDepsTest, CompressRoundTripsShapes) {
    GroupedDeps empty;
    EXPECT_EQ(GroupedDeps::decompress(empty.compress()), empty);

    GroupedDeps single;
    single.append_singleton(a);
    auto single_compressed = single.compress();
    EXPECT_EQ(single_compressed.shape(), CompressedDeps::Shape::SINGLETON);
    EXPECT_EQ(GroupedDeps::decompress(single_compressed), single);

    GroupedDeps multiple;
    multiple.append_singleton(a);
    multiple.append_group(std::vector<NodeKey>{b, c});
    auto compressed = multiple.compress();
    EXPECT_EQ(compressed.shape(), CompressedDeps::Shape::MULTIPLE);
    EXPECT_EQ(compressed.num_groups(), 2u);
    EXPECT_EQ(compressed.num_elements(), 3u);
    EXPECT_EQ(compressed.to_vector(), (std::vector<NodeKey>{a, b, c}));

    auto restored = GroupedDeps::decompress(compressed);
    EXPECT_EQ(restored, multiple);
    EXPECT_EQ(restored.num_groups(), 2u);
    EXPECT_TRUE(restored.compress().same_representation(compressed));
}

TEST_F(GroupedDepsTest, SingleMultiKeyGroupCompressesToEntries) {
    GroupedDeps deps;
    deps.append_group(std::vector<NodeKey>{a, b});
    auto compressed = deps.compress();
    EXPECT_EQ(compressed.shape(), CompressedDeps::Shape::MULTIPLE);
    EXPECT_EQ(compressed.num_groups(), 1u);
    EXPECT_EQ(compressed.num_elements(), 2u);
}

TEST_F(GroupedDepsTest, CompressedIsIndependentOfLaterMutation) {
    GroupedDeps deps;
    deps.append_group(std::vector<NodeKey>{a, b});
    auto compressed = deps.compress();

    deps.append_singleton(c);
    deps.remove({a});

    EXPECT_EQ(compressed.num_elements(), 2u);
    EXPECT_EQ(compressed.to_vector(), (std::vector<NodeKey>{a, b}));
}

TEST_F(GroupedDepsTest, RemoveKeepsSurvivorOrderAndDropsEmptyGroups) {
    GroupedDeps deps;
    deps.append_singleton(a);
    deps.append_group(std::vector<NodeKey>{b, c, d});
    deps.append_singleton(e);

    deps.remove({a, c});

    EXPECT_EQ(deps.num_groups(), 2u);
    EXPECT_EQ(deps.num_elements(), 3u);
    auto group = deps.get_group(0);
    ASSERT_EQ(group.size(), 2u);
    EXPECT_EQ(group[0], b);
    EXPECT_EQ(group[1], d);
    EXPECT_EQ(deps.get_group(1)[0], e);
    EXPECT_FALSE(deps.contains(a));
    EXPECT_FALSE(deps.contains(c));
}

TEST_F(GroupedDepsTest, RemoveShrinksGroupToSingleton) {
    GroupedDeps deps;
    deps.append_group(std::vector<NodeKey>{a, b});
    deps.remove({a});

    GroupedDeps expected;
    expected.append_singleton(b);
    EXPECT_EQ(deps, expected);
    EXPECT_EQ(deps.compress().shape(), CompressedDeps::Shape::SINGLETON);
}

TEST_F(GroupedDepsTest, RemoveEverything) {
    GroupedDeps deps;
    deps.append_group(std::vector<NodeKey>{a, b});
    deps.append_singleton(c);
    deps.remove({a, b, c});
    EXPECT_TRUE(deps.is_empty());
    EXPECT_EQ(deps.num_elements(), 0u);
}

TEST_F(GroupedDepsTest, RemoveAbsentKeyThrowsAndLeavesStoreIntact) {
    GroupedDeps deps;
    deps.append_group(std::vector<NodeKey>{a, b});

    GroupedDeps before = deps;
    EXPECT_THROW(deps.remove({a, e}), InvariantViolation);
    EXPECT_EQ(deps, before);
    EXPECT_EQ(deps.num_elements(), 2u);
}

TEST_F(GroupedDepsTest, RemoveNothingIsNoop) {
    GroupedDeps deps;
    deps.append_singleton(a);
    deps.remove({});
    EXPECT_EQ(deps.num_elements(), 1u);
}

TEST_F(GroupedDepsTest, ToSetCollectsAllKeys) {
    GroupedDeps deps;
    deps.append_singleton(a);
    deps.append_group(std::vector<NodeKey>{b, c});
    EXPECT_EQ(deps.to_set(), (std::unordered_set<NodeKey>{a, b, c}));
}

TEST_F(GroupedDepsTest, HashSetVariantRejectsDuplicates) {
    GroupedDepsWithHashSet deps;
    deps.append_group(std::vector<NodeKey>{a, b});

    EXPECT_THROW(deps.append_singleton(a), InvariantViolation);
    EXPECT_THROW(deps.append_group(std::vector<NodeKey>{c, b}), InvariantViolation);

    // The rejected group left nothing behind
    EXPECT_FALSE(deps.contains(c));
    EXPECT_EQ(deps.num_elements(), 2u);
    deps.append_singleton(c);
    EXPECT_TRUE(deps.contains(c));
}

TEST_F(GroupedDepsTest, HashSetVariantTracksRemoval) {
    GroupedDepsWithHashSet deps;
    deps.append_group(std::vector<NodeKey>{a, b, c});
    deps.remove({b});

    EXPECT_FALSE(deps.contains(b));
    EXPECT_TRUE(deps.contains(a));
    EXPECT_EQ(deps.to_set(), (std::unordered_set<NodeKey>{a, c}));

    // A removed key can be depended on again
    deps.append_singleton(b);
    EXPECT_EQ(deps.num_groups(), 2u);
}

TEST_F(GroupedDepsTest, HashSetVariantEqualsPlainStore) {
    GroupedDepsWithHashSet with_set;
    with_set.append_group(std::vector<NodeKey>{a, b});

    GroupedDeps plain;
    plain.append_group(std::vector<NodeKey>{b, a});

    EXPECT_TRUE(with_set == plain);
}

TEST_F(GroupedDepsTest, CompressedForEachVisitsInGroupOrder) {
    GroupedDeps deps;
    deps.append_group(std::vector<NodeKey>{a, b});
    deps.append_singleton(c);

    std::vector<NodeKey> seen;
    deps.compress().for_each_element([&seen](const NodeKey& k) { seen.push_back(k); });
    EXPECT_EQ(seen, (std::vector<NodeKey>{a, b, c}));
}

TEST(NodeKeyTest, EqualityAndHash) {
    NodeKey first("compile", "main.cpp");
    NodeKey second("compile", "main.cpp");
    NodeKey other("link", "main.cpp");

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.hash(), second.hash());
    EXPECT_EQ(std::hash<NodeKey>{}(first), first.hash());
    EXPECT_NE(first, other);
    EXPECT_EQ(first.to_string(), "compile(main.cpp)");
}
