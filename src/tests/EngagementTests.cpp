#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "TestSupport.hpp"
#include "../core/Engagements.hpp"

using namespace skirmish::test;

namespace
{
    struct EngagementTest : ::testing::Test
    {
        BoxGeometry geometry;
        Notifier notifier;
        Battlefield field{K, geometry, notifier};

        auto At(float const x, PlayerId const owner, std::string name) -> CombatantId
        {
            return field.Spawn(Trooper(owner, {x, 0.0f, 0.0f}, std::move(name)));
        }

        // engagements as sets of names, independent of ids and ordering
        auto Named(std::vector<Engagement> const& es) const -> std::set<std::set<std::string>>
        {
            std::set<std::set<std::string>> out;
            for (Engagement const& e : es)
            {
                std::set<std::string> names;
                for (CombatantId const id : e.participants) names.insert(field.Get(id).Name());
                out.insert(names);
            }
            return out;
        }
    };
}

TEST(DisjointSet, Unite_And_Find)
{
    DisjointSet s(6);
    EXPECT_TRUE(s.Unite(0, 1));
    EXPECT_TRUE(s.Unite(2, 3));
    EXPECT_TRUE(s.Unite(1, 3));
    EXPECT_FALSE(s.Unite(0, 2));
    EXPECT_EQ(s.Find(0), s.Find(3));
    EXPECT_NE(s.Find(0), s.Find(4));
    EXPECT_NE(s.Find(4), s.Find(5));
}

TEST_F(EngagementTest, Transitive_Contact_Forms_One_Engagement)
{
    // 10 wide boxes, centres 10 apart touch
    CombatantId const a = At(0.0f, PlayerOne, "a");
    CombatantId const b = At(10.0f, PlayerTwo, "b");
    CombatantId const c = At(20.0f, PlayerOne, "c");
    At(100.0f, PlayerTwo, "loner");
    CombatantId const e = At(200.0f, PlayerOne, "e");
    CombatantId const f = At(205.0f, PlayerTwo, "f");

    std::vector<Engagement> const found = DiscoverEngagements(field);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].participants, (std::vector<CombatantId>{a, b, c}));
    EXPECT_EQ(found[1].participants, (std::vector<CombatantId>{e, f}));
    EXPECT_TRUE(found[0].Contains(b));
    EXPECT_FALSE(found[0].Contains(e));
}

TEST_F(EngagementTest, Rediscovery_Is_Idempotent)
{
    At(0.0f, PlayerOne, "a");
    At(10.0f, PlayerTwo, "b");
    At(50.0f, PlayerOne, "c");
    At(59.0f, PlayerTwo, "d");
    At(68.0f, PlayerTwo, "e");

    auto const first = DiscoverEngagements(field);
    auto const second = DiscoverEngagements(field);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i{}; i < first.size(); ++i) EXPECT_EQ(first[i].participants, second[i].participants);
}

TEST_F(EngagementTest, Spawn_Order_Does_Not_Change_Grouping)
{
    std::vector<std::pair<float, std::string>> layout{
        {0.0f, "a"}, {10.0f, "b"}, {50.0f, "c"}, {59.0f, "d"}, {68.0f, "e"}, {300.0f, "f"}};

    for (auto const& [x, name] : layout) At(x, PlayerOne, name);
    auto const forward = Named(DiscoverEngagements(field));

    Battlefield reversed{K, geometry, notifier};
    std::ranges::reverse(layout);
    for (auto const& [x, name] : layout) reversed.Spawn(Trooper(PlayerTwo, {x, 0.0f, 0.0f}, name));

    std::set<std::set<std::string>> backward;
    for (Engagement const& e : DiscoverEngagements(reversed))
    {
        std::set<std::string> names;
        for (CombatantId const id : e.participants) names.insert(reversed.Get(id).Name());
        backward.insert(names);
    }

    EXPECT_EQ(forward, backward);
    EXPECT_EQ(forward, (std::set<std::set<std::string>>{{"a", "b"}, {"c", "d", "e"}}));
}

TEST_F(EngagementTest, Removed_Combatants_Break_Chains)
{
    CombatantId const a = At(0.0f, PlayerOne, "a");
    CombatantId const b = At(10.0f, PlayerTwo, "b");
    CombatantId const c = At(20.0f, PlayerOne, "c");

    ASSERT_EQ(DiscoverEngagements(field).size(), 1u);
    field.Remove(b);
    EXPECT_TRUE(DiscoverEngagements(field).empty());
    EXPECT_NE(field.Find(a), nullptr);
    EXPECT_NE(field.Find(c), nullptr);
    EXPECT_EQ(field.Capacity(), 3u);
}
