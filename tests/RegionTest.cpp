#include <gtest/gtest.h>
#include "Region.h"
#include "SimulationSettings.h"
#include "World.h"
#include "TestSupport.h"
#include <stdexcept>

TEST(RegionTest, EdgesAccountForBorder)
{
    Region region("box", {100.0f, 50.0f}, {200.0f, 100.0f}, 2.0f);

    EXPECT_FLOAT_EQ(region.left(), 2.0f);
    EXPECT_FLOAT_EQ(region.right(), 198.0f);
    EXPECT_FLOAT_EQ(region.top(), 2.0f);
    EXPECT_FLOAT_EQ(region.bottom(), 98.0f);
    EXPECT_FALSE(region.isCommunity());
    EXPECT_FALSE(region.getHub().has_value());
}

TEST(RegionTest, CommunityHubSitsInBottomRightCorner)
{
    Region community = Region::community("c", {100.0f, 100.0f}, {200.0f, 200.0f}, 30.0f, 2.0f);

    ASSERT_TRUE(community.isCommunity());
    std::optional<sf::FloatRect> hub = community.getHub();
    ASSERT_TRUE(hub.has_value());
    EXPECT_FLOAT_EQ(hub->position.x, 168.0f);
    EXPECT_FLOAT_EQ(hub->position.y, 168.0f);
    EXPECT_FLOAT_EQ(hub->size.x, 30.0f);
    EXPECT_TRUE(community.contains(hub->getCenter()));
}

TEST(RegionTest, ResizeMovesEdgesAndHub)
{
    Region community = Region::community("c", {100.0f, 100.0f}, {200.0f, 200.0f}, 30.0f, 0.0f);
    community.resize({100.0f, 100.0f});

    EXPECT_FLOAT_EQ(community.left(), 50.0f);
    EXPECT_FLOAT_EQ(community.right(), 150.0f);
    EXPECT_FLOAT_EQ(community.getHub()->position.x, 120.0f);
}

TEST(WorldTest, EffectiveBoundsFollowActiveFlag)
{
    TestWorld test;
    Bounds bounds = test.leftBounds();

    EXPECT_EQ(test.world.getEffectiveBounds(bounds), test.left);
    test.world.setCommunitiesActive(false);
    EXPECT_EQ(test.world.getEffectiveBounds(bounds), test.field);
    test.world.setCommunitiesActive(true);
    EXPECT_EQ(test.world.getEffectiveBounds(bounds), test.left);
}

TEST(WorldTest, NextCommunityCyclesInOrder)
{
    TestWorld test;

    EXPECT_EQ(test.world.nextCommunity(), test.left);
    EXPECT_EQ(test.world.nextCommunity(), test.right);
    EXPECT_EQ(test.world.nextCommunity(), test.left);
}

TEST(WorldTest, CommunityLookupByPoint)
{
    TestWorld test;

    EXPECT_EQ(test.world.getCommunityAt({50.0f, 50.0f}), test.left);
    EXPECT_EQ(test.world.getCommunityAt({350.0f, 50.0f}), test.right);
    EXPECT_FALSE(test.world.getCommunityAt({500.0f, 50.0f}).has_value());
}

TEST(WorldTest, RejectsCommunityWithoutHub)
{
    World world;
    EXPECT_THROW(world.addCommunity(Region("plain", {0.0f, 0.0f}, {10.0f, 10.0f})), std::invalid_argument);
    EXPECT_THROW(world.nextCommunity(), std::logic_error);
}

TEST(WorldTest, DefaultLayoutPlacesFourCommunitiesInsideField)
{
    SimulationSettings settings;
    World world = World::createDefault(settings);

    ASSERT_EQ(world.getCommunities().size(), 4u);
    const Region &field = world.getRegion(world.getField());
    for (RegionId id : world.getCommunities())
    {
        const Region &community = world.getRegion(id);
        EXPECT_GE(community.left(), field.left());
        EXPECT_LE(community.right(), field.right());
        EXPECT_GE(community.top(), field.top());
        EXPECT_LE(community.bottom(), field.bottom());
        EXPECT_TRUE(community.isActive());
    }
    EXPECT_EQ(world.getRegion(world.getCommunities()[0]).getLabel(), "TL");
}
