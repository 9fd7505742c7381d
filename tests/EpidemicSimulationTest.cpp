#include <gtest/gtest.h>
#include "EpidemicSimulation.h"
#include "TestSupport.h"
#include <map>

namespace
{
    SimulationSettings smallSettings(int population)
    {
        SimulationSettings settings = quietSettings();
        settings.initialPopulation = population;
        return settings;
    }

    int travelerCount(const EpidemicSimulation &sim)
    {
        int count = 0;
        for (const Person &person : sim.getPopulation().getPersons())
        {
            if (person.isTraveling())
                ++count;
        }
        return count;
    }

    bool legalTransition(Person::State from, Person::State to)
    {
        using State = Person::State;
        if (from == to)
            return true;
        switch (from)
        {
        case State::Susceptible:
            return to == State::Infected;
        case State::Infected:
            return to == State::Recovered || to == State::Deceased;
        case State::Recovered:
            return to == State::Infected;
        default:
            return false;
        }
    }
}

TEST(EpidemicSimulationTest, SpawnsInitialPopulationRoundRobin)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(20), clock);

    ASSERT_EQ(sim.getPopulation().size(), 20u);
    for (RegionId community : sim.getWorld().getCommunities())
    {
        int members = 0;
        for (const Person &person : sim.getPopulation().getPersons())
        {
            if (person.getBounds().community == community)
                ++members;
        }
        EXPECT_EQ(members, 5);
    }
}

TEST(EpidemicSimulationTest, DistancingPercentChangeRebalancesOnce)
{
    ManualClock clock;
    SimulationSettings settings = smallSettings(20);
    settings.travelingEnabled = false;
    EpidemicSimulation sim(settings, clock);
    ASSERT_EQ(sim.getPopulation().getDistancerCount(), 20);

    sim.getControls().distancingPercent.set(30.0f);
    clock.advance(0.1);
    sim.update(0.1f);
    EXPECT_EQ(sim.getPopulation().getDistancerCount(), 6);

    // without another control change nobody is reassigned
    Person &somebody = sim.getPopulation().getPersons().front();
    somebody.setDistancing(!somebody.isDistancing());
    int adjusted = sim.getPopulation().getDistancerCount();
    clock.advance(0.1);
    sim.update(0.1f);
    EXPECT_EQ(sim.getPopulation().getDistancerCount(), adjusted);
}

TEST(EpidemicSimulationTest, TogglesMarkChartOnlyOnChange)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(4), clock);
    ASSERT_FALSE(sim.getControls().distancingEnabled);

    sim.setDistancingEnabled(false);
    EXPECT_FALSE(sim.getChart().getPendingMarker().has_value());

    sim.setDistancingEnabled(true);
    ASSERT_TRUE(sim.getChart().getPendingMarker().has_value());
    EXPECT_EQ(*sim.getChart().getPendingMarker(), EpidemicSimulation::DISTANCING_EVENT_COLOR);

    clock.advance(1.0);
    sim.update(1.0f / 60.0f);
    ASSERT_TRUE(sim.getChart().getData().back().marker.has_value());

    sim.setTravelingEnabled(false);
    EXPECT_EQ(*sim.getChart().getPendingMarker(), EpidemicSimulation::TRAVELING_EVENT_COLOR);
}

TEST(EpidemicSimulationTest, DispatchesTravelerOnInterval)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(12), clock);

    clock.set(1.0);
    sim.update(1.0f / 60.0f);
    EXPECT_EQ(travelerCount(sim), 0);

    clock.set(2.0);
    sim.update(1.0f / 60.0f);
    EXPECT_EQ(travelerCount(sim), 1);

    sim.setTravelingEnabled(false);
    clock.set(4.5);
    sim.update(1.0f / 60.0f);
    EXPECT_LE(travelerCount(sim), 1);
}

TEST(EpidemicSimulationTest, NoTravelWhileCommunitiesDisabled)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(12), clock);
    sim.setCommunitiesEnabled(false);

    for (int second = 1; second <= 10; ++second)
    {
        clock.set(second);
        sim.update(1.0f / 60.0f);
    }
    EXPECT_EQ(travelerCount(sim), 0);
}

TEST(EpidemicSimulationTest, DisablingCommunitiesWidensBoundsToField)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(8), clock);
    const World &world = sim.getWorld();
    const Person &person = sim.getPopulation().getPersons().front();

    EXPECT_EQ(world.getEffectiveBounds(person.getBounds()), person.getBounds().community);
    sim.setCommunitiesEnabled(false);
    EXPECT_EQ(world.getEffectiveBounds(person.getBounds()), world.getField());
    sim.setCommunitiesEnabled(true);
    EXPECT_EQ(world.getEffectiveBounds(person.getBounds()), person.getBounds().community);
}

TEST(EpidemicSimulationTest, AddPersonAtUsesHoveredCommunity)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(0), clock);
    const World &world = sim.getWorld();
    RegionId bottomRight = world.getCommunities()[2];
    sf::Vector2f inside = world.getRegion(bottomRight).getCenter();

    ASSERT_TRUE(sim.addPersonAt(inside));
    EXPECT_EQ(sim.getPopulation().getPersons().back().getBounds().community, bottomRight);

    sf::Vector2f panelPoint = world.getRegion(world.getPanel()).getCenter();
    EXPECT_FALSE(sim.addPersonAt(panelPoint));
    EXPECT_EQ(sim.getPopulation().size(), 1u);
}

TEST(EpidemicSimulationTest, BatchOperations)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(0), clock);

    sim.addPersons(EpidemicSimulation::BATCH_SIZE);
    EXPECT_EQ(sim.getPopulation().size(), 10u);
    EXPECT_EQ(sim.removePersons(EpidemicSimulation::BATCH_SIZE), 10);
    EXPECT_TRUE(sim.getPopulation().empty());
}

TEST(EpidemicSimulationTest, OperationsOnEmptyPopulation)
{
    ManualClock clock;
    EpidemicSimulation sim(smallSettings(0), clock);

    EXPECT_FALSE(sim.infectOne().has_value());
    EXPECT_FALSE(sim.travelOne().has_value());
    EXPECT_EQ(sim.removePersons(10), 0);
    EXPECT_NO_THROW(sim.randomizeDistancers());

    clock.advance(1.0);
    EXPECT_NO_THROW(sim.update(1.0f / 60.0f));
    for (float fraction : sim.getChart().getData().back().fractions)
    {
        EXPECT_FLOAT_EQ(fraction, 0.0f);
    }
}

TEST(EpidemicSimulationTest, WorldWithoutCommunitiesSpawnsNobody)
{
    ManualClock clock;
    World world;
    RegionId field = world.addRegion(Region("Field", {100.0f, 100.0f}, {200.0f, 200.0f}));
    world.setField(field);
    world.setPanel(field);

    EpidemicSimulation sim(smallSettings(10), clock, std::move(world));
    EXPECT_TRUE(sim.getPopulation().empty());
    EXPECT_FALSE(sim.addPersonAt({100.0f, 100.0f}));
}

TEST(EpidemicSimulationTest, LongRunKeepsStatesAndBoundsConsistent)
{
    ManualClock clock;
    SimulationSettings settings = smallSettings(80);
    settings.maxInfectionDuration = 5.0f;
    settings.infectionEventInterval = 0.5f;
    settings.earlyTerminationChance = 0.0f;
    settings.spreadChance = 1.0f;
    settings.distancingEnabled = true;
    settings.distancingPercent = 50.0f;
    EpidemicSimulation sim(settings, clock);

    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(sim.infectOne().has_value());
    }

    std::map<int, Person::State> previous;
    for (const Person &person : sim.getPopulation().getPersons())
    {
        previous[person.getId()] = person.getState();
    }

    const float frameTime = 1.0f / 60.0f;
    for (int tick = 0; tick < 1200; ++tick)
    {
        clock.advance(frameTime);
        sim.update(frameTime);

        for (const Person &person : sim.getPopulation().getPersons())
        {
            Person::State before = previous[person.getId()];
            ASSERT_TRUE(legalTransition(before, person.getState()))
                << "person " << person.getId() << ": " << Person::stateName(before)
                << " -> " << Person::stateName(person.getState());
            previous[person.getId()] = person.getState();

            if (person.isTraveling())
                continue;
            const Region &bounds = sim.getWorld().getEffectiveRegion(person.getBounds());
            sf::Vector2f p = person.getPosition();
            ASSERT_GE(p.x, bounds.left() - 1e-3f);
            ASSERT_LE(p.x, bounds.right() + 1e-3f);
            ASSERT_GE(p.y, bounds.top() - 1e-3f);
            ASSERT_LE(p.y, bounds.bottom() + 1e-3f);
        }
        ASSERT_EQ(sim.getChart().getData().size(), static_cast<size_t>(settings.chartWidth));
    }

    EXPECT_EQ(sim.getTickCount(), 1200u);
    StateCounts counts = sim.getPopulation().getCounts();
    EXPECT_EQ(counts[0] + counts[1] + counts[2] + counts[3], 80);
}
