#include "EpidemicSimulation.h"
#include <iostream>

const sf::Color EpidemicSimulation::DISTANCING_EVENT_COLOR = sf::Color(0, 255, 255);
const sf::Color EpidemicSimulation::TRAVELING_EVENT_COLOR = sf::Color(255, 128, 0);

namespace
{
    SimulationSettings validated(SimulationSettings settings)
    {
        settings.validateAndClamp();
        return settings;
    }

    std::mt19937 makeRng(unsigned int seed)
    {
        return std::mt19937(seed != 0 ? seed : std::random_device{}());
    }
}

EpidemicSimulation::EpidemicSimulation(const SimulationSettings &settings, const SimulationClock &clock)
    : EpidemicSimulation(settings, clock, World::createDefault(validated(settings)))
{
}

EpidemicSimulation::EpidemicSimulation(const SimulationSettings &settings, const SimulationClock &clock, World world)
    : settings_(validated(settings)),
      clock_(clock),
      rng_(makeRng(settings_.seed)),
      controls_(Controls::fromSettings(settings_)),
      world_(std::move(world)),
      population_(settings_.distancingRadius),
      chart_(settings_.chartWidth, Chart::defaultSeries(), settings_.chartUpdateInterval,
             settings_.chartSnapshotWidth, clock.now()),
      startTime_(clock.now()),
      nextTravelTime_(clock.now() + settings_.travelInterval)
{
    world_.setCommunitiesActive(controls_.communitiesEnabled);

    if (world_.getCommunities().empty())
    {
        std::cerr << "Warning: world has no communities, persons cannot be spawned" << std::endl;
    }
    else
    {
        addPersons(settings_.initialPopulation);
    }

    std::cout << "EpidemicSimulation initialized:" << std::endl;
    std::cout << "  Resolution: " << settings_.width << "x" << settings_.height << std::endl;
    std::cout << "  Persons: " << population_.size() << std::endl;
    std::cout << "  Communities: " << world_.getCommunities().size() << std::endl;
}

TickContext EpidemicSimulation::makeContext(float frameTime)
{
    return TickContext{settings_, controls_, world_, rng_, clock_.now(), frameTime};
}

void EpidemicSimulation::update(float frameTime)
{
    TickContext ctx = makeContext(frameTime);

    // containment follows the toggle before anyone moves
    world_.setCommunitiesActive(controls_.communitiesEnabled);

    if (controls_.distancingPercent.consumeChange())
    {
        population_.rebalanceDistancers(controls_.distancingPercent.getValue(), rng_);
    }

    if (ctx.now >= nextTravelTime_)
    {
        if (controls_.communitiesEnabled && controls_.travelingEnabled)
        {
            travelOne();
        }
        nextTravelTime_ = ctx.now + settings_.travelInterval;
    }

    population_.update(ctx);
    chart_.update(population_.getCounts(), ctx.now);
    ++tickCount_;
}

Bounds EpidemicSimulation::nextBounds()
{
    return Bounds{world_.nextCommunity(), world_.getField()};
}

void EpidemicSimulation::addPersons(int count)
{
    if (world_.getCommunities().empty())
        return;

    TickContext ctx = makeContext(0.0f);
    for (int i = 0; i < count; ++i)
    {
        population_.add(nextBounds(), ctx);
    }
}

bool EpidemicSimulation::addPersonAt(sf::Vector2f point)
{
    if (world_.getCommunities().empty() || !world_.getRegion(world_.getField()).contains(point))
        return false;

    Bounds bounds = nextBounds();
    if (controls_.communitiesEnabled)
    {
        if (std::optional<RegionId> hovered = world_.getCommunityAt(point))
            bounds.community = *hovered;
    }

    TickContext ctx = makeContext(0.0f);
    Person &person = population_.add(bounds, ctx, point);
    person.stayInBounds(world_, settings_.personRadius);
    return true;
}

int EpidemicSimulation::removePersons(int count)
{
    return population_.remove(count, world_, controls_.communitiesEnabled, rng_);
}

std::optional<int> EpidemicSimulation::infectOne()
{
    TickContext ctx = makeContext(0.0f);
    return population_.infectOne(ctx);
}

void EpidemicSimulation::randomizeDistancers()
{
    population_.randomizeDistancers(controls_.distancingPercent.getValue(), rng_);
}

std::optional<int> EpidemicSimulation::travelOne()
{
    return population_.travelOne(world_, rng_);
}

void EpidemicSimulation::setDistancingEnabled(bool enabled)
{
    if (controls_.distancingEnabled == enabled)
        return;
    controls_.distancingEnabled = enabled;
    chart_.markEvent(DISTANCING_EVENT_COLOR);
}

void EpidemicSimulation::setTravelingEnabled(bool enabled)
{
    if (controls_.travelingEnabled == enabled)
        return;
    controls_.travelingEnabled = enabled;
    chart_.markEvent(TRAVELING_EVENT_COLOR);
}

void EpidemicSimulation::setCommunitiesEnabled(bool enabled)
{
    controls_.communitiesEnabled = enabled;
    world_.setCommunitiesActive(enabled);
}
