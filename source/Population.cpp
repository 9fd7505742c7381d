#include "Population.h"
#include "Controls.h"
#include "SimulationSettings.h"
#include "World.h"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace
{
    // k distinct indices out of [0, n), order randomized
    std::vector<size_t> sampleIndices(size_t n, size_t k, std::mt19937 &rng)
    {
        std::vector<size_t> indices(n);
        for (size_t i = 0; i < n; ++i)
            indices[i] = i;
        std::shuffle(indices.begin(), indices.end(), rng);
        indices.resize(std::min(n, k));
        return indices;
    }

    size_t pickIndex(size_t n, std::mt19937 &rng)
    {
        return std::uniform_int_distribution<size_t>(0, n - 1)(rng);
    }
}

Population::Population(float cellSize)
    : grid_(cellSize)
{
}

Person &Population::add(const Bounds &bounds, const TickContext &ctx,
                        std::optional<sf::Vector2f> position, Person::State state)
{
    const float radius = ctx.settings.personRadius;

    if (!position)
    {
        const Region &region = ctx.world.getEffectiveRegion(bounds);
        float minX = region.left() + radius;
        float maxX = std::max(minX, region.right() - radius);
        float minY = region.top() + radius;
        float maxY = std::max(minY, region.bottom() - radius);
        position = sf::Vector2f(std::uniform_real_distribution<float>(minX, maxX)(ctx.rng),
                                std::uniform_real_distribution<float>(minY, maxY)(ctx.rng));
    }

    std::uniform_real_distribution<float> axis(-1.0f, 1.0f);
    sf::Vector2f direction(axis(ctx.rng), axis(ctx.rng));

    persons_.emplace_back(ids_.next(), bounds, *position, direction, ctx.settings.personSpeed, state);
    Person &person = persons_.back();
    person.randomizeDistancing(ctx.controls.distancingPercent.getValue(), ctx.rng);
    return person;
}

int Population::remove(int count, World &world, bool communitiesEnabled, std::mt19937 &rng)
{
    int toRemove = std::min(std::max(count, 0), static_cast<int>(persons_.size()));

    for (int removed = 0; removed < toRemove; ++removed)
    {
        std::vector<size_t> pool;

        if (communitiesEnabled)
        {
            // first community in rotation that still has someone in it
            for (size_t attempt = 0; attempt < world.getCommunities().size() && pool.empty(); ++attempt)
            {
                RegionId community = world.nextCommunity();
                for (size_t i = 0; i < persons_.size(); ++i)
                {
                    if (world.getEffectiveBounds(persons_[i].getBounds()) == community)
                        pool.push_back(i);
                }
            }
        }

        if (pool.empty())
        {
            pool.resize(persons_.size());
            for (size_t i = 0; i < persons_.size(); ++i)
                pool[i] = i;
        }

        removeAt(pool[pickIndex(pool.size(), rng)]);
    }

    return toRemove;
}

std::optional<int> Population::infectOne(const TickContext &ctx)
{
    std::vector<Person *> infectible;
    for (auto &person : persons_)
    {
        if (person.getState() == Person::State::Susceptible || person.getState() == Person::State::Recovered)
            infectible.push_back(&person);
    }

    if (infectible.empty())
        return std::nullopt;

    Person *person = infectible[pickIndex(infectible.size(), ctx.rng)];
    person->getInfected(ctx);
    return person->getId();
}

std::optional<int> Population::travelOne(const World &world, std::mt19937 &rng)
{
    std::vector<Person *> idle;
    for (auto &person : persons_)
    {
        if (!person.isDeceased() && !person.isTraveling())
            idle.push_back(&person);
    }

    if (idle.empty())
        return std::nullopt;

    Person *person = idle[pickIndex(idle.size(), rng)];

    std::vector<RegionId> targets;
    for (RegionId community : world.getCommunities())
    {
        if (community != person->getBounds().community)
            targets.push_back(community);
    }

    if (targets.empty())
        return std::nullopt;

    person->startTraveling(targets[pickIndex(targets.size(), rng)]);
    return person->getId();
}

int Population::targetDistancerCount(float distancingPercent, size_t populationSize)
{
    return static_cast<int>(std::lround(distancingPercent / 100.0f * static_cast<float>(populationSize)));
}

void Population::randomizeDistancers(float distancingPercent, std::mt19937 &rng)
{
    for (auto &person : persons_)
    {
        person.setDistancing(false);
    }

    size_t target = static_cast<size_t>(targetDistancerCount(distancingPercent, persons_.size()));
    for (size_t index : sampleIndices(persons_.size(), target, rng))
    {
        persons_[index].setDistancing(true);
    }
}

void Population::rebalanceDistancers(float distancingPercent, std::mt19937 &rng)
{
    std::vector<Person *> distancers;
    std::vector<Person *> nonDistancers;
    for (auto &person : persons_)
    {
        (person.isDistancing() ? distancers : nonDistancers).push_back(&person);
    }

    int diff = targetDistancerCount(distancingPercent, persons_.size()) - static_cast<int>(distancers.size());
    if (diff == 0)
        return;

    // grow from the non distancers, shrink from the distancers
    std::vector<Person *> &pool = diff > 0 ? nonDistancers : distancers;
    bool distancing = diff > 0;
    size_t flips = std::min(pool.size(), static_cast<size_t>(std::abs(diff)));
    for (size_t index : sampleIndices(pool.size(), flips, rng))
    {
        pool[index]->setDistancing(distancing);
    }
}

void Population::rebuildIndex()
{
    grid_.rebuild(persons_);
}

void Population::update(const TickContext &ctx)
{
    rebuildIndex();

    for (size_t i = 0; i < persons_.size(); ++i)
    {
        sf::Vector2f before = persons_[i].getPosition();
        persons_[i].update(*this, ctx);
        grid_.relocate(i, before, persons_[i].getPosition());
    }
}

std::vector<Person *> Population::getCandidates(sf::Vector2f position, float radius)
{
    std::vector<Person *> candidates;
    for (size_t index : grid_.getNeighbors(position, radius))
    {
        if (index < persons_.size())
            candidates.push_back(&persons_[index]);
    }
    return candidates;
}

StateCounts Population::getCounts() const
{
    StateCounts counts{};
    for (const auto &person : persons_)
    {
        ++counts[stateIndex(person.getState())];
    }
    return counts;
}

int Population::getDistancerCount() const
{
    return static_cast<int>(std::count_if(persons_.begin(), persons_.end(),
                                          [](const Person &person)
                                          { return person.isDistancing(); }));
}

Person *Population::findById(int id)
{
    auto it = std::find_if(persons_.begin(), persons_.end(),
                           [id](const Person &person)
                           { return person.getId() == id; });
    return it != persons_.end() ? &*it : nullptr;
}

void Population::removeAt(size_t index)
{
    // order carries no meaning, swap with the back
    if (index + 1 != persons_.size())
    {
        std::swap(persons_[index], persons_.back());
    }
    persons_.pop_back();
}
