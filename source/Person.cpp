#include "Person.h"
#include "Controls.h"
#include "Gradient.h"
#include "Population.h"
#include "SimulationSettings.h"
#include "World.h"
#include <SFML/System/Angle.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{
    // maximum random heading change per tick, and after bouncing off a wall
    constexpr int WANDER_DEGREES = 10;
    constexpr int WALL_BOUNCE_DEGREES = 80;

    const Gradient networkGradient{{0.0f, sf::Color(0, 255, 0)},
                                   {100.0f, sf::Color(255, 255, 0)},
                                   {200.0f, sf::Color(255, 0, 0)},
                                   {255.0f, sf::Color(255, 0, 0)}};

    // bernoulli draw, U[0,1) < probability
    bool chance(std::mt19937 &rng, float probability)
    {
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng) < probability;
    }

    sf::Vector2f rotateRandomly(sf::Vector2f direction, int maxDegrees, std::mt19937 &rng)
    {
        std::uniform_int_distribution<int> degrees(-maxDegrees, maxDegrees);
        return direction.rotatedBy(sf::degrees(static_cast<float>(degrees(rng))));
    }

    float clampAxis(float value, float low, float high)
    {
        // bounds thinner than the person collapse onto their middle
        if (low > high)
            return (low + high) / 2.0f;
        return std::clamp(value, low, high);
    }
}

const char *Person::stateName(State state)
{
    switch (state)
    {
    case State::Susceptible:
        return "susceptible";
    case State::Infected:
        return "infected";
    case State::Recovered:
        return "recovered";
    case State::Deceased:
        return "deceased";
    default:
        return "unknown";
    }
}

sf::Color Person::stateColor(State state)
{
    switch (state)
    {
    case State::Susceptible:
        return sf::Color(255, 255, 255);
    case State::Infected:
        return sf::Color(255, 0, 0);
    case State::Recovered:
        return sf::Color(100, 255, 100);
    case State::Deceased:
        return sf::Color(100, 100, 100);
    default:
        return sf::Color::Magenta;
    }
}

Person::Person(int id, const Bounds &bounds, sf::Vector2f position, sf::Vector2f direction,
               float speed, State state)
    : id_(id), bounds_(bounds), position_(position), direction_(1.0f, 0.0f), speed_(speed), state_(state)
{
    setDirection(direction);
}

void Person::setDirection(sf::Vector2f direction)
{
    if (direction.lengthSquared() > 0.0f)
        direction_ = direction.normalized();
}

void Person::update(Population &population, const TickContext &ctx)
{
    if (state_ == State::Deceased)
    {
        neighbors_.clear();
        return;
    }

    if (travelTarget_)
        travel(ctx);
    else
        operate(population, ctx);
}

void Person::travel(const TickContext &ctx)
{
    if (!travelTarget_)
    {
        throw std::logic_error("Person " + std::to_string(id_) + " is traveling without a target community");
    }

    std::optional<sf::FloatRect> hub = ctx.world.getRegion(*travelTarget_).getHub();
    if (!hub)
    {
        throw std::logic_error("Person " + std::to_string(id_) + " is traveling to a region without a hub");
    }

    sf::Vector2f toTarget = hub->getCenter() - position_;
    float remaining = toTarget.length();
    if (remaining > 0.0f)
        direction_ = toTarget / remaining;

    // never step past the hub center, long frames would bounce across the hub
    float step = speed_ * ctx.settings.travelSpeedMultiplier * ctx.frameTime;
    position_ += direction_ * std::min(step, remaining);
    neighbors_.clear();

    // arrived: join the target community
    if (hub->contains(position_))
    {
        bounds_.community = *travelTarget_;
        travelTarget_.reset();
    }
}

void Person::operate(Population &population, const TickContext &ctx)
{
    if (chance(ctx.rng, 0.5f))
        direction_ = rotateRandomly(direction_, WANDER_DEGREES, ctx.rng);

    avoidWalls(ctx);
    std::vector<Person *> nears = getNearby(population, ctx);

    if (state_ == State::Infected && infectedStart_)
    {
        handleInfection(nears, ctx);
        if (state_ == State::Deceased)
        {
            neighbors_.clear();
            return;
        }
    }

    if (ctx.controls.distancingEnabled && distancing_ && !nears.empty())
        socialDistance(nears, ctx);

    position_ += direction_ * speed_ * ctx.frameTime;
    stayInBounds(ctx.world, ctx.settings.personRadius);
    recordNeighbors(nears);
}

void Person::avoidWalls(const TickContext &ctx)
{
    const Region &bounds = ctx.world.getEffectiveRegion(bounds_);
    const float reach = ctx.settings.wallAvoidanceDistance;

    bool adjusted = true;
    if (std::abs(position_.x - bounds.left()) < reach)
        direction_ = sf::Vector2f(1.0f, 0.0f);
    else if (std::abs(position_.x - bounds.right()) < reach)
        direction_ = sf::Vector2f(-1.0f, 0.0f);
    else if (std::abs(position_.y - bounds.top()) < reach)
        direction_ = sf::Vector2f(0.0f, 1.0f);
    else if (std::abs(position_.y - bounds.bottom()) < reach)
        direction_ = sf::Vector2f(0.0f, -1.0f);
    else
        adjusted = false;

    // break up perfectly perpendicular bouncing
    if (adjusted && chance(ctx.rng, 0.5f))
        direction_ = rotateRandomly(direction_, WALL_BOUNCE_DEGREES, ctx.rng);
}

std::vector<Person *> Person::getNearby(Population &population, const TickContext &ctx) const
{
    const float radius = ctx.settings.distancingRadius;
    const RegionId ownBounds = ctx.world.getEffectiveBounds(bounds_);
    const sf::FloatRect box = getInteractionBox(radius);

    std::vector<Person *> nears;
    for (Person *other : population.getCandidates(position_, radius))
    {
        if (other == this)
            continue;

        // broad phase
        if (!box.findIntersection(other->getInteractionBox(radius)))
            continue;
        if (other->isDeceased() || other->isTraveling())
            continue;
        if (ctx.world.getEffectiveBounds(other->bounds_) != ownBounds)
            continue;

        // narrow phase
        if ((position_ - other->position_).length() < radius)
            nears.push_back(other);
    }
    return nears;
}

void Person::stayInBounds(const World &world, float radius)
{
    const Region &bounds = world.getEffectiveRegion(bounds_);
    position_.x = clampAxis(position_.x, bounds.left() + radius, bounds.right() - radius);
    position_.y = clampAxis(position_.y, bounds.top() + radius, bounds.bottom() - radius);
}

void Person::handleInfection(const std::vector<Person *> &nears, const TickContext &ctx)
{
    if (!infectedStart_)
    {
        throw std::logic_error("Person " + std::to_string(id_) + " is infected without an infection start time");
    }

    if (ctx.now - *infectedStart_ >= ctx.settings.maxInfectionDuration)
    {
        endInfection(ctx);
        return;
    }

    if (!travelTarget_ && ctx.now - lastEvent_ >= ctx.settings.infectionEventInterval)
    {
        if (chance(ctx.rng, ctx.settings.spreadChance))
            spread(nears, ctx);
        if (state_ == State::Infected && chance(ctx.rng, ctx.settings.earlyTerminationChance))
            endInfection(ctx);
        lastEvent_ = ctx.now;
    }
}

bool Person::getInfected(const TickContext &ctx)
{
    if (state_ != State::Susceptible && state_ != State::Recovered)
        return false;

    infectedStart_ = ctx.now;
    infectedEnd_.reset();
    if (ctx.settings.logEvents)
        std::cout << "Person " << id_ << " infected" << std::endl;

    double jitter = std::uniform_real_distribution<double>(0.0, 1.0)(ctx.rng) * ctx.settings.infectionJitter;
    lastEvent_ = std::max(0.0, ctx.now - jitter);
    state_ = State::Infected;
    distancing_ = chance(ctx.rng, ctx.settings.infectedDistancerChance);
    return true;
}

void Person::endInfection(const TickContext &ctx)
{
    infectedEnd_ = ctx.now;
    if (chance(ctx.rng, ctx.settings.mortalityChance))
        die(ctx);
    else
        recover(ctx);
}

void Person::recover(const TickContext &ctx)
{
    state_ = State::Recovered;
    if (ctx.settings.logEvents && infectedStart_ && infectedEnd_)
    {
        std::cout << "Person " << id_ << " recovered ("
                  << std::lround(*infectedEnd_ - *infectedStart_) << "s)" << std::endl;
    }
    distancing_ = !chance(ctx.rng, ctx.settings.recoveredNondistancerChance);
}

void Person::die(const TickContext &ctx)
{
    state_ = State::Deceased;
    neighbors_.clear();
    if (ctx.settings.logEvents && infectedStart_ && infectedEnd_)
    {
        std::cout << "Person " << id_ << " died ("
                  << std::lround(*infectedEnd_ - *infectedStart_) << "s)" << std::endl;
    }
}

void Person::spread(const std::vector<Person *> &nears, const TickContext &ctx)
{
    for (Person *other : nears)
    {
        if (other == this)
            continue;
        if ((position_ - other->position_).length() >= ctx.settings.infectionRadius)
            continue;

        float probability = 0.0f;
        switch (other->state_)
        {
        case State::Susceptible:
            probability = ctx.settings.infectionChance;
            break;
        case State::Recovered:
            probability = ctx.settings.reinfectionChance;
            break;
        default:
            break;
        }

        if (probability > 0.0f && chance(ctx.rng, probability))
            other->getInfected(ctx);
    }
}

sf::Vector2f Person::distancingForce(const std::vector<Person *> &nears, const SimulationSettings &settings) const
{
    sf::Vector2f total(0.0f, 0.0f);
    int contributors = 0;

    for (const Person *other : nears)
    {
        sf::Vector2f away = position_ - other->position_;
        float distance = away.length();
        // coincident neighbors give no usable direction
        if (distance <= 0.0f)
            continue;

        float falloff = 1.0f - distance / settings.distancingRadius;
        total += away * settings.proximityCoefficient * falloff * falloff;
        ++contributors;
    }

    if (contributors == 0)
        return sf::Vector2f(0.0f, 0.0f);
    return total / static_cast<float>(contributors);
}

void Person::socialDistance(const std::vector<Person *> &nears, const TickContext &ctx)
{
    sf::Vector2f force = distancingForce(nears, ctx.settings);
    if (force.lengthSquared() > 0.0f)
        force = force.normalized();

    sf::Vector2f blended = direction_ + force * ctx.controls.distancingStrength.getValue();
    if (blended.lengthSquared() > 0.0f)
        direction_ = blended.normalized();
}

void Person::randomizeDistancing(float distancingPercent, std::mt19937 &rng)
{
    distancing_ = chance(rng, distancingPercent / 100.0f);
}

int Person::getIntensity(float distance, float radius)
{
    if (radius <= 0.0f)
        return 0;
    return std::abs(static_cast<int>(255.0f * (1.0f - std::min(distance, radius) / radius)));
}

sf::Color Person::networkColor(float distance, float radius)
{
    int intensity = getIntensity(distance, radius);
    sf::Color color = networkGradient.getColor(static_cast<float>(intensity));
    color.a = static_cast<std::uint8_t>(intensity);
    return color;
}

sf::FloatRect Person::getInteractionBox(float distancingRadius) const
{
    sf::Vector2f half(distancingRadius / 2.0f, distancingRadius / 2.0f);
    return sf::FloatRect(position_ - half, {distancingRadius, distancingRadius});
}

void Person::recordNeighbors(const std::vector<Person *> &nears)
{
    neighbors_.clear();
    neighbors_.reserve(nears.size());
    for (const Person *other : nears)
    {
        sf::Vector2f offset = other->position_ - position_;
        neighbors_.push_back({other->id_, offset, offset.length()});
    }
}
