#pragma once
#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>
#include <array>
#include <optional>
#include <random>
#include <vector>
#include "Region.h"

class SimulationSettings;
struct Controls;
class World;
class Population;

// everything a person needs from its surroundings during one update
struct TickContext
{
    const SimulationSettings &settings;
    const Controls &controls;
    const World &world;
    std::mt19937 &rng;
    double now;      // clock reading for this tick (seconds)
    float frameTime; // seconds since the previous tick
};

// autonomous agent that moves inside its bounds and can catch and spread the infection
class Person
{
public:
    enum class State
    {
        Susceptible,
        Infected,
        Recovered,
        Deceased
    };
    static constexpr size_t STATE_COUNT = 4;

    static const char *stateName(State state);
    static sf::Color stateColor(State state);

    // read only snapshot of one neighbor from the last update, for overlays
    struct Neighbor
    {
        int id;
        sf::Vector2f offset; // neighbor center minus own center
        float distance;
    };

    Person(int id, const Bounds &bounds, sf::Vector2f position, sf::Vector2f direction,
           float speed, State state = State::Susceptible);

    // one simulation tick: nothing when deceased, travel when a target is set, otherwise operate
    void update(Population &population, const TickContext &ctx);

    // normal behavior: wander, avoid walls, interact with neighbors, move, stay inside bounds
    void operate(Population &population, const TickContext &ctx);
    // head for the target community's hub; throws std::logic_error without a target
    void travel(const TickContext &ctx);

    void avoidWalls(const TickContext &ctx);
    std::vector<Person *> getNearby(Population &population, const TickContext &ctx) const;
    void stayInBounds(const World &world, float radius);

    // infection timeline; handleInfection throws std::logic_error without a start time
    void handleInfection(const std::vector<Person *> &nears, const TickContext &ctx);
    // only susceptible and recovered persons can be infected; returns whether it took
    bool getInfected(const TickContext &ctx);
    void endInfection(const TickContext &ctx);
    void spread(const std::vector<Person *> &nears, const TickContext &ctx);

    // averaged quadratic falloff repulsion away from neighbors (not normalized)
    sf::Vector2f distancingForce(const std::vector<Person *> &nears, const SimulationSettings &settings) const;
    void socialDistance(const std::vector<Person *> &nears, const TickContext &ctx);

    void randomizeDistancing(float distancingPercent, std::mt19937 &rng);
    void startTraveling(RegionId target) { travelTarget_ = target; }

    // overlay helpers
    static int getIntensity(float distance, float radius);
    static sf::Color networkColor(float distance, float radius);

    // accessors
    int getId() const { return id_; }
    sf::Vector2f getPosition() const { return position_; }
    void setPosition(sf::Vector2f position) { position_ = position; }
    sf::Vector2f getDirection() const { return direction_; }
    void setDirection(sf::Vector2f direction);
    float getSpeed() const { return speed_; }
    State getState() const { return state_; }
    sf::Color getColor() const { return stateColor(state_); }
    bool isDeceased() const { return state_ == State::Deceased; }
    bool isDistancing() const { return distancing_; }
    void setDistancing(bool distancing) { distancing_ = distancing; }
    const Bounds &getBounds() const { return bounds_; }
    bool isTraveling() const { return travelTarget_.has_value(); }
    std::optional<RegionId> getTravelTarget() const { return travelTarget_; }
    std::optional<double> getInfectedStart() const { return infectedStart_; }
    std::optional<double> getInfectedEnd() const { return infectedEnd_; }
    double getLastEvent() const { return lastEvent_; }
    const std::vector<Neighbor> &getNeighbors() const { return neighbors_; }

    // square broad phase box (side = distancing radius) centered on the person
    sf::FloatRect getInteractionBox(float distancingRadius) const;

private:
    int id_;
    Bounds bounds_;
    sf::Vector2f position_;
    sf::Vector2f direction_; // unit length
    float speed_;
    State state_;
    bool distancing_ = false;
    std::optional<RegionId> travelTarget_;
    std::optional<double> infectedStart_;
    std::optional<double> infectedEnd_;
    double lastEvent_ = 0.0;
    std::vector<Neighbor> neighbors_;

    void recover(const TickContext &ctx);
    void die(const TickContext &ctx);
    void recordNeighbors(const std::vector<Person *> &nears);
};

// population counts indexed by Person::State
using StateCounts = std::array<int, Person::STATE_COUNT>;

inline size_t stateIndex(Person::State state)
{
    return static_cast<size_t>(state);
}
