#pragma once
#include "Person.h"
#include "SpatialGrid.h"
#include <optional>
#include <random>
#include <vector>

// hands out monotonically increasing person ids
class IdGenerator
{
public:
    int next() { return next_++; }

private:
    int next_ = 0;
};

// owns the live persons and runs the per tick interaction pass
// membership only changes through add/remove, never during update()
class Population
{
public:
    explicit Population(float cellSize);

    // spawns a person at a random spot inside its effective bounds unless a position is given
    Person &add(const Bounds &bounds, const TickContext &ctx,
                std::optional<sf::Vector2f> position = std::nullopt,
                Person::State state = Person::State::Susceptible);

    // removes up to count persons; with communities enabled it rotates through the
    // communities for fairness. returns how many were removed
    int remove(int count, World &world, bool communitiesEnabled, std::mt19937 &rng);

    // infects one random susceptible or recovered person, returns its id
    std::optional<int> infectOne(const TickContext &ctx);

    // sends one random idle person toward another community, returns its id
    std::optional<int> travelOne(const World &world, std::mt19937 &rng);

    // reassigns distancing from scratch so round(percent% of n) persons distance
    void randomizeDistancers(float distancingPercent, std::mt19937 &rng);
    // flips only as many persons as needed to reach round(percent% of n) distancers
    void rebalanceDistancers(float distancingPercent, std::mt19937 &rng);

    // one tick for every person in sequence
    void update(const TickContext &ctx);

    // re-indexes every person position; update() does this at the start of each tick
    void rebuildIndex();
    // persons whose grid cells overlap the query circle (index must be current)
    std::vector<Person *> getCandidates(sf::Vector2f position, float radius);

    StateCounts getCounts() const;
    int getDistancerCount() const;
    static int targetDistancerCount(float distancingPercent, size_t populationSize);

    const std::vector<Person> &getPersons() const { return persons_; }
    std::vector<Person> &getPersons() { return persons_; }
    Person *findById(int id);
    size_t size() const { return persons_.size(); }
    bool empty() const { return persons_.empty(); }

private:
    std::vector<Person> persons_;
    IdGenerator ids_;
    SpatialGrid grid_;

    void removeAt(size_t index);
};
