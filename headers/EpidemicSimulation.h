#pragma once
#include <SFML/Graphics/Color.hpp>
#include <SFML/System/Vector2.hpp>
#include <optional>
#include <random>
#include "Chart.h"
#include "Controls.h"
#include "Population.h"
#include "SimulationClock.h"
#include "SimulationSettings.h"
#include "World.h"

// ties the world, the population and the chart together and advances them once per frame
class EpidemicSimulation
{
public:
    static constexpr int BATCH_SIZE = 10; // persons added/removed per button press

    static const sf::Color DISTANCING_EVENT_COLOR;
    static const sf::Color TRAVELING_EVENT_COLOR;

    // the clock must outlive the simulation
    EpidemicSimulation(const SimulationSettings &settings, const SimulationClock &clock);
    EpidemicSimulation(const SimulationSettings &settings, const SimulationClock &clock, World world);

    // one frame: apply controls, maybe dispatch a traveler, update persons, sample the chart
    void update(float frameTime);

    // triggered operations, all safe on an empty population
    void addPersons(int count);
    bool addPersonAt(sf::Vector2f point);
    int removePersons(int count);
    std::optional<int> infectOne();
    void randomizeDistancers();
    std::optional<int> travelOne();

    // toggles that also leave a marker on the chart
    void setDistancingEnabled(bool enabled);
    void setTravelingEnabled(bool enabled);
    void setCommunitiesEnabled(bool enabled);

    Controls &getControls() { return controls_; }
    const Controls &getControls() const { return controls_; }
    const SimulationSettings &getSettings() const { return settings_; }
    const World &getWorld() const { return world_; }
    World &getWorld() { return world_; }
    const Population &getPopulation() const { return population_; }
    Population &getPopulation() { return population_; }
    const Chart &getChart() const { return chart_; }
    Chart &getChart() { return chart_; }
    std::mt19937 &getRng() { return rng_; }

    double getElapsedTime() const { return clock_.now() - startTime_; }
    unsigned long long getTickCount() const { return tickCount_; }

    TickContext makeContext(float frameTime);

private:
    SimulationSettings settings_;
    const SimulationClock &clock_;
    std::mt19937 rng_;
    Controls controls_;
    World world_;
    Population population_;
    Chart chart_;
    double startTime_;
    double nextTravelTime_;
    unsigned long long tickCount_ = 0;

    Bounds nextBounds();
};
