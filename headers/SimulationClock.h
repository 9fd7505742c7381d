#pragma once
#include <SFML/System/Clock.hpp>

// wall clock seen by the simulation, in seconds
// every throttled behavior (infection events, chart sampling, travel) compares
// stored timestamps against this instead of running timers
class SimulationClock
{
public:
    virtual ~SimulationClock() = default;
    virtual double now() const = 0;
};

// real time, backed by sf::Clock
class SfmlClock : public SimulationClock
{
public:
    double now() const override { return clock_.getElapsedTime().asSeconds(); }

private:
    sf::Clock clock_;
};

// hand driven time for headless runs and tests
class ManualClock : public SimulationClock
{
public:
    explicit ManualClock(double start = 0.0) : now_(start) {}

    double now() const override { return now_; }
    void advance(double seconds) { now_ += seconds; }
    void set(double seconds) { now_ = seconds; }

private:
    double now_;
};
