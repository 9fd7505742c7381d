#pragma once
#include "Controls.h"
#include "Person.h"
#include "SimulationSettings.h"
#include "World.h"
#include <random>

// settings with fixed seed and no per person log lines
inline SimulationSettings quietSettings()
{
    SimulationSettings settings;
    settings.logEvents = false;
    settings.seed = 1234;
    return settings;
}

// 400x200 field split into two 200x200 communities, no borders
//   left community hub:  [170, 200] x [170, 200]
//   right community hub: [370, 400] x [170, 200]
struct TestWorld
{
    World world;
    RegionId field;
    RegionId left;
    RegionId right;

    TestWorld()
    {
        field = world.addRegion(Region("Field", {200.0f, 100.0f}, {400.0f, 200.0f}, 0.0f));
        left = world.addCommunity(Region::community("L", {100.0f, 100.0f}, {200.0f, 200.0f}, 30.0f, 0.0f));
        right = world.addCommunity(Region::community("R", {300.0f, 100.0f}, {200.0f, 200.0f}, 30.0f, 0.0f));
        world.setField(field);
        world.setPanel(field);
    }

    Bounds leftBounds() const { return Bounds{left, field}; }
    Bounds rightBounds() const { return Bounds{right, field}; }
};

// owns everything a TickContext points at
struct TickHarness
{
    SimulationSettings settings = quietSettings();
    Controls controls;
    TestWorld testWorld;
    std::mt19937 rng{42};
    double now = 0.0;

    TickContext context(float frameTime = 1.0f / 60.0f)
    {
        return TickContext{settings, controls, testWorld.world, rng, now, frameTime};
    }
};
