#pragma once
#include <string>

class SimulationSettings
{
public:
    // display / layout settings
    int width = 1920;
    int height = 1080;
    int panelWidth = 450;       // control panel on the right hand side
    int frameRate = 120;
    float layoutMargin = 10.0f; // gap between neighboring regions
    float borderThickness = 2.0f;
    float hubSize = 30.0f;

    // population
    int initialPopulation = 200;
    unsigned int seed = 0; // 0 = seed from std::random_device

    // person movement
    float personRadius = 5.0f;
    float personSpeed = 120.0f;        // units per second
    float wallAvoidanceDistance = 10.0f;
    float distancingRadius = 125.0f;   // neighbor detection
    float infectionRadius = 50.0f;     // transmission attempts
    float proximityCoefficient = 10.0f; // max repulsion multiplier for close neighbors

    // infection (times in seconds)
    float maxInfectionDuration = 60.0f;
    float infectionEventInterval = 3.0f;
    float infectionJitter = 5.0f; // staggers the first spread roll of a new infection
    float spreadChance = 0.33f;
    float infectionChance = 0.5f;
    float reinfectionChance = 0.1f;
    float infectedDistancerChance = 0.7f;     // newly infected start distancing
    float recoveredNondistancerChance = 0.6f; // newly recovered stop distancing
    float mortalityChance = 0.1f;
    float earlyTerminationChance = 0.02f;

    // travel between communities
    float travelInterval = 2.0f;
    float travelSpeedMultiplier = 3.0f;

    // chart
    int chartWidth = 410;
    float chartUpdateInterval = 1.0f;
    int chartSnapshotWidth = 1;

    // initial control values
    float distancingPercent = 100.0f;
    float distancingStrength = 1.0f;
    bool distancingEnabled = false;
    bool travelingEnabled = true;
    bool communitiesEnabled = true;
    bool showDirections = false;
    bool showNetwork = false;

    // per person event lines on stdout
    bool logEvents = true;

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();
};
