#include "SimulationSettings.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <cmath>

bool SimulationSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Epidemic Simulation Settings\n";
    file << "width=" << width << "\n";
    file << "height=" << height << "\n";
    file << "panelWidth=" << panelWidth << "\n";
    file << "frameRate=" << frameRate << "\n";
    file << "layoutMargin=" << layoutMargin << "\n";
    file << "borderThickness=" << borderThickness << "\n";
    file << "hubSize=" << hubSize << "\n";
    file << "initialPopulation=" << initialPopulation << "\n";
    file << "seed=" << seed << "\n";

    file << "personRadius=" << personRadius << "\n";
    file << "personSpeed=" << personSpeed << "\n";
    file << "wallAvoidanceDistance=" << wallAvoidanceDistance << "\n";
    file << "distancingRadius=" << distancingRadius << "\n";
    file << "infectionRadius=" << infectionRadius << "\n";
    file << "proximityCoefficient=" << proximityCoefficient << "\n";

    file << "maxInfectionDuration=" << maxInfectionDuration << "\n";
    file << "infectionEventInterval=" << infectionEventInterval << "\n";
    file << "infectionJitter=" << infectionJitter << "\n";
    file << "spreadChance=" << spreadChance << "\n";
    file << "infectionChance=" << infectionChance << "\n";
    file << "reinfectionChance=" << reinfectionChance << "\n";
    file << "infectedDistancerChance=" << infectedDistancerChance << "\n";
    file << "recoveredNondistancerChance=" << recoveredNondistancerChance << "\n";
    file << "mortalityChance=" << mortalityChance << "\n";
    file << "earlyTerminationChance=" << earlyTerminationChance << "\n";

    file << "travelInterval=" << travelInterval << "\n";
    file << "travelSpeedMultiplier=" << travelSpeedMultiplier << "\n";

    file << "chartWidth=" << chartWidth << "\n";
    file << "chartUpdateInterval=" << chartUpdateInterval << "\n";
    file << "chartSnapshotWidth=" << chartSnapshotWidth << "\n";

    file << "distancingPercent=" << distancingPercent << "\n";
    file << "distancingStrength=" << distancingStrength << "\n";
    file << "distancingEnabled=" << (distancingEnabled ? 1 : 0) << "\n";
    file << "travelingEnabled=" << (travelingEnabled ? 1 : 0) << "\n";
    file << "communitiesEnabled=" << (communitiesEnabled ? 1 : 0) << "\n";
    file << "showDirections=" << (showDirections ? 1 : 0) << "\n";
    file << "showNetwork=" << (showNetwork ? 1 : 0) << "\n";
    file << "logEvents=" << (logEvents ? 1 : 0) << "\n";

    return true;
}

bool SimulationSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        try
        {
            // layout
            if (key == "width")
                width = std::stoi(value);
            else if (key == "height")
                height = std::stoi(value);
            else if (key == "panelWidth")
                panelWidth = std::stoi(value);
            else if (key == "frameRate")
                frameRate = std::stoi(value);
            else if (key == "layoutMargin")
                layoutMargin = std::stof(value);
            else if (key == "borderThickness")
                borderThickness = std::stof(value);
            else if (key == "hubSize")
                hubSize = std::stof(value);
            else if (key == "initialPopulation")
                initialPopulation = std::stoi(value);
            else if (key == "seed")
                seed = static_cast<unsigned int>(std::stoul(value));
            // movement
            else if (key == "personRadius")
                personRadius = std::stof(value);
            else if (key == "personSpeed")
                personSpeed = std::stof(value);
            else if (key == "wallAvoidanceDistance")
                wallAvoidanceDistance = std::stof(value);
            else if (key == "distancingRadius")
                distancingRadius = std::stof(value);
            else if (key == "infectionRadius")
                infectionRadius = std::stof(value);
            else if (key == "proximityCoefficient")
                proximityCoefficient = std::stof(value);
            // infection
            else if (key == "maxInfectionDuration")
                maxInfectionDuration = std::stof(value);
            else if (key == "infectionEventInterval")
                infectionEventInterval = std::stof(value);
            else if (key == "infectionJitter")
                infectionJitter = std::stof(value);
            else if (key == "spreadChance")
                spreadChance = std::stof(value);
            else if (key == "infectionChance")
                infectionChance = std::stof(value);
            else if (key == "reinfectionChance")
                reinfectionChance = std::stof(value);
            else if (key == "infectedDistancerChance")
                infectedDistancerChance = std::stof(value);
            else if (key == "recoveredNondistancerChance")
                recoveredNondistancerChance = std::stof(value);
            else if (key == "mortalityChance")
                mortalityChance = std::stof(value);
            else if (key == "earlyTerminationChance")
                earlyTerminationChance = std::stof(value);
            // travel
            else if (key == "travelInterval")
                travelInterval = std::stof(value);
            else if (key == "travelSpeedMultiplier")
                travelSpeedMultiplier = std::stof(value);
            // chart
            else if (key == "chartWidth")
                chartWidth = std::stoi(value);
            else if (key == "chartUpdateInterval")
                chartUpdateInterval = std::stof(value);
            else if (key == "chartSnapshotWidth")
                chartSnapshotWidth = std::stoi(value);
            // controls
            else if (key == "distancingPercent")
                distancingPercent = std::stof(value);
            else if (key == "distancingStrength")
                distancingStrength = std::stof(value);
            else if (key == "distancingEnabled")
                distancingEnabled = (std::stoi(value) != 0);
            else if (key == "travelingEnabled")
                travelingEnabled = (std::stoi(value) != 0);
            else if (key == "communitiesEnabled")
                communitiesEnabled = (std::stoi(value) != 0);
            else if (key == "showDirections")
                showDirections = (std::stoi(value) != 0);
            else if (key == "showNetwork")
                showNetwork = (std::stoi(value) != 0);
            else if (key == "logEvents")
                logEvents = (std::stoi(value) != 0);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Warning: " << filename << ":" << lineNumber
                      << " bad value for '" << key << "' (" << e.what() << "), keeping "
                      << "previous value" << std::endl;
        }
    }

    validateAndClamp();
    return true;
}

void SimulationSettings::validateAndClamp()
{
    width = std::clamp(width, 320, 7680);
    height = std::clamp(height, 240, 4320);
    panelWidth = std::clamp(panelWidth, 0, width / 2);
    frameRate = std::clamp(frameRate, 1, 1000);
    layoutMargin = std::clamp(layoutMargin, 0.0f, 100.0f);
    borderThickness = std::clamp(borderThickness, 0.0f, 20.0f);
    hubSize = std::clamp(hubSize, 4.0f, 200.0f);
    initialPopulation = std::clamp(initialPopulation, 0, 100000);

    personRadius = std::clamp(personRadius, 0.5f, 50.0f);
    personSpeed = std::clamp(personSpeed, 0.0f, 2000.0f);
    wallAvoidanceDistance = std::clamp(wallAvoidanceDistance, 0.0f, 100.0f);
    distancingRadius = std::clamp(distancingRadius, 1.0f, 1000.0f);
    infectionRadius = std::clamp(infectionRadius, 0.0f, distancingRadius);
    proximityCoefficient = std::max(0.0f, proximityCoefficient);

    maxInfectionDuration = std::max(0.0f, maxInfectionDuration);
    infectionEventInterval = std::max(0.0f, infectionEventInterval);
    infectionJitter = std::max(0.0f, infectionJitter);
    spreadChance = std::clamp(spreadChance, 0.0f, 1.0f);
    infectionChance = std::clamp(infectionChance, 0.0f, 1.0f);
    reinfectionChance = std::clamp(reinfectionChance, 0.0f, 1.0f);
    infectedDistancerChance = std::clamp(infectedDistancerChance, 0.0f, 1.0f);
    recoveredNondistancerChance = std::clamp(recoveredNondistancerChance, 0.0f, 1.0f);
    mortalityChance = std::clamp(mortalityChance, 0.0f, 1.0f);
    earlyTerminationChance = std::clamp(earlyTerminationChance, 0.0f, 1.0f);

    travelInterval = std::max(0.0f, travelInterval);
    travelSpeedMultiplier = std::clamp(travelSpeedMultiplier, 0.1f, 50.0f);

    chartWidth = std::clamp(chartWidth, 1, 4096);
    chartUpdateInterval = std::max(0.0f, chartUpdateInterval);
    chartSnapshotWidth = std::clamp(chartSnapshotWidth, 1, chartWidth);

    distancingPercent = std::clamp(distancingPercent, 0.0f, 100.0f);
    distancingStrength = std::clamp(distancingStrength, 0.0f, 3.0f);
}
