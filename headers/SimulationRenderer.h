#pragma once
#include <SFML/Graphics.hpp>
#include "EpidemicSimulation.h"

// draws the world, the persons with their overlays and the population chart
class SimulationRenderer
{
public:
    explicit SimulationRenderer(const sf::Font &font);

    void draw(sf::RenderTarget &target, const EpidemicSimulation &simulation);

    // where the chart goes inside the settings panel
    static sf::FloatRect chartArea(const EpidemicSimulation &simulation);

private:
    const sf::Font &font_;

    sf::Color backgroundColor_ = sf::Color::Black;
    sf::Color borderColor_ = sf::Color::White;
    sf::Color communityFillColor_ = sf::Color(0, 0, 32);
    sf::Color directionColor_ = sf::Color(0, 255, 255);
    sf::Color travelColor_ = sf::Color(255, 255, 0);
    sf::Color distancingRingColor_ = sf::Color(255, 255, 255, 64);

    void drawRegion(sf::RenderTarget &target, const Region &region, bool filled);
    void drawCommunities(sf::RenderTarget &target, const EpidemicSimulation &simulation);
    void drawPersons(sf::RenderTarget &target, const EpidemicSimulation &simulation);
    void drawChart(sf::RenderTarget &target, const EpidemicSimulation &simulation);
};
