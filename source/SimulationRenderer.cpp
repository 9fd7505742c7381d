#include "SimulationRenderer.h"
#include <algorithm>
#include <cmath>

SimulationRenderer::SimulationRenderer(const sf::Font &font) : font_(font) {}

sf::FloatRect SimulationRenderer::chartArea(const EpidemicSimulation &simulation)
{
    const Region &panel = simulation.getWorld().getRegion(simulation.getWorld().getPanel());
    float side = static_cast<float>(simulation.getChart().getWidth());
    sf::Vector2f center = panel.getCenter() - sf::Vector2f(0.0f, 50.0f);
    return sf::FloatRect(center - sf::Vector2f(side / 2.0f, side / 2.0f), {side, side});
}

void SimulationRenderer::draw(sf::RenderTarget &target, const EpidemicSimulation &simulation)
{
    target.clear(backgroundColor_);

    const World &world = simulation.getWorld();
    drawRegion(target, world.getRegion(world.getField()), false);
    drawRegion(target, world.getRegion(world.getPanel()), false);

    if (simulation.getControls().communitiesEnabled)
        drawCommunities(target, simulation);

    drawPersons(target, simulation);
    drawChart(target, simulation);
}

void SimulationRenderer::drawRegion(sf::RenderTarget &target, const Region &region, bool filled)
{
    float border = std::max(1.0f, region.getBorderThickness());
    sf::FloatRect rect = region.getRect();

    // outline drawn inward so the inset edges line up with left()/right()
    sf::RectangleShape shape({rect.size.x - 2.0f * border, rect.size.y - 2.0f * border});
    shape.setPosition(rect.position + sf::Vector2f(border, border));
    shape.setFillColor(filled ? communityFillColor_ : sf::Color::Transparent);
    shape.setOutlineThickness(border);
    shape.setOutlineColor(borderColor_);
    target.draw(shape);
}

void SimulationRenderer::drawCommunities(sf::RenderTarget &target, const EpidemicSimulation &simulation)
{
    const World &world = simulation.getWorld();
    for (RegionId id : world.getCommunities())
    {
        const Region &community = world.getRegion(id);
        drawRegion(target, community, true);

        if (std::optional<sf::FloatRect> hub = community.getHub())
        {
            sf::RectangleShape hubShape(hub->size);
            hubShape.setPosition(hub->position);
            hubShape.setFillColor(sf::Color::Transparent);
            hubShape.setOutlineThickness(-community.getBorderThickness());
            hubShape.setOutlineColor(borderColor_);
            target.draw(hubShape);
        }

        sf::Text label(font_, community.getLabel(), 18);
        label.setFillColor(sf::Color::White);
        label.setPosition({community.left() + 20.0f, community.top() + 20.0f});
        target.draw(label);
    }
}

void SimulationRenderer::drawPersons(sf::RenderTarget &target, const EpidemicSimulation &simulation)
{
    const SimulationSettings &settings = simulation.getSettings();
    const Controls &controls = simulation.getControls();
    const float radius = settings.personRadius;

    sf::VertexArray lines(sf::PrimitiveType::Lines);

    sf::CircleShape body(radius);
    body.setOrigin({radius, radius});

    sf::CircleShape ring(radius * 3.0f);
    ring.setOrigin({radius * 3.0f, radius * 3.0f});
    ring.setFillColor(sf::Color::Transparent);
    ring.setOutlineThickness(1.0f);
    ring.setOutlineColor(distancingRingColor_);

    for (const Person &person : simulation.getPopulation().getPersons())
    {
        sf::Vector2f position = person.getPosition();

        if (controls.showNetwork)
        {
            // half way toward each neighbor, the neighbor draws the other half
            for (const Person::Neighbor &neighbor : person.getNeighbors())
            {
                if (neighbor.distance <= 0.0f)
                    continue;
                sf::Color color = Person::networkColor(neighbor.distance, settings.distancingRadius);
                lines.append(sf::Vertex{position, color});
                lines.append(sf::Vertex{position + neighbor.offset / 2.0f, color});
            }
        }

        if (person.isTraveling())
        {
            lines.append(sf::Vertex{position, travelColor_});
            lines.append(sf::Vertex{position + person.getDirection() * 20.0f, travelColor_});
        }
        else if (controls.showDirections && !person.isDeceased())
        {
            lines.append(sf::Vertex{position, directionColor_});
            lines.append(sf::Vertex{position + person.getDirection() * 20.0f, directionColor_});
        }

        if (controls.distancingEnabled && person.isDistancing() && !person.getNeighbors().empty())
        {
            ring.setPosition(position);
            target.draw(ring);
        }

        body.setPosition(position);
        body.setFillColor(person.getColor());
        target.draw(body);
    }

    target.draw(lines);
}

void SimulationRenderer::drawChart(sf::RenderTarget &target, const EpidemicSimulation &simulation)
{
    const Chart &chart = simulation.getChart();
    sf::FloatRect area = chartArea(simulation);
    const float bottom = area.position.y + area.size.y;
    const float height = area.size.y;

    sf::VertexArray columns(sf::PrimitiveType::Lines);
    float x = area.position.x;
    for (const Chart::Sample &sample : chart.getData())
    {
        if (sample.marker)
        {
            columns.append(sf::Vertex{{x, bottom}, *sample.marker});
            columns.append(sf::Vertex{{x, area.position.y}, *sample.marker});
        }
        else
        {
            // stack the series bottom to top
            float stacked = 0.0f;
            for (size_t i = 0; i < sample.fractions.size() && i < chart.getSeries().size(); ++i)
            {
                float length = std::round(sample.fractions[i] * height);
                sf::Color color = chart.getSeries()[i].color;
                float start = bottom - stacked;
                float end = std::max(area.position.y, start - length);
                columns.append(sf::Vertex{{x, start}, color});
                columns.append(sf::Vertex{{x, end}, color});
                stacked += length;
            }
        }
        x += 1.0f;
    }
    target.draw(columns);

    sf::RectangleShape frame(area.size);
    frame.setPosition(area.position);
    frame.setFillColor(sf::Color::Transparent);
    frame.setOutlineThickness(1.0f);
    frame.setOutlineColor(sf::Color(100, 100, 100));
    target.draw(frame);
}
