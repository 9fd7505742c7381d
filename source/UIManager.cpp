#include "UIManager.h"
#include "SimulationRenderer.h"
#include <sstream>
#include <iomanip>
#include <iostream>
#include <algorithm>

UIManager::UIManager(sf::Font &font) : font_(font) {}

void UIManager::handleInput(const sf::Event::KeyPressed *keyEvent, EpidemicSimulation &simulation)
{
    if (keyEvent)
    {
        handleKeyboardInput(keyEvent->code, simulation);
    }
}

void UIManager::drawHUD(sf::RenderWindow &window, const EpidemicSimulation &simulation)
{
    const Population &population = simulation.getPopulation();
    StateCounts counts = population.getCounts();

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "timer: " << simulation.getElapsedTime() << "\n";
    oss << "people: " << population.size() << "\n";
    oss << "distancers: " << population.getDistancerCount() << "\n";
    for (Person::State state : {Person::State::Susceptible, Person::State::Infected,
                                Person::State::Recovered, Person::State::Deceased})
    {
        oss << Person::stateName(state) << ": " << counts[stateIndex(state)] << "\n";
    }

    const World &world = simulation.getWorld();
    const Region &field = world.getRegion(world.getField());

    sf::Text text(font_, oss.str(), 20);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.5f);
    text.setLineSpacing(1.6f);
    text.setPosition({field.left() + 20.0f, field.top() + 20.0f});
    window.draw(text);

    if (showHelp_)
        drawHelpText(window);
}

void UIManager::drawControlPanel(sf::RenderWindow &window, const EpidemicSimulation &simulation)
{
    const World &world = simulation.getWorld();
    const Region &panel = world.getRegion(world.getPanel());
    const Controls &controls = simulation.getControls();

    sf::Vector2f pos(panel.left() + 20.0f, panel.top() + 20.0f);
    float lineHeight = 30.0f;

    drawToggle(window, "Show Directions [F]", controls.showDirections, pos);
    pos.y += lineHeight;
    drawToggle(window, "Show Network [N]", controls.showNetwork, pos);
    pos.y += lineHeight;
    drawToggle(window, "Social Distance [D]", controls.distancingEnabled, pos);
    pos.y += lineHeight;
    drawToggle(window, "Enable Communities [C]", controls.communitiesEnabled, pos);
    pos.y += lineHeight;
    drawToggle(window, "Enable Traveling [V]", controls.travelingEnabled, pos);

    // sliders sit just below the chart
    sf::FloatRect chart = SimulationRenderer::chartArea(simulation);
    pos = {panel.left() + 20.0f, chart.position.y + chart.size.y + 20.0f};
    const NumericControl &percent = controls.distancingPercent;
    drawParameterSlider(window, "Distancing % [Up/Down]", percent.getValue(), percent.getMin(), percent.getMax(), pos);
    pos.y += lineHeight * 1.5f;
    const NumericControl &strength = controls.distancingStrength;
    drawParameterSlider(window, "Distancing Strength [Left/Right]", strength.getValue(), strength.getMin(), strength.getMax(), pos);
    pos.y += lineHeight * 1.5f;

    sf::Text actions(font_, "[A] Add 10  [R] Remove 10  [I] Infect 1\n[Z] Randomize Distancers  [T] Travel 1\n[H] Help", 14);
    actions.setFillColor(hudAccentColor_);
    actions.setPosition(pos);
    window.draw(actions);
}

void UIManager::handleKeyboardInput(sf::Keyboard::Key key, EpidemicSimulation &simulation)
{
    Controls &controls = simulation.getControls();

    switch (key)
    {
    // population actions
    case sf::Keyboard::Key::A:
        simulation.addPersons(EpidemicSimulation::BATCH_SIZE);
        break;
    case sf::Keyboard::Key::R:
        simulation.removePersons(EpidemicSimulation::BATCH_SIZE);
        break;
    case sf::Keyboard::Key::I:
        if (!simulation.infectOne())
            std::cout << "Nobody left to infect" << std::endl;
        break;
    case sf::Keyboard::Key::Z:
        simulation.randomizeDistancers();
        break;
    case sf::Keyboard::Key::T:
        if (!simulation.travelOne())
            std::cout << "Nobody available to travel" << std::endl;
        break;

    // toggles
    case sf::Keyboard::Key::D:
        simulation.setDistancingEnabled(!controls.distancingEnabled);
        break;
    case sf::Keyboard::Key::V:
        simulation.setTravelingEnabled(!controls.travelingEnabled);
        break;
    case sf::Keyboard::Key::C:
        simulation.setCommunitiesEnabled(!controls.communitiesEnabled);
        break;
    case sf::Keyboard::Key::F:
        controls.showDirections = !controls.showDirections;
        break;
    case sf::Keyboard::Key::N:
        controls.showNetwork = !controls.showNetwork;
        break;

    // sliders
    case sf::Keyboard::Key::Up:
        controls.distancingPercent.adjust(5.0f);
        break;
    case sf::Keyboard::Key::Down:
        controls.distancingPercent.adjust(-5.0f);
        break;
    case sf::Keyboard::Key::Right:
        controls.distancingStrength.adjust(0.1f);
        break;
    case sf::Keyboard::Key::Left:
        controls.distancingStrength.adjust(-0.1f);
        break;

    // settings file
    case sf::Keyboard::Key::S:
        if (onSaveSettings)
            onSaveSettings();
        break;
    case sf::Keyboard::Key::L:
        if (onLoadSettings)
            onLoadSettings();
        break;

    case sf::Keyboard::Key::H:
        toggleHelp();
        break;

    default:
        break;
    }
}

void UIManager::drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds)
{
    sf::RectangleShape background(sf::Vector2f(bounds.size.x, bounds.size.y));
    background.setPosition({bounds.position.x, bounds.position.y});
    background.setFillColor(hudBackgroundColor_);
    background.setOutlineThickness(1.0f);
    background.setOutlineColor(sf::Color(100, 100, 100));
    window.draw(background);
}

void UIManager::drawParameterSlider(sf::RenderWindow &window, const std::string &name,
                                    float value, float min, float max, sf::Vector2f position)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << name << ": " << value;

    sf::Text text(font_, oss.str(), 16);
    text.setFillColor(hudTextColor_);
    text.setPosition(position);
    window.draw(text);

    float progress = max > min ? std::clamp((value - min) / (max - min), 0.0f, 1.0f) : 0.0f;
    sf::RectangleShape barBg(sf::Vector2f(300.0f, 4.0f));
    barBg.setPosition({position.x, position.y + 24.0f});
    barBg.setFillColor(sf::Color(50, 50, 50));
    barBg.setOutlineThickness(1.0f);
    barBg.setOutlineColor(sf::Color(100, 100, 100));
    window.draw(barBg);

    sf::RectangleShape bar(sf::Vector2f(300.0f * progress, 4.0f));
    bar.setPosition({position.x, position.y + 24.0f});
    bar.setFillColor(hudAccentColor_);
    window.draw(bar);
}

void UIManager::drawToggle(sf::RenderWindow &window, const std::string &name, bool value, sf::Vector2f position)
{
    sf::RectangleShape box({16.0f, 16.0f});
    box.setPosition({position.x, position.y + 3.0f});
    box.setFillColor(value ? hudAccentColor_ : sf::Color::Transparent);
    box.setOutlineThickness(1.0f);
    box.setOutlineColor(hudTextColor_);
    window.draw(box);

    sf::Text text(font_, name, 16);
    text.setFillColor(hudTextColor_);
    text.setPosition({position.x + 26.0f, position.y});
    window.draw(text);
}

void UIManager::drawHelpText(sf::RenderWindow &window)
{
    std::ostringstream oss;
    oss << "=== Controls ===" << "\n";
    oss << "[A] Add 10 people | [R] Remove 10 people" << "\n";
    oss << "[I] Infect 1 person | [T] Send 1 person traveling" << "\n";
    oss << "[Z] Randomize distancers" << "\n";
    oss << "[D] Social distancing | [V] Traveling | [C] Communities" << "\n";
    oss << "[F] Directions overlay | [N] Network overlay" << "\n";
    oss << "[Up/Down] Distancing % | [Left/Right] Distancing strength" << "\n";
    oss << "[S] Save | [L] Load settings" << "\n";
    oss << "[Left click] Add a person | [Esc] Quit" << "\n";

    sf::Text text(font_, oss.str(), 16);
    text.setFillColor(hudTextColor_);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(1.0f);

    sf::Vector2f viewSize = window.getView().getSize();
    sf::FloatRect textBounds = text.getLocalBounds();
    sf::Vector2f pos((viewSize.x - textBounds.size.x) / 2.0f, (viewSize.y - textBounds.size.y) / 2.0f);
    text.setPosition(pos);

    drawBackground(window, sf::FloatRect({pos.x - 10.0f, pos.y - 10.0f},
                                         {textBounds.size.x + 20.0f, textBounds.size.y + 20.0f}));
    window.draw(text);
}
