#pragma once
#include <SFML/Graphics.hpp>
#include "EpidemicSimulation.h"
#include <functional>
#include <string>

class UIManager
{
public:
    UIManager(sf::Font &font);

    // event handling
    void handleInput(const sf::Event::KeyPressed *keyEvent, EpidemicSimulation &simulation);

    // rendering
    void drawHUD(sf::RenderWindow &window, const EpidemicSimulation &simulation);
    void drawControlPanel(sf::RenderWindow &window, const EpidemicSimulation &simulation);

    // ui state
    void toggleHelp() { showHelp_ = !showHelp_; }

    // callbacks for things the simulation cannot do itself
    std::function<void()> onSaveSettings;
    std::function<void()> onLoadSettings;

private:
    sf::Font &font_;
    bool showHelp_ = false;

    // ui styling
    sf::Color hudBackgroundColor_ = sf::Color(0, 0, 0, 150);
    sf::Color hudTextColor_ = sf::Color::White;
    sf::Color hudAccentColor_ = sf::Color::Yellow;

    // ui drawing helpers
    void drawBackground(sf::RenderWindow &window, const sf::FloatRect &bounds);
    void drawParameterSlider(sf::RenderWindow &window, const std::string &name,
                             float value, float min, float max, sf::Vector2f position);
    void drawToggle(sf::RenderWindow &window, const std::string &name, bool value, sf::Vector2f position);
    void drawHelpText(sf::RenderWindow &window);

    // input handling helpers
    void handleKeyboardInput(sf::Keyboard::Key key, EpidemicSimulation &simulation);
};
