#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "EpidemicSimulation.h"
#include "SimulationClock.h"
#include "SimulationRenderer.h"
#include "SimulationSettings.h"
#include "UIManager.h"

namespace
{
    const char *DEFAULT_SETTINGS_FILE = "epidemic_settings.txt";

    // current control positions become the new starting values
    SimulationSettings captureControls(SimulationSettings settings, const Controls &controls)
    {
        settings.distancingPercent = controls.distancingPercent.getValue();
        settings.distancingStrength = controls.distancingStrength.getValue();
        settings.distancingEnabled = controls.distancingEnabled;
        settings.travelingEnabled = controls.travelingEnabled;
        settings.communitiesEnabled = controls.communitiesEnabled;
        settings.showDirections = controls.showDirections;
        settings.showNetwork = controls.showNetwork;
        return settings;
    }
}

int main(int argc, char *argv[])
{
    const std::string settingsPath = argc > 1 ? argv[1] : DEFAULT_SETTINGS_FILE;

    SimulationSettings settings;
    if (std::filesystem::exists(settingsPath))
    {
        if (settings.loadFromFile(settingsPath))
            std::cout << "Loaded settings from " << settingsPath << std::endl;
    }
    else if (argc > 1)
    {
        std::cerr << "Error: settings file not found: " << settingsPath << std::endl;
        return 1;
    }
    settings.validateAndClamp();

    const unsigned int width = static_cast<unsigned int>(settings.width);
    const unsigned int height = static_cast<unsigned int>(settings.height);
    sf::RenderWindow window(sf::VideoMode({width, height}), "Epidemic Simulation");
    window.setFramerateLimit(static_cast<unsigned int>(settings.frameRate));
    // the simulation always works in layout coordinates, whatever the window size
    window.setView(sf::View(sf::FloatRect({0.0f, 0.0f}, {static_cast<float>(width), static_cast<float>(height)})));

    sf::Font font;
    if (!font.openFromFile("DejaVuSans.ttf") &&
        !font.openFromFile("bin/DejaVuSans.ttf") &&
        !font.openFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"))
    {
        std::cout << "Warning: Could not load font file, HUD text may not display properly" << std::endl;
    }

    SfmlClock simulationClock;
    auto simulation = std::make_unique<EpidemicSimulation>(settings, simulationClock);

    SimulationRenderer renderer(font);
    UIManager ui(font);

    ui.onSaveSettings = [&]()
    {
        SimulationSettings current = captureControls(simulation->getSettings(), simulation->getControls());
        if (current.saveToFile(settingsPath))
        {
            std::cout << "Settings saved to " << settingsPath << std::endl;
        }
    };
    // the simulation is rebuilt after event handling, never while it is handling a key
    bool reloadRequested = false;
    ui.onLoadSettings = [&]()
    {
        reloadRequested = true;
    };

    sf::Clock frameClock;

    try
    {
        while (window.isOpen())
        {
            float frameTime = frameClock.restart().asSeconds();

            while (const std::optional event = window.pollEvent())
            {
                if (event->is<sf::Event::Closed>())
                {
                    window.close();
                }
                else if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
                {
                    if (keyPressed->code == sf::Keyboard::Key::Escape)
                        window.close();
                    else
                        ui.handleInput(keyPressed, *simulation);
                }
                else if (const auto *mousePressed = event->getIf<sf::Event::MouseButtonPressed>())
                {
                    if (mousePressed->button == sf::Mouse::Button::Left)
                    {
                        simulation->addPersonAt(window.mapPixelToCoords(mousePressed->position));
                    }
                }
            }

            if (reloadRequested)
            {
                reloadRequested = false;
                SimulationSettings loaded;
                if (loaded.loadFromFile(settingsPath))
                {
                    settings = loaded;
                    simulation = std::make_unique<EpidemicSimulation>(settings, simulationClock);
                    std::cout << "Settings loaded, simulation restarted" << std::endl;
                }
            }

            simulation->update(frameTime);

            renderer.draw(window, *simulation);
            ui.drawHUD(window, *simulation);
            ui.drawControlPanel(window, *simulation);
            window.display();
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
