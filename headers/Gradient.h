#pragma once
#include <SFML/Graphics/Color.hpp>
#include <initializer_list>
#include <vector>

// piecewise linear color ramp between ordered stops
class Gradient
{
public:
    struct Stop
    {
        float value;
        sf::Color color;
    };

    Gradient(std::initializer_list<Stop> stops);
    explicit Gradient(std::vector<Stop> stops);

    // values outside the stop range clamp to the first/last color
    sf::Color getColor(float value) const;

    const std::vector<Stop> &getStops() const { return stops_; }

private:
    std::vector<Stop> stops_; // sorted by value

    static sf::Color interpolate(const Stop &lower, const Stop &upper, float value);
};
