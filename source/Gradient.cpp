#include "Gradient.h"
#include <algorithm>
#include <stdexcept>
#include <cstdint>

Gradient::Gradient(std::initializer_list<Stop> stops)
    : Gradient(std::vector<Stop>(stops))
{
}

Gradient::Gradient(std::vector<Stop> stops)
    : stops_(std::move(stops))
{
    if (stops_.size() < 2)
    {
        throw std::invalid_argument("Gradient needs at least two color stops");
    }

    std::stable_sort(stops_.begin(), stops_.end(),
                     [](const Stop &a, const Stop &b)
                     { return a.value < b.value; });
}

sf::Color Gradient::getColor(float value) const
{
    if (value <= stops_.front().value)
        return stops_.front().color;
    if (value >= stops_.back().value)
        return stops_.back().color;

    // first pair of adjacent stops that brackets the value
    for (size_t i = 0; i + 1 < stops_.size(); ++i)
    {
        const Stop &lower = stops_[i];
        const Stop &upper = stops_[i + 1];
        if (value >= lower.value && value <= upper.value)
        {
            return interpolate(lower, upper, value);
        }
    }

    return stops_.back().color;
}

sf::Color Gradient::interpolate(const Stop &lower, const Stop &upper, float value)
{
    float span = upper.value - lower.value;
    if (span <= 0.0f)
        return lower.color;

    float t = (value - lower.value) / span;
    auto channel = [t](std::uint8_t from, std::uint8_t to)
    {
        float delta = static_cast<float>(to) - static_cast<float>(from);
        return static_cast<std::uint8_t>(static_cast<int>(from + delta * t));
    };

    return sf::Color(channel(lower.color.r, upper.color.r),
                     channel(lower.color.g, upper.color.g),
                     channel(lower.color.b, upper.color.b));
}
