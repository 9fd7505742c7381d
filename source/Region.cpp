#include "Region.h"
#include <algorithm>

Region::Region(std::string label, sf::Vector2f center, sf::Vector2f size, float borderThickness)
    : label_(std::move(label)), center_(center), size_(size), borderThickness_(borderThickness)
{
}

Region Region::community(std::string label, sf::Vector2f center, sf::Vector2f size,
                         float hubSize, float borderThickness)
{
    Region region(std::move(label), center, size, borderThickness);
    region.hubSize_ = std::max(1.0f, hubSize);
    return region;
}

sf::FloatRect Region::getRect() const
{
    return sf::FloatRect(center_ - size_ / 2.0f, size_);
}

bool Region::contains(sf::Vector2f point) const
{
    return getRect().contains(point);
}

void Region::resize(sf::Vector2f size)
{
    size_ = size;
}

std::optional<sf::FloatRect> Region::getHub() const
{
    if (!hubSize_)
        return std::nullopt;

    float hubSize = *hubSize_;
    return sf::FloatRect({right() - hubSize, bottom() - hubSize}, {hubSize, hubSize});
}
