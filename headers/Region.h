#pragma once
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include <optional>
#include <string>

// handle into the World's region table
using RegionId = std::size_t;

// axis aligned containment rectangle
// a region with a hub is a community: the finer grained zone persons prefer
// while communities are enabled, and the arrival point for travel
class Region
{
public:
    Region(std::string label, sf::Vector2f center, sf::Vector2f size, float borderThickness = 2.0f);

    // community factory (hub square sits in the inner bottom right corner)
    static Region community(std::string label, sf::Vector2f center, sf::Vector2f size,
                            float hubSize, float borderThickness = 2.0f);

    // edges, inset by the border thickness
    float left() const { return center_.x - size_.x / 2.0f + borderThickness_; }
    float top() const { return center_.y - size_.y / 2.0f + borderThickness_; }
    float right() const { return center_.x + size_.x / 2.0f - borderThickness_; }
    float bottom() const { return center_.y + size_.y / 2.0f - borderThickness_; }

    sf::Vector2f getCenter() const { return center_; }
    sf::Vector2f getSize() const { return size_; }
    float getBorderThickness() const { return borderThickness_; }
    const std::string &getLabel() const { return label_; }

    // outer rectangle including the border
    sf::FloatRect getRect() const;
    bool contains(sf::Vector2f point) const;

    void resize(sf::Vector2f size);

    // community capability
    bool isCommunity() const { return hubSize_.has_value(); }
    std::optional<sf::FloatRect> getHub() const;
    bool isActive() const { return active_; }
    void setActive(bool active) { active_ = active; }

private:
    std::string label_;
    sf::Vector2f center_;
    sf::Vector2f size_;
    float borderThickness_;
    std::optional<float> hubSize_;
    bool active_ = true;
};

// the containment pair every person carries
// effective bounds = community while it is active, else the outer region
struct Bounds
{
    RegionId community;
    RegionId region;
};
