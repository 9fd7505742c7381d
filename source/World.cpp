#include "World.h"
#include "SimulationSettings.h"
#include <algorithm>
#include <stdexcept>

World World::createDefault(const SimulationSettings &settings)
{
    World world;

    const float margin = settings.layoutMargin;
    const float border = settings.borderThickness;
    const float height = static_cast<float>(settings.height);
    const float fieldWidth = static_cast<float>(settings.width - settings.panelWidth);
    const float panelWidth = static_cast<float>(settings.panelWidth);

    world.field_ = world.addRegion(Region("Field", {fieldWidth / 2.0f, height / 2.0f},
                                          {fieldWidth - 2.0f * margin, height - 2.0f * margin}, border));
    world.panel_ = world.addRegion(Region("Settings", {fieldWidth + panelWidth / 2.0f, height / 2.0f},
                                          {panelWidth - 2.0f * margin, height - 2.0f * margin}, border));

    // largest square that fits the field, split into quadrants
    const Region &field = world.getRegion(world.field_);
    float side = std::min(field.right() - field.left(), field.bottom() - field.top());
    sf::Vector2f origin(field.getCenter().x - side / 2.0f, field.getCenter().y - side / 2.0f);
    float half = side / 2.0f;
    sf::Vector2f quadrantSize(half - 2.0f * margin, half - 2.0f * margin);

    // cycle order: top left, top right, bottom right, bottom left
    struct Quadrant
    {
        const char *label;
        float column;
        float row;
    };
    const Quadrant quadrants[] = {{"TL", 0, 0}, {"TR", 1, 0}, {"BR", 1, 1}, {"BL", 0, 1}};
    for (const auto &quadrant : quadrants)
    {
        sf::Vector2f center(origin.x + half * quadrant.column + half / 2.0f,
                            origin.y + half * quadrant.row + half / 2.0f);
        world.addCommunity(Region::community(quadrant.label, center, quadrantSize, settings.hubSize, border));
    }

    world.setCommunitiesActive(settings.communitiesEnabled);
    return world;
}

RegionId World::addRegion(Region region)
{
    regions_.push_back(std::move(region));
    return regions_.size() - 1;
}

RegionId World::addCommunity(Region community)
{
    if (!community.isCommunity())
    {
        throw std::invalid_argument("addCommunity: region '" + community.getLabel() + "' has no hub");
    }
    RegionId id = addRegion(std::move(community));
    communities_.push_back(id);
    return id;
}

RegionId World::getEffectiveBounds(const Bounds &bounds) const
{
    return getRegion(bounds.community).isActive() ? bounds.community : bounds.region;
}

std::optional<RegionId> World::getCommunityAt(sf::Vector2f point) const
{
    for (RegionId id : communities_)
    {
        if (regions_[id].contains(point))
            return id;
    }
    return std::nullopt;
}

void World::setCommunitiesActive(bool active)
{
    for (RegionId id : communities_)
    {
        regions_[id].setActive(active);
    }
}

RegionId World::nextCommunity()
{
    if (communities_.empty())
    {
        throw std::logic_error("nextCommunity: world has no communities");
    }
    RegionId id = communities_[communityCursor_ % communities_.size()];
    communityCursor_ = (communityCursor_ + 1) % communities_.size();
    return id;
}
