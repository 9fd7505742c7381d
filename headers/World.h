#pragma once
#include "Region.h"
#include <SFML/System/Vector2.hpp>
#include <optional>
#include <vector>

class SimulationSettings;

// owns every region and community; persons only hold RegionId handles into it
class World
{
public:
    World() = default;

    // default screen layout: field on the left, control panel on the right,
    // a 2x2 grid of communities centered in the field
    static World createDefault(const SimulationSettings &settings);

    RegionId addRegion(Region region);
    RegionId addCommunity(Region community);

    const Region &getRegion(RegionId id) const { return regions_.at(id); }
    Region &getRegion(RegionId id) { return regions_.at(id); }
    size_t getRegionCount() const { return regions_.size(); }

    // community if active, else the outer region
    RegionId getEffectiveBounds(const Bounds &bounds) const;
    const Region &getEffectiveRegion(const Bounds &bounds) const { return getRegion(getEffectiveBounds(bounds)); }

    const std::vector<RegionId> &getCommunities() const { return communities_; }
    std::optional<RegionId> getCommunityAt(sf::Vector2f point) const;
    void setCommunitiesActive(bool active);

    // round robin over communities in insertion order
    RegionId nextCommunity();

    RegionId getField() const { return field_; }
    RegionId getPanel() const { return panel_; }
    void setField(RegionId id) { field_ = id; }
    void setPanel(RegionId id) { panel_ = id; }

private:
    std::vector<Region> regions_;
    std::vector<RegionId> communities_;
    size_t communityCursor_ = 0;
    RegionId field_ = 0;
    RegionId panel_ = 0;
};
