#include "Controls.h"
#include "SimulationSettings.h"
#include <algorithm>

NumericControl::NumericControl(std::string name, float value, float min, float max)
    : name_(std::move(name)), value_(std::clamp(value, min, max)), min_(min), max_(max)
{
}

void NumericControl::set(float value)
{
    float clamped = std::clamp(value, min_, max_);
    if (clamped != value_)
    {
        value_ = clamped;
        changed_ = true;
    }
}

bool NumericControl::consumeChange()
{
    bool changed = changed_;
    changed_ = false;
    return changed;
}

Controls Controls::fromSettings(const SimulationSettings &settings)
{
    Controls controls;
    controls.distancingPercent = NumericControl("distancing percent", settings.distancingPercent, 0.0f, 100.0f);
    controls.distancingStrength = NumericControl("distancing strength", settings.distancingStrength, 0.0f, 3.0f);
    controls.distancingEnabled = settings.distancingEnabled;
    controls.travelingEnabled = settings.travelingEnabled;
    controls.communitiesEnabled = settings.communitiesEnabled;
    controls.showDirections = settings.showDirections;
    controls.showNetwork = settings.showNetwork;
    return controls;
}
