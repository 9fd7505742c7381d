#pragma once
#include <string>

class SimulationSettings;

// bounded numeric control that remembers whether it changed since last checked
class NumericControl
{
public:
    NumericControl(std::string name, float value, float min, float max);

    float getValue() const { return value_; }
    float getMin() const { return min_; }
    float getMax() const { return max_; }
    const std::string &getName() const { return name_; }

    // clamps into [min, max]; a different value marks the control as changed
    void set(float value);
    void adjust(float delta) { set(value_ + delta); }

    // true exactly once per change
    bool consumeChange();
    bool hasPendingChange() const { return changed_; }

private:
    std::string name_;
    float value_;
    float min_;
    float max_;
    bool changed_ = false;
};

// control values read by the simulation every tick
struct Controls
{
    NumericControl distancingPercent{"distancing percent", 100.0f, 0.0f, 100.0f};
    NumericControl distancingStrength{"distancing strength", 1.0f, 0.0f, 3.0f};
    bool distancingEnabled = false;
    bool travelingEnabled = true;
    bool communitiesEnabled = true;
    bool showDirections = false;
    bool showNetwork = false;

    static Controls fromSettings(const SimulationSettings &settings);
};
