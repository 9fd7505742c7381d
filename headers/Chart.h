#pragma once
#include <SFML/Graphics/Color.hpp>
#include <deque>
#include <optional>
#include <vector>
#include "Person.h"

// rolling stacked area time series of the population breakdown
// sampled on wall clock time, independent of the frame rate
class Chart
{
public:
    // one charted state, listed bottom to top
    struct Series
    {
        Person::State state;
        sf::Color color;
    };

    // either a fraction per series or an event marker color
    struct Sample
    {
        std::vector<float> fractions;
        std::optional<sf::Color> marker;
    };

    Chart(int width, std::vector<Series> series, float updateInterval, int snapshotWidth, double startTime);

    // infected, recovered, susceptible, deceased in their state colors
    static std::vector<Series> defaultSeries();

    // appends samples once the update interval has elapsed; returns whether it did
    bool update(const StateCounts &counts, double now);

    // replaces the next sample with a solid marker column
    void markEvent(sf::Color color) { eventMarker_ = color; }
    std::optional<sf::Color> getPendingMarker() const { return eventMarker_; }

    const std::deque<Sample> &getData() const { return data_; }
    const std::vector<Series> &getSeries() const { return series_; }
    int getWidth() const { return width_; }
    double getLastUpdate() const { return lastUpdate_; }

private:
    int width_;
    std::vector<Series> series_;
    float updateInterval_;
    int snapshotWidth_;
    double lastUpdate_;
    std::optional<sf::Color> eventMarker_;
    std::deque<Sample> data_;

    Sample proportions(const StateCounts &counts) const;
    void append(Sample sample);
};
