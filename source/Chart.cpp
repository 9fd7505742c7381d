#include "Chart.h"
#include <algorithm>
#include <numeric>

Chart::Chart(int width, std::vector<Series> series, float updateInterval, int snapshotWidth, double startTime)
    : width_(std::max(1, width)),
      series_(std::move(series)),
      updateInterval_(updateInterval),
      snapshotWidth_(std::max(1, snapshotWidth)),
      lastUpdate_(startTime)
{
    // start out as an entirely susceptible population
    Sample initial;
    for (const auto &entry : series_)
    {
        initial.fractions.push_back(entry.state == Person::State::Susceptible ? 1.0f : 0.0f);
    }
    data_.assign(static_cast<size_t>(width_), initial);
}

std::vector<Chart::Series> Chart::defaultSeries()
{
    return {{Person::State::Infected, Person::stateColor(Person::State::Infected)},
            {Person::State::Recovered, Person::stateColor(Person::State::Recovered)},
            {Person::State::Susceptible, Person::stateColor(Person::State::Susceptible)},
            {Person::State::Deceased, Person::stateColor(Person::State::Deceased)}};
}

bool Chart::update(const StateCounts &counts, double now)
{
    if (now - lastUpdate_ < updateInterval_)
        return false;

    for (int i = 0; i < snapshotWidth_; ++i)
    {
        if (eventMarker_)
        {
            Sample marker;
            marker.marker = *eventMarker_;
            append(std::move(marker));
            eventMarker_.reset();
        }
        else
        {
            append(proportions(counts));
        }
    }

    lastUpdate_ = now;
    return true;
}

Chart::Sample Chart::proportions(const StateCounts &counts) const
{
    int total = std::accumulate(counts.begin(), counts.end(), 0);

    Sample sample;
    sample.fractions.reserve(series_.size());
    for (const auto &entry : series_)
    {
        // an empty population charts as all zeros
        float fraction = total > 0 ? static_cast<float>(counts[stateIndex(entry.state)]) / total : 0.0f;
        sample.fractions.push_back(fraction);
    }
    return sample;
}

void Chart::append(Sample sample)
{
    data_.push_back(std::move(sample));
    while (data_.size() > static_cast<size_t>(width_))
    {
        data_.pop_front();
    }
}
