#include <gtest/gtest.h>
#include "Chart.h"

namespace
{
    StateCounts makeCounts(int susceptible, int infected, int recovered, int deceased)
    {
        StateCounts counts{};
        counts[stateIndex(Person::State::Susceptible)] = susceptible;
        counts[stateIndex(Person::State::Infected)] = infected;
        counts[stateIndex(Person::State::Recovered)] = recovered;
        counts[stateIndex(Person::State::Deceased)] = deceased;
        return counts;
    }
}

TEST(ChartTest, StartsFullOfSusceptibleSamples)
{
    Chart chart(50, Chart::defaultSeries(), 1.0f, 1, 0.0);

    ASSERT_EQ(chart.getData().size(), 50u);
    const Chart::Sample &sample = chart.getData().front();
    ASSERT_EQ(sample.fractions.size(), 4u);
    EXPECT_FALSE(sample.marker.has_value());
    // infected, recovered, susceptible, deceased
    EXPECT_FLOAT_EQ(sample.fractions[0], 0.0f);
    EXPECT_FLOAT_EQ(sample.fractions[2], 1.0f);
}

TEST(ChartTest, SamplesOnlyAfterInterval)
{
    Chart chart(10, Chart::defaultSeries(), 1.0f, 1, 0.0);
    StateCounts counts = makeCounts(5, 3, 1, 1);

    EXPECT_FALSE(chart.update(counts, 0.5));
    EXPECT_DOUBLE_EQ(chart.getLastUpdate(), 0.0);

    EXPECT_TRUE(chart.update(counts, 1.0));
    const Chart::Sample &sample = chart.getData().back();
    EXPECT_FLOAT_EQ(sample.fractions[0], 0.3f);
    EXPECT_FLOAT_EQ(sample.fractions[1], 0.1f);
    EXPECT_FLOAT_EQ(sample.fractions[2], 0.5f);
    EXPECT_FLOAT_EQ(sample.fractions[3], 0.1f);

    EXPECT_FALSE(chart.update(counts, 1.5));
    EXPECT_TRUE(chart.update(counts, 2.0));
}

TEST(ChartTest, LengthStaysAtWidth)
{
    Chart chart(25, Chart::defaultSeries(), 0.0f, 3, 0.0);
    StateCounts counts = makeCounts(1, 1, 1, 1);

    for (int i = 1; i <= 200; ++i)
    {
        if (i % 7 == 0)
            chart.markEvent(sf::Color::Cyan);
        chart.update(counts, i * 0.1);
        ASSERT_EQ(chart.getData().size(), 25u);
    }
}

TEST(ChartTest, MarkerReplacesOneSample)
{
    Chart chart(10, Chart::defaultSeries(), 1.0f, 1, 0.0);
    StateCounts counts = makeCounts(10, 0, 0, 0);

    chart.markEvent(sf::Color(0, 255, 255));
    EXPECT_TRUE(chart.getPendingMarker().has_value());

    chart.update(counts, 1.0);
    ASSERT_TRUE(chart.getData().back().marker.has_value());
    EXPECT_EQ(*chart.getData().back().marker, sf::Color(0, 255, 255));
    EXPECT_FALSE(chart.getPendingMarker().has_value());

    chart.update(counts, 2.0);
    EXPECT_FALSE(chart.getData().back().marker.has_value());
}

TEST(ChartTest, SnapshotWidthRepeatsSamplesAfterMarker)
{
    Chart chart(10, Chart::defaultSeries(), 1.0f, 3, 0.0);
    StateCounts counts = makeCounts(0, 4, 0, 0);

    chart.markEvent(sf::Color::Yellow);
    chart.update(counts, 1.0);

    const auto &data = chart.getData();
    EXPECT_TRUE(data[data.size() - 3].marker.has_value());
    EXPECT_FLOAT_EQ(data[data.size() - 2].fractions[0], 1.0f);
    EXPECT_FLOAT_EQ(data[data.size() - 1].fractions[0], 1.0f);
}

TEST(ChartTest, EmptyPopulationChartsZeros)
{
    Chart chart(5, Chart::defaultSeries(), 1.0f, 1, 0.0);
    chart.update(makeCounts(0, 0, 0, 0), 1.0);

    for (float fraction : chart.getData().back().fractions)
    {
        EXPECT_FLOAT_EQ(fraction, 0.0f);
    }
}
