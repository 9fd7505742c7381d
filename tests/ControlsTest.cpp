#include <gtest/gtest.h>
#include "Controls.h"
#include "SimulationSettings.h"

TEST(ControlsTest, SetClampsIntoRange)
{
    NumericControl control("strength", 1.0f, 0.0f, 3.0f);

    control.set(10.0f);
    EXPECT_FLOAT_EQ(control.getValue(), 3.0f);
    control.adjust(-5.0f);
    EXPECT_FLOAT_EQ(control.getValue(), 0.0f);
}

TEST(ControlsTest, ChangeIsReportedOnce)
{
    NumericControl control("percent", 50.0f, 0.0f, 100.0f);
    EXPECT_FALSE(control.consumeChange());

    control.adjust(5.0f);
    EXPECT_TRUE(control.hasPendingChange());
    EXPECT_TRUE(control.consumeChange());
    EXPECT_FALSE(control.consumeChange());
}

TEST(ControlsTest, SettingSameValueIsNotAChange)
{
    NumericControl control("percent", 100.0f, 0.0f, 100.0f);

    control.set(100.0f);
    control.adjust(5.0f); // already at max
    EXPECT_FALSE(control.hasPendingChange());
}

TEST(ControlsTest, FromSettingsCopiesInitialValues)
{
    SimulationSettings settings;
    settings.distancingPercent = 40.0f;
    settings.distancingStrength = 2.5f;
    settings.distancingEnabled = true;
    settings.travelingEnabled = false;
    settings.showNetwork = true;

    Controls controls = Controls::fromSettings(settings);

    EXPECT_FLOAT_EQ(controls.distancingPercent.getValue(), 40.0f);
    EXPECT_FLOAT_EQ(controls.distancingStrength.getValue(), 2.5f);
    EXPECT_FALSE(controls.distancingPercent.hasPendingChange());
    EXPECT_TRUE(controls.distancingEnabled);
    EXPECT_FALSE(controls.travelingEnabled);
    EXPECT_TRUE(controls.communitiesEnabled);
    EXPECT_TRUE(controls.showNetwork);
    EXPECT_FALSE(controls.showDirections);
}
