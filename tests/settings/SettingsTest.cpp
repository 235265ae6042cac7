// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "settings/Settings.h" // The class under test.

#include "settings/types/LayerIndex.h"
#include "settings/types/Ratio.h"
#include "utils/Range.h"
#include "utils/exceptions.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

// NOLINTBEGIN(*-magic-numbers)
namespace flowscale
{

/*
 * A test fixture with an empty settings object to test with.
 */
class SettingsTest : public testing::Test
{
public:
    Settings settings;
};

TEST_F(SettingsTest, AddSettingString)
{
    const std::string setting_value("Extrusion is the act of pushing plastic through a nozzle.");
    settings.add("test_setting", setting_value);
    EXPECT_EQ(setting_value, settings.get<std::string>("test_setting"));
}

TEST_F(SettingsTest, AddSettingDouble)
{
    settings.add("test_setting", "1234567.890");
    EXPECT_DOUBLE_EQ(double(1234567.89), settings.get<double>("test_setting"));

    settings.add("test_setting", " -0.25 ");
    EXPECT_DOUBLE_EQ(-0.25, settings.get<double>("test_setting")) << "Surrounding whitespace is ignored.";
}

TEST_F(SettingsTest, AddSettingDoubleInvalid)
{
    settings.add("test_setting", "0.9x");
    EXPECT_THROW(settings.get<double>("test_setting"), ConfigurationError);

    settings.add("test_setting", "1e-1");
    EXPECT_THROW(settings.get<double>("test_setting"), ConfigurationError);
}

TEST_F(SettingsTest, AddSettingBool)
{
    settings.add("test_setting", "true");
    EXPECT_EQ(true, settings.get<bool>("test_setting"));

    settings.add("test_setting", "on");
    EXPECT_EQ(true, settings.get<bool>("test_setting"));

    settings.add("test_setting", "yes");
    EXPECT_EQ(true, settings.get<bool>("test_setting"));

    settings.add("test_setting", "True");
    EXPECT_EQ(true, settings.get<bool>("test_setting"));

    settings.add("test_setting", "50");
    EXPECT_EQ(true, settings.get<bool>("test_setting"));

    settings.add("test_setting", "0");
    EXPECT_EQ(false, settings.get<bool>("test_setting"));

    settings.add("test_setting", "false");
    EXPECT_EQ(false, settings.get<bool>("test_setting"));

    settings.add("test_setting", "");
    EXPECT_EQ(false, settings.get<bool>("test_setting"));

    settings.add("test_setting", "nonsense");
    EXPECT_EQ(false, settings.get<bool>("test_setting"));
}

TEST_F(SettingsTest, AddSettingRatio)
{
    settings.add("test_setting", "0.95");
    EXPECT_DOUBLE_EQ(0.95, settings.get<Ratio>("test_setting")) << "Flow ratios are plain multipliers, not percentages.";
}

TEST_F(SettingsTest, AddSettingLayerIndex)
{
    settings.add("test_setting", "4");
    EXPECT_EQ(LayerIndex(4), settings.get<LayerIndex>("test_setting")) << "Layer numbers are taken as they are given.";

    settings.add("test_setting", "-1");
    EXPECT_THROW(settings.get<LayerIndex>("test_setting"), ConfigurationError);

    settings.add("test_setting", "2.5");
    EXPECT_THROW(settings.get<LayerIndex>("test_setting"), ConfigurationError);
}

TEST_F(SettingsTest, AddSettingLayerRange)
{
    settings.add("test_setting", "3");
    Range<LayerIndex> range = settings.get<Range<LayerIndex>>("test_setting");
    EXPECT_EQ(LayerIndex(3), *range.min);
    EXPECT_EQ(LayerIndex(3), *range.max);

    settings.add("test_setting", "2:5");
    range = settings.get<Range<LayerIndex>>("test_setting");
    EXPECT_EQ(LayerIndex(2), *range.min);
    EXPECT_EQ(LayerIndex(5), *range.max);

    settings.add("test_setting", "2:");
    range = settings.get<Range<LayerIndex>>("test_setting");
    EXPECT_EQ(LayerIndex(2), *range.min);
    EXPECT_FALSE(range.max.has_value());

    settings.add("test_setting", ":5");
    range = settings.get<Range<LayerIndex>>("test_setting");
    EXPECT_FALSE(range.min.has_value());
    EXPECT_EQ(LayerIndex(5), *range.max);
}

TEST_F(SettingsTest, AddSettingLayerRangeInvalid)
{
    for (const std::string value : { ":", "a:b", "1:2:3", "-2:4", "" })
    {
        settings.add("test_setting", value);
        EXPECT_THROW(settings.get<Range<LayerIndex>>("test_setting"), ConfigurationError) << "'" << value << "' is not a layer range.";
    }
}

TEST_F(SettingsTest, AddSettingPath)
{
    settings.add("test_setting", "/tmp/part.gcode");
    EXPECT_EQ(std::filesystem::path("/tmp/part.gcode"), settings.get<std::filesystem::path>("test_setting"));
}

TEST_F(SettingsTest, OverwriteSetting)
{
    settings.add("test_setting", "first");
    settings.add("test_setting", "second");
    EXPECT_EQ("second", settings.get<std::string>("test_setting"));
}

TEST_F(SettingsTest, MissingSetting)
{
    EXPECT_FALSE(settings.has("test_setting"));
    EXPECT_THROW(settings.get<std::string>("test_setting"), ConfigurationError);
}

TEST_F(SettingsTest, LimitToParent)
{
    Settings parent;
    parent.add("layer_height", "0.2");
    parent.add("input", "/tmp/from_parent.gcode");
    settings.setParent(&parent);
    settings.add("input", "/tmp/from_child.gcode");

    EXPECT_TRUE(settings.has("layer_height"));
    EXPECT_DOUBLE_EQ(0.2, settings.get<double>("layer_height")) << "Settings that are not set locally come from the parent.";
    EXPECT_EQ("/tmp/from_child.gcode", settings.get<std::string>("input")) << "Local settings win over the parent.";
}

TEST_F(SettingsTest, AllSettingsString)
{
    settings.add("z_start", "0.4");
    settings.add("flow_ratio", "0.9");
    EXPECT_EQ(" --flow_ratio=\"0.9\" --z_start=\"0.4\"", settings.getAllSettingsString());
}

} // namespace flowscale
// NOLINTEND(*-magic-numbers)
