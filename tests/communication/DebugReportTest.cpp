// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "communication/DebugReport.h" // The class under test.

#include "RunStats.h"
#include "communication/CommandLine.h" //For RunOptions.
#include "settings/ScalingConfig.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>

// NOLINTBEGIN(*-magic-numbers)
namespace flowscale
{

/*
 * Fixture with the results of a run that scaled a layer window.
 */
class DebugReportTest : public testing::Test
{
public:
    ScalingConfig config;
    RunOptions options;
    RunStats stats;

    void SetUp() override
    {
        config.flow_ratio = 0.9;
        options.input = "part.gcode";
        options.output = "part.gcode";
        options.in_place = true;

        stats.lines_total = 8;
        stats.lines_modified = 2;
        stats.g92_resets_seen = 1;
        stats.range_layers = Range<LayerIndex>(2, 3);
        stats.layer_height_used = 0.2;
        stats.extrusion_mode = EExtrusionMode::RELATIVE;
        stats.scaled_z = Range<double>(0.4, 0.6);
    }

    std::map<std::string, std::string> entries() const
    {
        const DebugReport report(config, options, stats);
        return std::map<std::string, std::string>(report.getEntries().begin(), report.getEntries().end());
    }
};

TEST_F(DebugReportTest, Entries)
{
    const std::map<std::string, std::string> result = entries();
    EXPECT_EQ("part.gcode", result.at("Input file"));
    EXPECT_EQ("0.9", result.at("Flow ratio"));
    EXPECT_EQ("true", result.at("Inplace"));
    EXPECT_EQ("none", result.at("Z-start"));
    EXPECT_EQ("none", result.at("Z-end"));
    EXPECT_EQ("true", result.at("Layer mode"));
    EXPECT_EQ("2", result.at("Layer start"));
    EXPECT_EQ("3", result.at("Layer end"));
    EXPECT_EQ("0.2", result.at("Layer height"));
    EXPECT_EQ("relative", result.at("Extrusion mode"));
    EXPECT_EQ("1", result.at("G92 E0 resets"));
    EXPECT_EQ("8", result.at("Total lines"));
    EXPECT_EQ("2", result.at("Lines modified"));
    EXPECT_EQ("25.00%", result.at("Modified %"));
    EXPECT_EQ("0.4 - 0.6", result.at("Scaled Z span"));
}

TEST_F(DebugReportTest, NothingScaled)
{
    stats = RunStats();
    const std::map<std::string, std::string> result = entries();
    EXPECT_EQ("false", result.at("Layer mode"));
    EXPECT_EQ("none", result.at("Layer height"));
    EXPECT_EQ("0.00%", result.at("Modified %")) << "An empty input must not divide by zero.";
    EXPECT_EQ("none", result.at("Scaled Z span"));
}

TEST_F(DebugReportTest, Text)
{
    const DebugReport report(config, options, stats);
    const std::string text = report.str();
    EXPECT_EQ(size_t{ 0 }, text.rfind("=== flow_scale Debug Info ===\nInput file: part.gcode\n", 0));
    EXPECT_NE(std::string::npos, text.find("\nLines modified: 2\n"));
}

TEST_F(DebugReportTest, WriteToFile)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "flowscale_debug_report_test.txt";
    const DebugReport report(config, options, stats);
    ASSERT_TRUE(report.writeToFile(path));

    std::ifstream file(path, std::ios::binary);
    EXPECT_EQ(report.str(), std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()));
    file.close();
    std::filesystem::remove(path);
}

TEST_F(DebugReportTest, WriteToUnwritableFile)
{
    const DebugReport report(config, options, stats);
    EXPECT_FALSE(report.writeToFile("/nonexistent/flowscale/debug.txt")) << "Failing to write the report is not fatal.";
}

} // namespace flowscale
// NOLINTEND(*-magic-numbers)
