// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "communication/DebugReport.h"

#include "RunStats.h"
#include "communication/CommandLine.h" //For RunOptions.
#include "settings/ScalingConfig.h"

#include <fmt/format.h>
#include <fmt/os.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <optional>

namespace flowscale
{

namespace
{

template<typename T>
std::string optionalToString(const std::optional<T>& value)
{
    return value ? fmt::format("{}", *value) : "none";
}

std::string optionalToString(const std::optional<LayerIndex>& value)
{
    return value ? fmt::format("{}", value->value) : "none";
}

std::string boolToString(const bool value)
{
    return value ? "true" : "false";
}

} // namespace

DebugReport::DebugReport(const ScalingConfig& config, const RunOptions& options, const RunStats& stats)
{
    entries_ = {
        { "Input file", options.input.string() },
        { "Output file", options.output.string() },
        { "Flow ratio", fmt::format("{}", static_cast<double>(config.flow_ratio)) },
        { "Inplace", boolToString(options.in_place) },
        { "Z-start", optionalToString(stats.range_z.min) },
        { "Z-end", optionalToString(stats.range_z.max) },
        { "Layer mode", boolToString(stats.range_layers.isBounded()) },
        { "Layer start", optionalToString(stats.range_layers.min) },
        { "Layer end", optionalToString(stats.range_layers.max) },
        { "Layer height", optionalToString(stats.layer_height_used) },
        { "Extrusion mode", std::string(toString(stats.extrusion_mode)) },
        { "G92 E0 resets", fmt::format("{}", stats.g92_resets_seen) },
        { "Total lines", fmt::format("{}", stats.lines_total) },
        { "Lines modified", fmt::format("{}", stats.lines_modified) },
        { "Modified %", fmt::format("{:.2f}%", stats.modifiedPercentage()) },
        { "Scaled Z span", stats.scaled_z.isBounded() ? fmt::format("{} - {}", *stats.scaled_z.min, *stats.scaled_z.max) : "none" },
    };
}

std::string DebugReport::str() const
{
    std::string result = "=== flow_scale Debug Info ===\n";
    for (const auto& [key, value] : entries_)
    {
        result += fmt::format("{}: {}\n", key, value);
    }
    return result;
}

void DebugReport::writeToStderr() const
{
    fmt::print(stderr, "{}\n", str());
}

bool DebugReport::writeToFile(const std::filesystem::path& path) const
{
    try
    {
        fmt::ostream file = fmt::output_file(path.string());
        file.print("{}", str());
        file.close();
    }
    catch (const std::system_error& error)
    {
        spdlog::warn("Could not write debug file {}: {}", path.string(), error.what());
        return false;
    }
    spdlog::info("Debug info written to {}", path.string());
    return true;
}

} // namespace flowscale
