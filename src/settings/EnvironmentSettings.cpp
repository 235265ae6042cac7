// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "settings/EnvironmentSettings.h"

#include "utils/string.h" //For parseDecimal and trim.

#include <range/v3/algorithm/find_if.hpp>
#include <spdlog/details/os.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace flowscale
{

namespace
{

std::string readVariable(std::string_view name)
{
    return std::string(trim(spdlog::details::os::getenv(std::string(name).c_str())));
}

} // namespace

Settings readEnvironmentSettings()
{
    Settings settings;

    const auto layer_height_variable = ranges::find_if(
        LAYER_HEIGHT_VARIABLES,
        [](std::string_view name)
        {
            const std::optional<ParsedDecimal> layer_height = parseDecimal(readVariable(name));
            return layer_height && layer_height->value > 0.0;
        });
    if (layer_height_variable != LAYER_HEIGHT_VARIABLES.end())
    {
        const std::string value = readVariable(*layer_height_variable);
        spdlog::debug("Using layer height {} from {}", value, *layer_height_variable);
        settings.add("layer_height", value);
    }

    const auto path_variable = ranges::find_if(
        GCODE_PATH_VARIABLES,
        [](std::string_view name)
        {
            const std::string path = readVariable(name);
            std::error_code error;
            return ! path.empty() && std::filesystem::exists(path, error);
        });
    if (path_variable != GCODE_PATH_VARIABLES.end())
    {
        const std::string value = readVariable(*path_variable);
        spdlog::debug("Using input file {} from {}", value, *path_variable);
        settings.add("input", value);
    }

    return settings;
}

} // namespace flowscale
