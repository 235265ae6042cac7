// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "settings/ScalingConfig.h"

#include "settings/Settings.h"
#include "utils/exceptions.h"

#include <fmt/format.h>

namespace flowscale
{

ScalingConfig ScalingConfig::fromSettings(const Settings& settings)
{
    ScalingConfig config;
    if (! settings.has("flow_ratio"))
    {
        throw ConfigurationError("A flow ratio is required (-r/--flow-ratio).");
    }
    config.flow_ratio = settings.get<Ratio>("flow_ratio");
    if (settings.has("z_start"))
    {
        config.z_range.min = settings.get<double>("z_start");
    }
    if (settings.has("z_end"))
    {
        config.z_range.max = settings.get<double>("z_end");
    }
    if (settings.has("layers"))
    {
        config.layer_range = settings.get<Range<LayerIndex>>("layers");
    }
    if (settings.has("layer_height"))
    {
        config.layer_height = settings.get<double>("layer_height");
    }
    config.force = settings.has("force") && settings.get<bool>("force");
    config.debug = (settings.has("debug") && settings.get<bool>("debug")) || (settings.has("debug_file") && settings.get<bool>("debug_file"));

    config.validate();
    return config;
}

void ScalingConfig::validate() const
{
    if (! (flow_ratio > 0.0))
    {
        throw ConfigurationError(fmt::format("The flow ratio must be positive, got {}.", static_cast<double>(flow_ratio)));
    }
    if (layer_height && ! (*layer_height > 0.0))
    {
        throw ConfigurationError(fmt::format("The layer height must be positive, got {}.", *layer_height));
    }
    if (z_range.min && z_range.max && *z_range.min > *z_range.max)
    {
        throw ConfigurationError(fmt::format("The Z start ({}) lies above the Z end ({}).", *z_range.min, *z_range.max));
    }
    if (layer_range.min && layer_range.max && *layer_range.min > *layer_range.max)
    {
        throw ConfigurationError(fmt::format("The first layer ({}) comes after the last layer ({}).", layer_range.min->value, layer_range.max->value));
    }
    if (layer_range.isBounded() && ! layer_height)
    {
        throw ConfigurationError("Layer height not provided and could not be found in environment.");
    }
}

} // namespace flowscale
