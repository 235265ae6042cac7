// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "FlowRewriter.h"

#include "gcode/GCodeLine.h"
#include "utils/exceptions.h"
#include "utils/string.h" //For formatDecimal and trim.

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace flowscale
{

namespace
{

// Slack in mm when comparing a height against the window bounds.
constexpr double Z_TOLERANCE = 1e-6;

// Slack in layers, so that 0.6 / 0.2 = 2.9999999999999996 still counts as layer 3.
constexpr double LAYER_TOLERANCE = 1e-6;

// First layer number that no longer fits in a LayerIndex (2^63).
constexpr double MAX_LAYER_NUMBER = static_cast<double>(std::numeric_limits<LayerIndex::value_type>::max());

} // namespace

FlowRewriter::FlowRewriter(const ScalingConfig& config)
    : config_(config)
{
    if (config_.z_range.min)
    {
        z_window_.min = *config_.z_range.min - Z_TOLERANCE;
    }
    if (config_.z_range.max)
    {
        z_window_.max = *config_.z_range.max + Z_TOLERANCE;
    }

    stats_.range_z = config_.z_range;
    stats_.range_layers = config_.layer_range;
    stats_.layer_height_used = config_.layer_height;
}

std::string FlowRewriter::process(std::string_view line)
{
    stats_.lines_total++;

    const gcode::GCodeLine command = gcode::GCodeLine::parse(line);
    if (command.isMalformed())
    {
        spdlog::debug("Passing malformed line {} through unmodified: {}", stats_.lines_total, trim(line));
        return std::string(line);
    }

    switch (command.getCommandType())
    {
    case gcode::CommandType::ABSOLUTE_EXTRUSION:
        state_.extrusion_mode = EExtrusionMode::ABSOLUTE;
        stats_.extrusion_mode = state_.extrusion_mode;
        break;
    case gcode::CommandType::RELATIVE_EXTRUSION:
        state_.extrusion_mode = EExtrusionMode::RELATIVE;
        stats_.extrusion_mode = state_.extrusion_mode;
        break;
    case gcode::CommandType::SET_POSITION:
        setExtrusionPosition(command);
        break;
    case gcode::CommandType::MOVE:
        return processMove(line, command);
    case gcode::CommandType::NONE:
    case gcode::CommandType::OTHER:
        break;
    }
    return std::string(line);
}

bool FlowRewriter::isInRange() const
{
    return z_window_.inside(state_.current_z) && config_.layer_range.inside(state_.current_layer);
}

void FlowRewriter::setHeight(const double z)
{
    state_.current_z = z;
    if (! config_.layer_height)
    {
        return;
    }
    const double layer_number = std::floor(z / *config_.layer_height + LAYER_TOLERANCE);
    LayerIndex layer = 0;
    if (layer_number >= MAX_LAYER_NUMBER)
    {
        layer = std::numeric_limits<LayerIndex::value_type>::max(); // Absurd heights stay above every window bound.
    }
    else if (layer_number > 0.0)
    {
        layer = static_cast<LayerIndex::value_type>(layer_number);
    }
    if (layer != state_.current_layer)
    {
        spdlog::trace("Layer {} starts at Z{}", layer.value, z);
        state_.current_layer = layer;
    }
}

void FlowRewriter::setExtrusionPosition(const gcode::GCodeLine& command)
{
    const std::optional<gcode::GCodeWord> e = command.getWord('E');
    if (! e && command.hasWords())
    {
        return; // Only other axes are redefined.
    }

    // A G92 without any words zeroes all axes, E included.
    const double position = e ? e->value : 0.0;
    state_.last_e_absolute = position;
    state_.emitted_e_absolute = position;
    if (position == 0.0)
    {
        state_.e_reset_seen = true;
        stats_.g92_resets_seen++;
    }
}

std::string FlowRewriter::processMove(std::string_view line, const gcode::GCodeLine& command)
{
    if (const std::optional<gcode::GCodeWord> z = command.getWord('Z'))
    {
        setHeight(z->value);
    }
    const std::optional<gcode::GCodeWord> e = command.getWord('E');
    if (! e)
    {
        return std::string(line);
    }

    const bool in_range = isInRange();
    if (in_range != was_in_range_)
    {
        spdlog::debug("{} the scaling window at line {} (Z{}, layer {})", in_range ? "Entering" : "Leaving", stats_.lines_total, state_.current_z, state_.current_layer.value);
        was_in_range_ = in_range;
    }

    if (! in_range)
    {
        // Written as it is, but the filament still moves.
        if (state_.extrusion_mode == EExtrusionMode::RELATIVE)
        {
            state_.last_e_absolute += e->value;
            state_.emitted_e_absolute += e->value;
        }
        else
        {
            state_.last_e_absolute = e->value;
            state_.emitted_e_absolute = e->value;
        }
        return std::string(line);
    }

    const double scaled = scaleExtrusion(e->value);

    // Compare at the precision that is written, so a ratio of 1 reproduces the input exactly.
    const size_t max_decimals = std::max(e->decimals, EXTRUSION_DECIMALS);
    const std::string scaled_text = formatDecimal(scaled, e->decimals, max_decimals);
    if (scaled_text == formatDecimal(e->value, e->decimals, max_decimals))
    {
        return std::string(line);
    }

    checkSafety();
    stats_.lines_modified++;
    stats_.scaled_z.include(state_.current_z);

    std::string result;
    result.reserve(line.size() + scaled_text.size());
    result.append(line.substr(0, e->value_begin));
    result.append(scaled_text);
    result.append(line.substr(e->value_end));
    return result;
}

double FlowRewriter::scaleExtrusion(const double source_e)
{
    const double ratio = config_.flow_ratio;
    if (state_.extrusion_mode == EExtrusionMode::RELATIVE)
    {
        const double scaled = source_e * ratio;
        state_.last_e_absolute += source_e;
        state_.emitted_e_absolute += scaled;
        return scaled;
    }

    // Scale only the step since the previous move, and continue from where the output stream is.
    const double scaled = state_.emitted_e_absolute + (source_e - state_.last_e_absolute) * ratio;
    state_.last_e_absolute = source_e;
    state_.emitted_e_absolute = scaled;
    return scaled;
}

void FlowRewriter::checkSafety()
{
    if (safety_checked_)
    {
        return;
    }
    safety_checked_ = true;

    if (state_.e_reset_seen)
    {
        return;
    }
    if (config_.force)
    {
        spdlog::warn("No G92 E0 before the first scaled move at line {}; continuing because the check is forced.", stats_.lines_total);
        return;
    }
    throw SafetyValidationError(fmt::format("No G92 E0 extrusion reset before the first scaled move at line {}. Scaling E values relative to an unknown baseline may lead to "
                                            "incorrect extrusion. Use --force to override this check if you know what you're doing.",
                                            stats_.lines_total));
}

} // namespace flowscale
