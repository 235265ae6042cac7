// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_ENVIRONMENTSETTINGS_H
#define SETTINGS_ENVIRONMENTSETTINGS_H

#include "settings/Settings.h"

#include <array>
#include <string_view>

namespace flowscale
{

/*!
 * Environment variables in which slicers pass the layer height to a
 * post-processing script, in order of preference.
 */
constexpr std::array<std::string_view, 7> LAYER_HEIGHT_VARIABLES{ "ORCASLICER_LAYER_HEIGHT", "SUPERSLICER_LAYER_HEIGHT", "SLIC3R_LAYER_HEIGHT", "BAMBU_LAYER_HEIGHT",
                                                                  "LAYER_HEIGHT",           "layer_height",             "LAYERHEIGHT" };

/*!
 * Environment variables in which slicers pass the path of the g-code file
 * they just wrote, in order of preference.
 */
constexpr std::array<std::string_view, 4> GCODE_PATH_VARIABLES{ "ORCASLICER_GCODE_OUTPUT_PATH", "SUPERSLICER_GCODE_OUTPUT_PATH", "SLIC3R_PP_OUTPUT_NAME", "BAMBU_GCODE_PATH" };

/*!
 * \brief Collect the settings that a slicer provides through the environment.
 *
 * The first layer height variable holding a positive number becomes
 * ``layer_height``; the first path variable naming an existing file becomes
 * ``input``. Variables that are unset, empty or unusable are skipped.
 *
 * This is the only place where the environment is read. The result is meant
 * to be the parent of the command line settings, so that explicit flags win.
 */
Settings readEnvironmentSettings();

} // namespace flowscale

#endif // SETTINGS_ENVIRONMENTSETTINGS_H
