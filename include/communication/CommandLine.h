// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef COMMUNICATION_COMMANDLINE_H
#define COMMUNICATION_COMMANDLINE_H

#include "settings/ScalingConfig.h"
#include "settings/Settings.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowscale
{

constexpr std::string_view STDIO_PATH = "-";

constexpr std::string_view DEFAULT_DEBUG_PATH = "/tmp/flow_scale_debug.txt";

constexpr std::string_view USAGE = R"(flow_scale

Scale the extrusion (E values) of g-code moves by a flow ratio, optionally only
inside a Z-height or layer window.

Usage:
  flow_scale -r RATIO [options] [INPUT_FILE]
  flow_scale (-h | --help)
  flow_scale --version

Options:
  -h --help                        Show this screen.
  --version                        Show version.
  -r RATIO --flow-ratio=RATIO      Flow ratio to scale E values with.
  -i FILE --in=FILE                Input g-code file.
  -o FILE --out=FILE               Output g-code file, - for stdout [default: -].
  -z Z --z-start=Z                 Start Z-height in mm (inclusive).
  -Z Z --z-end=Z                   End Z-height in mm (inclusive).
  -l LAYERS --layers=LAYERS        Layer range, e.g. 3, 2:5, 2: or :5 (inclusive).
  -L HEIGHT --layer-height=HEIGHT  Layer height in mm (optional if the slicer provides it).
  -f --force                       Process even if the G92 E0 safety check fails.
  -p --inplace                     Modify the input file in-place.
  -d --debug                       Print debug info to stderr.
  -D --debug-file                  Write debug info to a file.
  --debug-path=FILE                File for the debug info [default: /tmp/flow_scale_debug.txt].
  -v --verbose                     Show debug log messages.

The input file is the --in file if given, else the file a slicer announces in
ORCASLICER_GCODE_OUTPUT_PATH, SUPERSLICER_GCODE_OUTPUT_PATH, SLIC3R_PP_OUTPUT_NAME
or BAMBU_GCODE_PATH, else INPUT_FILE, else stdin.
)";

/*!
 * \brief Where the g-code comes from and where the results go.
 */
struct RunOptions
{
    std::filesystem::path input{ STDIO_PATH }; //!< "-" for stdin.
    std::filesystem::path output{ STDIO_PATH }; //!< "-" for stdout.
    bool in_place = false;
    bool debug_to_stderr = false;
    std::optional<std::filesystem::path> debug_file; //!< Set if the debug report should be written to a file.
    bool verbose = false;
};

/*!
 * \brief Resolves the configuration of a run from the command line arguments
 * and the settings a slicer provided in the environment.
 *
 * The arguments are collected as settings whose parent holds the environment
 * settings, so an explicit flag always takes precedence over the environment.
 */
class CommandLine
{
public:
    /*!
     * \brief Parse the command line.
     * \param arguments The arguments, without the name of the executable.
     * \param environment The settings provided by the environment, see
     * readEnvironmentSettings().
     * \throws ConfigurationError if the arguments do not match the usage.
     */
    CommandLine(const std::vector<std::string>& arguments, Settings environment);

    CommandLine(const CommandLine&) = delete;
    CommandLine& operator=(const CommandLine&) = delete;

    bool isHelpRequested() const
    {
        return help_requested_;
    }

    bool isVersionRequested() const
    {
        return version_requested_;
    }

    const Settings& getSettings() const
    {
        return settings_;
    }

    /*!
     * \throws ConfigurationError if the ratio is missing or a value is invalid.
     */
    ScalingConfig getScalingConfig() const;

    /*!
     * \throws ConfigurationError if the files can't be resolved, e.g. when
     * editing stdin in-place.
     */
    RunOptions getRunOptions() const;

private:
    Settings environment_settings_;
    Settings settings_; //!< From the arguments. Its parent is environment_settings_.
    bool help_requested_ = false;
    bool version_requested_ = false;
};

} // namespace flowscale

#endif // COMMUNICATION_COMMANDLINE_H
