// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "communication/CommandLine.h"

#include "utils/exceptions.h"

#include <docopt/docopt.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <map>
#include <utility>

namespace flowscale
{

namespace
{

// Command line option to setting key, for options that take a value.
constexpr std::array<std::pair<std::string_view, std::string_view>, 9> VALUE_OPTIONS{ {
    { "--flow-ratio", "flow_ratio" },
    { "--in", "input" },
    { "--out", "output" },
    { "--z-start", "z_start" },
    { "--z-end", "z_end" },
    { "--layers", "layers" },
    { "--layer-height", "layer_height" },
    { "--debug-path", "debug_path" },
    { "INPUT_FILE", "positional_input" },
} };

// Command line flag to setting key.
constexpr std::array<std::pair<std::string_view, std::string_view>, 5> FLAG_OPTIONS{ {
    { "--force", "force" },
    { "--inplace", "in_place" },
    { "--debug", "debug" },
    { "--debug-file", "debug_file" },
    { "--verbose", "verbose" },
} };

} // namespace

CommandLine::CommandLine(const std::vector<std::string>& arguments, Settings environment)
    : environment_settings_{ std::move(environment) }
{
    settings_.setParent(&environment_settings_);

    std::map<std::string, docopt::value> parsed;
    try
    {
        parsed = docopt::docopt_parse(std::string(USAGE), arguments, true, true);
    }
    catch (const docopt::DocoptExitHelp&)
    {
        help_requested_ = true;
        return;
    }
    catch (const docopt::DocoptExitVersion&)
    {
        version_requested_ = true;
        return;
    }
    catch (const docopt::DocoptArgumentError& error)
    {
        throw ConfigurationError(fmt::format("Invalid arguments: {}. A flow ratio (-r/--flow-ratio) is required.", error.what()));
    }

    for (const auto& [option, key] : VALUE_OPTIONS)
    {
        const docopt::value& value = parsed[std::string(option)];
        if (value && value.isString())
        {
            settings_.add(std::string(key), value.asString());
        }
    }
    for (const auto& [option, key] : FLAG_OPTIONS)
    {
        const docopt::value& value = parsed[std::string(option)];
        settings_.add(std::string(key), value && value.isBool() && value.asBool() ? "true" : "false");
    }
    spdlog::debug("Command line settings:{}", settings_.getAllSettingsString());
}

ScalingConfig CommandLine::getScalingConfig() const
{
    return ScalingConfig::fromSettings(settings_);
}

RunOptions CommandLine::getRunOptions() const
{
    RunOptions options;

    // --in, then the file announced by the slicer (the parent settings), then the positional argument.
    if (settings_.has("input"))
    {
        options.input = settings_.get<std::filesystem::path>("input");
    }
    else if (settings_.has("positional_input"))
    {
        options.input = settings_.get<std::filesystem::path>("positional_input");
    }

    options.in_place = settings_.has("in_place") && settings_.get<bool>("in_place");
    if (options.in_place)
    {
        if (options.input == STDIO_PATH)
        {
            throw ConfigurationError("Cannot use --inplace with stdin input.");
        }
        options.output = options.input;
    }
    else if (settings_.has("output"))
    {
        options.output = settings_.get<std::filesystem::path>("output");
    }

    options.debug_to_stderr = settings_.has("debug") && settings_.get<bool>("debug");
    if (settings_.has("debug_file") && settings_.get<bool>("debug_file"))
    {
        options.debug_file = settings_.has("debug_path") ? settings_.get<std::filesystem::path>("debug_path") : std::filesystem::path(DEFAULT_DEBUG_PATH);
    }
    options.verbose = settings_.has("verbose") && settings_.get<bool>("verbose");
    return options;
}

} // namespace flowscale
