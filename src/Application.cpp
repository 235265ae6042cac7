// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "Application.h"

#include "FlowRewriter.h"
#include "communication/CommandLine.h" //To resolve the configuration of the run.
#include "communication/DebugReport.h"
#include "communication/GCodeStream.h"
#include "settings/EnvironmentSettings.h"
#include "utils/exceptions.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/dup_filter_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <chrono>
#include <memory>
#include <string>

namespace flowscale
{

Application::Application()
{
    auto dup_sink = std::make_shared<spdlog::sinks::dup_filter_sink_mt>(std::chrono::seconds{ 10 });
    // stdout may be carrying the g-code, so log to stderr only.
    auto base_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    dup_sink->add_sink(base_sink);

    spdlog::default_logger()->sinks() = std::vector<std::shared_ptr<spdlog::sinks::sink>>{ dup_sink };

    if (auto spdlog_val = spdlog::details::os::getenv("FLOWSCALE_LOG_LEVEL"); ! spdlog_val.empty())
    {
        spdlog::cfg::helpers::load_levels(spdlog_val);
    };
}

Application& Application::getInstance()
{
    static Application instance; // Constructs using the default constructor.
    return instance;
}

void Application::printCall() const
{
    spdlog::error("Command called: {}", fmt::join(arguments_, " "));
}

void Application::printHelp() const
{
    fmt::print("{}", USAGE);
}

void Application::printLicense() const
{
    fmt::print(stderr, "\n");
    fmt::print(stderr, "flow_scale version {}\n", FLOWSCALE_VERSION);
    fmt::print(stderr, "Copyright (C) 2026 UltiMaker\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, "This program is free software: you can redistribute it and/or modify\n");
    fmt::print(stderr, "it under the terms of the GNU Affero General Public License as published by\n");
    fmt::print(stderr, "the Free Software Foundation, either version 3 of the License, or\n");
    fmt::print(stderr, "(at your option) any later version.\n");
    fmt::print(stderr, "\n");
}

int Application::run(const size_t argc, char** argv)
{
    arguments_.assign(argv, argv + argc);

    try
    {
        CommandLine command_line(std::vector<std::string>(arguments_.begin() + (arguments_.empty() ? 0 : 1), arguments_.end()), readEnvironmentSettings());
        if (command_line.isHelpRequested())
        {
            printHelp();
            return 0;
        }
        if (command_line.isVersionRequested())
        {
            printLicense();
            return 0;
        }

        const RunOptions options = command_line.getRunOptions();
        if (options.verbose)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        const ScalingConfig config = command_line.getScalingConfig();
        if (! config.hasWindow())
        {
            spdlog::info("No Z or layer range given, scaling the whole file.");
        }

        const RunStats stats = rewrite(config, options);

        if (options.debug_to_stderr || options.debug_file)
        {
            const DebugReport report(config, options, stats);
            if (options.debug_to_stderr)
            {
                report.writeToStderr();
            }
            if (options.debug_file)
            {
                report.writeToFile(*options.debug_file);
            }
        }
        return 0;
    }
    catch (const FlowScaleError& error)
    {
        spdlog::error("{}", error.what());
        printCall();
        return error.exitCode();
    }
}

RunStats Application::rewrite(const ScalingConfig& config, const RunOptions& options) const
{
    spdlog::stopwatch watch;

    FlowRewriter rewriter(config);
    RunStats stats;
    {
        GCodeSource source(options.input);
        GCodeSink sink(options.output);
        stats = rewriteStream(rewriter, source, sink);
    }

    spdlog::info("Scaled {} of {} lines by {} in {:.3}s", stats.lines_modified, stats.lines_total, static_cast<double>(config.flow_ratio), watch);
    return stats;
}

} // namespace flowscale
