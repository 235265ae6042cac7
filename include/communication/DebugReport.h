// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef COMMUNICATION_DEBUGREPORT_H
#define COMMUNICATION_DEBUGREPORT_H

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace flowscale
{
struct RunOptions;
struct RunStats;
struct ScalingConfig;

/*!
 * \brief Human readable summary of a run, for checking what a post-processing
 * step did to a print.
 */
class DebugReport
{
public:
    DebugReport(const ScalingConfig& config, const RunOptions& options, const RunStats& stats);

    /*!
     * The report as text: a header line, then one "key: value" line per entry.
     */
    std::string str() const;

    void writeToStderr() const;

    /*!
     * \brief Write the report to a file, replacing it.
     *
     * The report is a side product of the run, so failing to write it is
     * logged as a warning instead of failing the run.
     * \return Whether the file was written.
     */
    bool writeToFile(const std::filesystem::path& path) const;

    const std::vector<std::pair<std::string, std::string>>& getEntries() const
    {
        return entries_;
    }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace flowscale

#endif // COMMUNICATION_DEBUGREPORT_H
