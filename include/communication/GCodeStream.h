// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef COMMUNICATION_GCODESTREAM_H
#define COMMUNICATION_GCODESTREAM_H

#include "RunStats.h"

#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace flowscale
{
class FlowRewriter;

/*!
 * \brief Supplies the lines of a g-code file or of stdin.
 *
 * Lines are returned with their line ending (if they had one), and without
 * any newline translation, so that they can be written back verbatim.
 */
class GCodeSource
{
public:
    /*!
     * \param path The file to read, or "-" for stdin.
     * \throws IoError if the file can't be opened.
     */
    explicit GCodeSource(const std::filesystem::path& path);

    /*!
     * Read from a stream owned by the caller.
     */
    explicit GCodeSource(std::istream& stream);

    GCodeSource(const GCodeSource&) = delete;
    GCodeSource& operator=(const GCodeSource&) = delete;

    /*!
     * \brief Read the next line.
     * \param line Overwritten with the line, including its line ending.
     * \return false at the end of the input.
     * \throws IoError if reading fails.
     */
    bool readLine(std::string& line);

private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::istream* stream_;
};

/*!
 * \brief Receives the rewritten lines, and only makes them visible once the
 * whole run succeeded.
 *
 * Output for a file is written to a temporary file next to it, which replaces
 * the destination on commit. Output for stdout or another stream is buffered
 * until commit. If the sink is destroyed without being committed nothing is
 * written and the temporary file is removed.
 */
class GCodeSink
{
public:
    /*!
     * \param destination The file to write, or "-" for stdout. The file may be
     * the input file, for in-place editing.
     * \throws IoError if the temporary file can't be created.
     */
    explicit GCodeSink(const std::filesystem::path& destination);

    /*!
     * Write to a stream owned by the caller, on commit.
     */
    explicit GCodeSink(std::ostream& stream);

    ~GCodeSink();

    GCodeSink(const GCodeSink&) = delete;
    GCodeSink& operator=(const GCodeSink&) = delete;

    void write(std::string_view line);

    /*!
     * \brief Publish everything that was written.
     * \throws IoError if the output can't be completed.
     */
    void commit();

private:
    std::filesystem::path destination_;
    std::filesystem::path temporary_path_;
    std::ofstream file_;
    std::ostream* stream_ = nullptr; //!< Set when writing to a caller-owned stream instead of a file.
    std::string buffer_;
    bool committed_ = false;
};

/*!
 * \brief Run every line of \p source through \p rewriter into \p sink, and
 * commit the sink when the whole stream was processed.
 *
 * If the rewriter throws, the sink is left uncommitted.
 * \return The statistics of the run.
 */
RunStats rewriteStream(FlowRewriter& rewriter, GCodeSource& source, GCodeSink& sink);

} // namespace flowscale

#endif // COMMUNICATION_GCODESTREAM_H
