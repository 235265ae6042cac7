// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "communication/GCodeStream.h"

#include "FlowRewriter.h"
#include "communication/CommandLine.h" //For STDIO_PATH.
#include "utils/exceptions.h"

#include <fmt/format.h>
#include <spdlog/details/os.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <system_error>

namespace flowscale
{

GCodeSource::GCodeSource(const std::filesystem::path& path)
    : path_{ path }
    , stream_{ &std::cin }
{
    if (path_ == STDIO_PATH)
    {
        return;
    }
    file_.open(path_, std::ios::in | std::ios::binary);
    if (! file_)
    {
        throw IoError(fmt::format("Could not open input file {}", path_.string()));
    }
    stream_ = &file_;
}

GCodeSource::GCodeSource(std::istream& stream)
    : stream_{ &stream }
{
}

bool GCodeSource::readLine(std::string& line)
{
    if (! std::getline(*stream_, line))
    {
        if (stream_->bad())
        {
            throw IoError(fmt::format("Failed to read from {}", path_.empty() ? "stream" : path_.string()));
        }
        return false;
    }
    if (! stream_->eof())
    {
        line.push_back('\n'); // getline only stops before the end of the input at a newline.
    }
    return true;
}

GCodeSink::GCodeSink(const std::filesystem::path& destination)
    : destination_{ destination }
{
    if (destination_ == STDIO_PATH)
    {
        stream_ = &std::cout;
        return;
    }
    // Next to the destination so the final rename stays on one file system. The pid keeps concurrent runs apart.
    temporary_path_ = destination_;
    temporary_path_ += fmt::format(".flowscale.{}.tmp", spdlog::details::os::pid());
    file_.open(temporary_path_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (! file_)
    {
        throw IoError(fmt::format("Could not create output file {}", temporary_path_.string()));
    }
}

GCodeSink::GCodeSink(std::ostream& stream)
    : stream_{ &stream }
{
}

GCodeSink::~GCodeSink()
{
    if (committed_ || temporary_path_.empty())
    {
        return;
    }
    file_.close();
    std::error_code error;
    if (! std::filesystem::remove(temporary_path_, error) && error)
    {
        spdlog::warn("Could not remove temporary file {}: {}", temporary_path_.string(), error.message());
    }
}

void GCodeSink::write(std::string_view line)
{
    if (stream_)
    {
        buffer_.append(line);
        return;
    }
    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (! file_)
    {
        throw IoError(fmt::format("Failed to write to {}", temporary_path_.string()));
    }
}

void GCodeSink::commit()
{
    if (stream_)
    {
        stream_->write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        stream_->flush();
        if (! *stream_)
        {
            throw IoError("Failed to write the output");
        }
        committed_ = true;
        return;
    }

    file_.close();
    if (! file_)
    {
        throw IoError(fmt::format("Failed to finish writing {}", temporary_path_.string()));
    }

    std::error_code error;
    // Keep the permissions of a file that is overwritten, e.g. when editing in-place.
    const std::filesystem::file_status status = std::filesystem::status(destination_, error);
    if (! error && std::filesystem::exists(status))
    {
        std::filesystem::permissions(temporary_path_, status.permissions(), error);
        if (error)
        {
            spdlog::warn("Could not copy the permissions of {}: {}", destination_.string(), error.message());
        }
    }

    std::filesystem::rename(temporary_path_, destination_, error);
    if (error)
    {
        throw IoError(fmt::format("Could not move the output to {}: {}", destination_.string(), error.message()));
    }
    committed_ = true;
}

RunStats rewriteStream(FlowRewriter& rewriter, GCodeSource& source, GCodeSink& sink)
{
    std::string line;
    while (source.readLine(line))
    {
        sink.write(rewriter.process(line));
    }
    sink.commit();
    return rewriter.getStats();
}

} // namespace flowscale
