// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef UTILS_EXCEPTIONS_H
#define UTILS_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace flowscale
{

/*!
 * \brief Base class of every error that aborts a run.
 *
 * Each error kind maps onto its own process exit code, so that a slicer
 * calling us as a post-processing script can tell them apart.
 */
class FlowScaleError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;

    virtual int exitCode() const noexcept
    {
        return 1;
    }
};

/*!
 * \brief The run could not be configured: a missing or invalid flag, an
 * unresolvable layer height, an unusable input or output path.
 *
 * Always raised before any line is processed.
 */
class ConfigurationError : public FlowScaleError
{
public:
    using FlowScaleError::FlowScaleError;
};

/*!
 * \brief Extrusion would have been scaled relative to an unknown E baseline.
 */
class SafetyValidationError : public FlowScaleError
{
public:
    using FlowScaleError::FlowScaleError;

    int exitCode() const noexcept override
    {
        return 2;
    }
};

/*!
 * \brief Reading the input or committing the output failed.
 */
class IoError : public FlowScaleError
{
public:
    using FlowScaleError::FlowScaleError;

    int exitCode() const noexcept override
    {
        return 3;
    }
};

} // namespace flowscale

#endif // UTILS_EXCEPTIONS_H
