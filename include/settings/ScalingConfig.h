// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_SCALINGCONFIG_H
#define SETTINGS_SCALINGCONFIG_H

#include "settings/types/LayerIndex.h"
#include "settings/types/Ratio.h"
#include "utils/Range.h"

#include <optional>

namespace flowscale
{
class Settings;

/*!
 * \brief Everything the rewriter needs to know about one run.
 *
 * Resolved once, before any line is processed, and not changed afterwards.
 */
struct ScalingConfig
{
    Ratio flow_ratio; //!< Multiplier for the extrusion of every move inside the window.
    Range<double> z_range; //!< Inclusive height window in mm. Unbounded if not set.
    Range<LayerIndex> layer_range; //!< Inclusive window of 1-based layer numbers. Unbounded if not set.
    std::optional<double> layer_height; //!< Needed to tell which layer a height belongs to.
    bool force = false; //!< Skip the check for an extrusion reset before the first scaled move.
    bool debug = false; //!< Whether a debug report of the run was asked for.

    /*!
     * \brief Read the configuration from settings.
     *
     * Uses the keys ``flow_ratio`` (required), ``z_start``, ``z_end``,
     * ``layers``, ``layer_height``, ``force``, ``debug`` and ``debug_file``.
     * The result is validated before it is returned.
     * \throws ConfigurationError if a value is missing, malformed or invalid.
     */
    static ScalingConfig fromSettings(const Settings& settings);

    /*!
     * \brief Check the invariants of the configuration.
     * \throws ConfigurationError describing the first violation found.
     */
    void validate() const;

    /*!
     * Whether the scaling is restricted to a window at all. If not, every
     * extrusion in the file is scaled.
     */
    bool hasWindow() const
    {
        return z_range.isBounded() || layer_range.isBounded();
    }
};

} // namespace flowscale

#endif // SETTINGS_SCALINGCONFIG_H
