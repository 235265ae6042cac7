// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef RUNSTATS_H
#define RUNSTATS_H

#include "settings/EnumSettings.h"
#include "settings/types/LayerIndex.h"
#include "utils/Range.h"

#include <cstddef>
#include <optional>

namespace flowscale
{

/*!
 * \brief What happened during one rewrite of a g-code stream.
 *
 * Filled in by the FlowRewriter while it processes lines, and only read
 * afterwards, e.g. for the debug report.
 */
struct RunStats
{
    size_t lines_total = 0;
    size_t lines_modified = 0;
    size_t g92_resets_seen = 0; //!< Number of G92 commands that set E to zero.

    Range<double> range_z; //!< The height window that was applied.
    Range<LayerIndex> range_layers; //!< The layer window that was applied.
    std::optional<double> layer_height_used;

    EExtrusionMode extrusion_mode = EExtrusionMode::ABSOLUTE; //!< The mode at the end of the stream.
    Range<double> scaled_z; //!< Lowest and highest Z at which a line was actually rewritten. Unbounded if none was.

    /*!
     * Share of the lines that were modified, in percent. 0 for an empty stream.
     */
    double modifiedPercentage() const
    {
        return lines_total == 0 ? 0.0 : 100.0 * static_cast<double>(lines_modified) / static_cast<double>(lines_total);
    }
};

} // namespace flowscale

#endif // RUNSTATS_H
