// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef FLOWREWRITER_H
#define FLOWREWRITER_H

#include "RunStats.h"
#include "settings/EnumSettings.h"
#include "settings/ScalingConfig.h"
#include "settings/types/LayerIndex.h"
#include "utils/Range.h"

#include <string>
#include <string_view>

namespace flowscale
{
namespace gcode
{
class GCodeLine;
struct GCodeWord;
} // namespace gcode

/*!
 * \brief The machine state as far as it matters for scaling extrusion.
 */
struct EngineState
{
    double current_z = 0.0; //!< Last height a move went to.
    LayerIndex current_layer = 0; //!< Layer that current_z lies in. Stays 0 if no layer height is known.
    EExtrusionMode extrusion_mode = EExtrusionMode::ABSOLUTE;

    /*!
     * E position of the printer according to the unmodified input.
     *
     * Deltas of absolute moves are taken with respect to this position.
     */
    double last_e_absolute = 0.0;

    /*!
     * E position of the printer according to the rewritten output.
     *
     * It differs from last_e_absolute once scaled moves were written, until
     * the next G92 brings both back in line.
     */
    double emitted_e_absolute = 0.0;

    bool e_reset_seen = false; //!< Whether a G92 has zeroed the E position yet. Other G92 values don't count.
};

/*!
 * \brief Rewrites g-code line by line, scaling the extrusion of moves inside
 * the configured height and layer window.
 *
 * Every line put in yields exactly one line out. Lines that are not rewritten
 * are returned byte for byte, including their line ending. Only the number of
 * the E word of a rewritten move is replaced; the rest of the line stays as it
 * was.
 *
 * One instance handles one stream. Its state depends on every line seen so
 * far, so lines have to be passed in order.
 */
class FlowRewriter
{
public:
    explicit FlowRewriter(const ScalingConfig& config);

    /*!
     * \brief Process the next line of the stream.
     * \param line The raw line, optionally including its line ending.
     * \return The line to write in its place.
     * \throws SafetyValidationError if this would be the first scaled move
     * while no G92 has set the E position yet, unless forced.
     */
    std::string process(std::string_view line);

    /*!
     * Whether a move with extrusion would be scaled in the current state.
     */
    bool isInRange() const;

    const EngineState& getState() const
    {
        return state_;
    }

    const RunStats& getStats() const
    {
        return stats_;
    }

private:
    const ScalingConfig config_;

    /*!
     * The height window with a bit of slack, so that a Z parsed from the file
     * matches a bound parsed from the command line.
     */
    Range<double> z_window_;

    EngineState state_;
    RunStats stats_;
    bool safety_checked_ = false;
    bool was_in_range_ = false;

    void setHeight(const double z);
    void setExtrusionPosition(const gcode::GCodeLine& command);
    std::string processMove(std::string_view line, const gcode::GCodeLine& command);

    /*!
     * Work out the E value for a move inside the window, and update the E
     * positions to after the move.
     */
    double scaleExtrusion(const double source_e);

    /*!
     * Throws on the first scaled move unless a G92 E0 came before it or the
     * check was disabled. Only ever checks once.
     */
    void checkSafety();
};

} // namespace flowscale

#endif // FLOWREWRITER_H
