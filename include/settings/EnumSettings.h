// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef ENUMSETTINGS_H
#define ENUMSETTINGS_H

#include <string_view>

namespace flowscale
{

/*!
 * How the E word of a move is interpreted by the printer.
 *
 * ABSOLUTE: E is the new filament position (M82).
 * RELATIVE: E is the amount of filament to feed for this move (M83).
 */
enum class EExtrusionMode
{
    ABSOLUTE,
    RELATIVE
};

constexpr std::string_view toString(const EExtrusionMode mode)
{
    switch (mode)
    {
    case EExtrusionMode::ABSOLUTE:
        return "absolute";
    case EExtrusionMode::RELATIVE:
        return "relative";
    }
    return "unknown";
}

} // namespace flowscale

#endif // ENUMSETTINGS_H
