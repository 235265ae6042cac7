// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef LAYERINDEX_H
#define LAYERINDEX_H

#include <compare>
#include <cstdint>

namespace flowscale
{

/*!
 * \brief The number of a layer as the user counts them.
 *
 * The first printed layer is layer 1. Layer 0 is everything below the first
 * full layer height, including the state before any Z move was seen.
 */
struct LayerIndex
{
    using value_type = int64_t;

    value_type value{};

    constexpr LayerIndex() noexcept = default;

    constexpr LayerIndex(const value_type val) noexcept
        : value{ val } {};

    constexpr operator value_type() const noexcept
    {
        return value;
    }

    constexpr bool operator==(const LayerIndex& other) const noexcept = default;
    constexpr auto operator<=>(const LayerIndex& other) const noexcept = default;

    constexpr LayerIndex& operator++() noexcept
    {
        ++value;
        return *this;
    }
};

} // namespace flowscale

#endif // LAYERINDEX_H
