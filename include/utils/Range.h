// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef UTILS_RANGE_H
#define UTILS_RANGE_H

#include <algorithm>
#include <optional>

namespace flowscale
{

/*!
 * An inclusive range of values of which either end may be open.
 *
 * A range without any bound contains everything.
 *
 * \tparam T the type of value, which needs to be totally ordered.
 */
template<typename T>
class Range
{
public:
    std::optional<T> min;
    std::optional<T> max;

    Range() = default;

    Range(std::optional<T> min, std::optional<T> max)
        : min(min)
        , max(max)
    {
    }

    /*!
     * Whether at least one end of the range is bounded.
     */
    bool isBounded() const
    {
        return min.has_value() || max.has_value();
    }

    bool inside(const T& val) const
    {
        return (! min || ! (val < *min)) && (! max || ! (*max < val));
    }

    /*!
     * Grow the range so that it includes \p val.
     *
     * An unbounded end is set to \p val, so including values in an empty
     * range yields the span of the values that were included.
     */
    void include(const T& val)
    {
        min = min ? std::min(*min, val) : val;
        max = max ? std::max(*max, val) : val;
    }
};

} // namespace flowscale

#endif // UTILS_RANGE_H
