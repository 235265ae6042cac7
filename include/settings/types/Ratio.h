// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef RATIO_H
#define RATIO_H

namespace flowscale
{

/*
 * \brief Represents the multiplier applied to extrusion amounts.
 *
 * This is a facade. It behaves like a double. A ratio of 1 leaves every
 * extrusion as it is.
 */
struct Ratio
{
    /*
     * \brief Default constructor setting the ratio to 1.
     */
    constexpr Ratio()
        : value_(1.0)
    {
    }

    /*
     * \brief Casts a double to a Ratio instance.
     */
    constexpr Ratio(double value)
        : value_(value)
    {
    }

    /*
     * \brief Casts the Ratio instance to a double.
     */
    constexpr operator double() const
    {
        return value_;
    }

    constexpr bool isIdentity() const
    {
        return value_ == 1.0;
    }

    double value_;
};

constexpr Ratio operator"" _r(const long double ratio)
{
    return Ratio(static_cast<double>(ratio));
}

} // namespace flowscale

#endif // RATIO_H
