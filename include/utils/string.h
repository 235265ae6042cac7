// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef UTILS_STRING_H
#define UTILS_STRING_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace flowscale
{

/*!
 * Minimum number of decimal places written for a rewritten value. Slicers
 * usually emit E with five decimals, which is what a scaled value needs to
 * keep sub-micron resolution.
 */
constexpr size_t EXTRUSION_DECIMALS = 5;

/*!
 * \brief A decimal number as it was written in the source text.
 */
struct ParsedDecimal
{
    double value; //!< The numeric value.
    size_t decimals; //!< Number of digits after the decimal point (0 if there is none).
};

/*!
 * \brief Parse a plain decimal number: an optional sign, digits, and an
 * optional fractional part, e.g. ``-1``, ``+.5``, ``12.``, ``0.04``.
 *
 * Exponents, ``inf``, ``nan`` and trailing garbage are rejected; the whole
 * text has to be the number.
 * \param text The text to parse.
 * \return The value and its decimal count, or nothing if it is malformed.
 */
std::optional<ParsedDecimal> parseDecimal(std::string_view text);

/*!
 * \brief Format a number with a bounded number of decimal places.
 *
 * The value is rounded to \p max_decimals places, after which trailing zeros
 * are dropped as long as at least \p min_decimals places remain. A decimal
 * point without digits after it is never written, and neither is a negative
 * zero.
 * \param value The value to format.
 * \param min_decimals The number of decimals that is always kept.
 * \param max_decimals The precision to round to.
 */
std::string formatDecimal(double value, size_t min_decimals, size_t max_decimals);

/*!
 * \brief Strip leading and trailing whitespace (including line endings).
 */
std::string_view trim(std::string_view text);

} // namespace flowscale

#endif // UTILS_STRING_H
