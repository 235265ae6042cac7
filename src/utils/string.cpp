// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "utils/string.h"

#include <algorithm> //For std::max and std::min.
#include <cctype>
#include <charconv> //For from_chars.
#include <cmath>

#include <fmt/format.h>

namespace flowscale
{

namespace
{

constexpr size_t MAX_ROUNDING_DECIMALS = 17;

} // namespace

std::optional<ParsedDecimal> parseDecimal(std::string_view text)
{
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        negative = text[pos] == '-';
        pos++;
    }
    const size_t number_start = pos;

    size_t integral_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
    {
        integral_digits++;
        pos++;
    }
    size_t decimals = 0;
    if (pos < text.size() && text[pos] == '.')
    {
        pos++;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            decimals++;
            pos++;
        }
    }
    if (pos != text.size() || integral_digits + decimals == 0)
    {
        return std::nullopt;
    }

    // The sign was consumed above since from_chars does not accept a leading '+'.
    const std::string_view digits = text.substr(number_start);
    double value = 0.0;
    const auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (error != std::errc() || end != digits.data() + digits.size())
    {
        return std::nullopt;
    }
    return ParsedDecimal{ negative ? -value : value, decimals };
}

std::string formatDecimal(double value, size_t min_decimals, size_t max_decimals)
{
    max_decimals = std::max(min_decimals, max_decimals);
    // Rounding beyond what a double can hold is left to the formatter, and 10^309 would overflow.
    const double scale = std::pow(10.0, static_cast<double>(std::min(max_decimals, MAX_ROUNDING_DECIMALS)));
    double rounded = std::round(value * scale) / scale;
    if (rounded == 0.0)
    {
        rounded = 0.0; // Also turns -0.0 into 0.0.
    }
    std::string result = fmt::format("{:.{}f}", rounded, max_decimals);

    if (max_decimals > 0)
    {
        // Trims zeros at the right of the fractional part, but never more than allowed.
        size_t decimals = max_decimals;
        while (decimals > min_decimals && result.back() == '0')
        {
            result.pop_back();
            decimals--;
        }
        if (decimals == 0)
        {
            result.pop_back(); // The dangling '.'.
        }
    }
    return result;
}

std::string_view trim(std::string_view text)
{
    const auto is_space = [](char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (! text.empty() && is_space(text.front()))
    {
        text.remove_prefix(1);
    }
    while (! text.empty() && is_space(text.back()))
    {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace flowscale
