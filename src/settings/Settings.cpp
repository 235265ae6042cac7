// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "settings/Settings.h"

#include "settings/types/LayerIndex.h" //For layer settings.
#include "settings/types/Ratio.h" //For the flow ratio.
#include "utils/Range.h" //For layer ranges.
#include "utils/exceptions.h"
#include "utils/string.h" //For parseDecimal and trim.

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>

#include <charconv>
#include <filesystem>
#include <optional>
#include <vector>

namespace flowscale
{

namespace
{

// Reads a non-negative layer number, or nothing when the text is empty.
std::optional<LayerIndex> parseLayerNumber(std::string_view text, const std::string& key)
{
    text = trim(text);
    if (text.empty())
    {
        return std::nullopt;
    }
    LayerIndex::value_type number = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (error != std::errc() || end != text.data() + text.size() || number < 0)
    {
        throw ConfigurationError(fmt::format("Setting '{}' contains an invalid layer number: '{}'", key, text));
    }
    return LayerIndex(number);
}

} // namespace

Settings::Settings()
{
    parent = nullptr; // Needs to be properly initialised because we check against this if the parent is not set.
}

void Settings::add(const std::string& key, const std::string value)
{
    settings.insert_or_assign(key, value);
}

template<>
std::string Settings::get<std::string>(const std::string& key) const
{
    // If this settings base has a setting value for it, look that up.
    if (const auto setting = settings.find(key); setting != settings.end())
    {
        return setting->second;
    }

    if (parent)
    {
        return parent->get<std::string>(key);
    }

    throw ConfigurationError(fmt::format("Trying to retrieve setting with no value given: {}", key));
}

template<>
double Settings::get<double>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    const std::optional<ParsedDecimal> number = parseDecimal(trim(value));
    if (! number)
    {
        throw ConfigurationError(fmt::format("Setting '{}' is not a number: '{}'", key, value));
    }
    return number->value;
}

template<>
bool Settings::get<bool>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    if (value == "on" || value == "yes" || value == "true" || value == "True")
    {
        return true;
    }
    if (value.empty() || value == "off" || value == "no" || value == "false" || value == "False")
    {
        return false;
    }
    const std::optional<ParsedDecimal> number = parseDecimal(trim(value));
    return number && number->value != 0.0;
}

template<>
Ratio Settings::get<Ratio>(const std::string& key) const
{
    return get<double>(key); // Unlike percentages, flow ratios are given as a plain multiplier.
}

template<>
LayerIndex Settings::get<LayerIndex>(const std::string& key) const
{
    const std::optional<LayerIndex> layer = parseLayerNumber(get<std::string>(key), key);
    if (! layer)
    {
        throw ConfigurationError(fmt::format("Setting '{}' is empty, expected a layer number", key));
    }
    return *layer;
}

template<>
Range<LayerIndex> Settings::get<Range<LayerIndex>>(const std::string& key) const
{
    // Either a single layer "3", or an inclusive range "2:5" of which either side may be left out.
    const std::string value = get<std::string>(key);
    const size_t separator = value.find(':');
    if (separator == std::string::npos)
    {
        const LayerIndex layer = get<LayerIndex>(key);
        return Range<LayerIndex>(layer, layer);
    }
    const std::string_view text(value);
    Range<LayerIndex> result(parseLayerNumber(text.substr(0, separator), key), parseLayerNumber(text.substr(separator + 1), key));
    if (! result.isBounded())
    {
        throw ConfigurationError(fmt::format("Setting '{}' needs at least one layer number: '{}'", key, value));
    }
    return result;
}

template<>
std::filesystem::path Settings::get<std::filesystem::path>(const std::string& key) const
{
    return std::filesystem::path(get<std::string>(key));
}

const std::string Settings::getAllSettingsString() const
{
    auto keys = settings | ranges::views::keys | ranges::to<std::vector<std::string>>();
    ranges::sort(keys); // The map has no order of its own; keep the log stable.

    std::string result;
    for (const std::string& key : keys)
    {
        result += fmt::format(" --{}=\"{}\"", key, settings.at(key));
    }
    return result;
}

bool Settings::has(const std::string& key) const
{
    return settings.find(key) != settings.end() || (parent && parent->has(key));
}

void Settings::setParent(const Settings* new_parent)
{
    parent = new_parent;
}

} // namespace flowscale
