// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "gcode/GCodeLine.h"

#include "utils/string.h" //For parseDecimal.

#include <algorithm>
#include <cctype>
#include <charconv>

namespace flowscale::gcode
{

namespace
{

bool isWhitespace(const char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

} // namespace

GCodeLine GCodeLine::parse(std::string_view raw)
{
    GCodeLine line;

    // Everything from the first ';' on is a comment.
    const size_t content_end = std::min(raw.find(';'), raw.size());

    size_t pos = 0;
    bool first_token = true;
    while (pos < content_end)
    {
        while (pos < content_end && isWhitespace(raw[pos]))
        {
            pos++;
        }
        if (pos >= content_end)
        {
            break;
        }
        const size_t token_begin = pos;
        while (pos < content_end && ! isWhitespace(raw[pos]))
        {
            pos++;
        }
        const std::string_view token = raw.substr(token_begin, pos - token_begin);

        if (first_token)
        {
            first_token = false;
            line.command_type_ = classifyCommand(token);
            if (line.command_type_ != CommandType::MOVE && line.command_type_ != CommandType::SET_POSITION)
            {
                break; // Parameters of other commands are none of our business.
            }
            continue;
        }

        const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(token.front())));
        const std::optional<ParsedDecimal> number = parseDecimal(token.substr(1));
        if (! std::isalpha(static_cast<unsigned char>(token.front())) || ! number || line.getWord(letter))
        {
            line.malformed_ = true;
            line.words_.clear();
            break;
        }
        line.words_.push_back(GCodeWord{ .letter = letter,
                                         .value = number->value,
                                         .decimals = number->decimals,
                                         .value_begin = token_begin + 1,
                                         .value_end = token_begin + token.size() });
    }
    return line;
}

std::optional<GCodeWord> GCodeLine::getWord(const char letter) const
{
    for (const GCodeWord& word : words_)
    {
        if (word.letter == letter)
        {
            return word;
        }
    }
    return std::nullopt;
}

CommandType GCodeLine::classifyCommand(std::string_view token)
{
    if (token.size() < 2)
    {
        return CommandType::OTHER;
    }
    const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(token.front())));
    const std::string_view digits = token.substr(1);
    unsigned int number = 0;
    const auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (error != std::errc() || end != digits.data() + digits.size())
    {
        return CommandType::OTHER; // Subcodes like G29.1 and packed words like G1X10 included.
    }

    if (letter == 'G')
    {
        switch (number)
        {
        case 0:
        case 1:
            return CommandType::MOVE;
        case 92:
            return CommandType::SET_POSITION;
        default:
            return CommandType::OTHER;
        }
    }
    if (letter == 'M')
    {
        switch (number)
        {
        case 82:
            return CommandType::ABSOLUTE_EXTRUSION;
        case 83:
            return CommandType::RELATIVE_EXTRUSION;
        default:
            return CommandType::OTHER;
        }
    }
    return CommandType::OTHER;
}

} // namespace flowscale::gcode
