// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef GCODE_GCODELINE_H
#define GCODE_GCODELINE_H

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace flowscale::gcode
{

/*!
 * The commands that matter for extrusion scaling. Everything else is OTHER
 * and is passed through untouched.
 */
enum class CommandType
{
    NONE, //!< Blank line or comment only.
    MOVE, //!< G0 or G1.
    SET_POSITION, //!< G92.
    ABSOLUTE_EXTRUSION, //!< M82.
    RELATIVE_EXTRUSION, //!< M83.
    OTHER
};

/*!
 * A parameter word of a command, such as ``E1.234``.
 *
 * The offsets point into the raw line the word was parsed from, so that the
 * number can be replaced without touching the rest of the line.
 */
struct GCodeWord
{
    char letter; //!< Upper case parameter letter.
    double value;
    size_t decimals; //!< Digits after the decimal point in the source text.
    size_t value_begin; //!< Offset of the first character of the number.
    size_t value_end; //!< Offset one past the last character of the number.
};

/*!
 * \brief The parsed form of one line of g-code.
 *
 * Parsing is lenient about what it does not need: only the command token is
 * inspected for unknown commands. The parameter words of the commands in
 * CommandType are parsed strictly; if one of them cannot be read the line is
 * marked as malformed and has to be passed through as-is.
 *
 * Comments start at a ';' and run to the end of the line. Words have to be
 * separated by whitespace.
 */
class GCodeLine
{
public:
    /*!
     * \brief Parse a raw line, which may still include its line ending.
     */
    static GCodeLine parse(std::string_view raw);

    CommandType getCommandType() const
    {
        return command_type_;
    }

    /*!
     * Whether a parameter word of a recognised command could not be read.
     */
    bool isMalformed() const
    {
        return malformed_;
    }

    /*!
     * \brief Get the parameter word for a letter.
     * \param letter The upper case parameter letter.
     * \return The word, or nothing if the command does not have it.
     */
    std::optional<GCodeWord> getWord(const char letter) const;

    /*!
     * Whether the command has any parameter words at all.
     */
    bool hasWords() const
    {
        return ! words_.empty();
    }

private:
    CommandType command_type_ = CommandType::NONE;
    bool malformed_ = false;
    std::vector<GCodeWord> words_;

    static CommandType classifyCommand(std::string_view token);
};

} // namespace flowscale::gcode

#endif // GCODE_GCODELINE_H
