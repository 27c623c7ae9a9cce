/* Burro a fixed-layout typesetting compiler
   Copyright © 2023 ef3d0c3e

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU Affero General Public License as
   published by the Free Software Foundation, either version 3 of the
   License, or any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>. */

#ifndef BURRO_UNITS_HPP
#define BURRO_UNITS_HPP

#include <string_view>
#include <cstdint>

namespace Units
{
	constexpr inline double PT = 1.0;
	constexpr inline double IN = 72.0;
	constexpr inline double MM = 2.83464576;
	constexpr inline double CM = 28.3464576;
	constexpr inline double PICA = 12.0;
} // Units

/**
 * @brief Line alignment, also used as a tab's direction
 */
enum class Alignment : std::uint8_t
{
	LEFT,
	CENTER,
	RIGHT,
	JUSTIFY,
};

/**
 * @brief Font style
 */
enum class FontStyle : std::uint8_t
{
	ROMAN,
	BOLD,
	ITALIC,
	BOLD_ITALIC,
};

/**
 * @brief A length, in points
 */
struct Length
{
	double value; ///< Value (in points)
	bool relative; ///< Whether value is added to the current value

	/**
	 * @brief Resolves length
	 *
	 * @param current Current value
	 * @returns Absolute value
	 */
	[[nodiscard]] double resolve(double current) const noexcept
	{ return relative ? current + value : value; }
};

/**
 * @brief Parses a length
 *
 * Accepts `[+-]number[unit]` where unit is one of `pt`, `in`, `mm`, `cm`, `P`.
 * A sign makes the length relative.
 *
 * @param s String to parse
 * @returns Parsed length
 * @throws ParseError if `s` is not a valid length
 */
[[nodiscard]] Length parseLength(std::string_view s);

/**
 * @brief Parses an alignment
 *
 * @param s String to parse
 * @returns Parsed alignment
 * @throws ParseError if `s` is not a valid alignment
 */
[[nodiscard]] Alignment parseAlignment(std::string_view s);

/**
 * @brief Parses a font style
 *
 * @param s String to parse
 * @returns Parsed style
 * @throws ParseError if `s` is not a valid style
 */
[[nodiscard]] FontStyle parseFontStyle(std::string_view s);

/**
 * @brief Parses a boolean
 *
 * @param s String to parse
 * @returns Parsed boolean
 * @throws ParseError if `s` is neither `true` nor `false`
 */
[[nodiscard]] bool parseBool(std::string_view s);

[[nodiscard]] std::string_view getAlignmentName(Alignment align) noexcept;
[[nodiscard]] std::string_view getFontStyleName(FontStyle style) noexcept;

/**
 * @brief Combines two styles
 *
 * @param a First style
 * @param b Second style
 * @returns A style that is bold if either is bold and italic if either is italic
 */
[[nodiscard]] FontStyle combineStyles(FontStyle a, FontStyle b) noexcept;

#endif // BURRO_UNITS_HPP
