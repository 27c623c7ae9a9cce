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

#ifndef BURRO_FONT_HPP
#define BURRO_FONT_HPP

#include <array>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <compare>
#include "Units.hpp"

struct FontMap;

/**
 * @brief Identifies a font
 */
struct FontRef
{
	std::string family; ///< Family name
	FontStyle style; ///< Style in family

	[[nodiscard]] auto operator<=>(const FontRef&) const = default;
};

/**
 * @brief Metrics of a font
 *
 * Values are expressed in 1/1000 of an em
 */
struct FontMetrics
{
	std::string name; ///< PostScript name
	std::string path; ///< Font file, empty for builtin fonts
	double ascent; ///< Ascender
	double descent; ///< Descender (negative)
	double default_advance; ///< Advance of unmapped codepoints
	std::unordered_map<char32_t, double> advances; ///< Advance for each codepoint

	/**
	 * @brief Gets advance of a codepoint
	 *
	 * @param cp Codepoint
	 * @returns Advance of cp
	 */
	[[nodiscard]] double advance(char32_t cp) const;

	/**
	 * @brief Measures text
	 *
	 * @param text UTF-8 text
	 * @param size Point size
	 * @param letter_space Spacing added after every character (in points)
	 * @returns Width of text in points
	 */
	[[nodiscard]] double measure(std::string_view text, double size, double letter_space = 0.0) const;

	[[nodiscard]] bool builtin() const noexcept { return path.empty(); }
};

/**
 * @brief Abstract class for font metrics providers
 */
class FontProvider
{
public:
	virtual ~FontProvider() {}

	/**
	 * @brief Gets metrics of a font
	 *
	 * @param ref Font to get metrics for
	 * @returns Metrics for ref
	 * @throws FontResolutionError if ref cannot be resolved
	 */
	[[nodiscard]] virtual const FontMetrics& resolve(const FontRef& ref) const = 0;

	/**
	 * @brief Gets default family
	 *
	 * @returns Name of the default font family
	 */
	[[nodiscard]] virtual std::string default_family() const = 0;
};

/**
 * @brief Builtin metrics for the base-14 Courier family
 */
class BuiltinFonts : public FontProvider
{
	std::array<FontMetrics, 4> m_courier; ///< Metrics for every style
public:
	[[nodiscard]] BuiltinFonts();

	[[nodiscard]] virtual const FontMetrics& resolve(const FontRef& ref) const;
	[[nodiscard]] virtual std::string default_family() const;
};

/**
 * @brief Metrics loaded with FreeType from the files of a font map
 *
 * Families absent from the map are resolved with @ref BuiltinFonts
 */
class FreeTypeFonts : public FontProvider
{
	BuiltinFonts m_builtin; ///< Fallback
	std::map<FontRef, FontMetrics> m_fonts; ///< Loaded fonts
	std::map<std::string, std::size_t> m_families; ///< Family names
	std::string m_default; ///< Default family
public:
	/**
	 * @brief Constructor
	 *
	 * Loads every font in map
	 *
	 * @param map Font map
	 * @throws FontMapError if a font cannot be loaded
	 */
	[[nodiscard]] explicit FreeTypeFonts(const FontMap& map);

	[[nodiscard]] virtual const FontMetrics& resolve(const FontRef& ref) const;
	[[nodiscard]] virtual std::string default_family() const;
};

#endif // BURRO_FONT_HPP
