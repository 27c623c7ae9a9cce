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

#ifndef BURRO_FONTMAP_HPP
#define BURRO_FONTMAP_HPP

#include <map>
#include <string>
#include <filesystem>
#include "Units.hpp"
#include "Util.hpp"

/**
 * @brief Font files for each family
 *
 * Read from a file of the form:
 * ```
 * default = "garamond"
 *
 * [families.garamond]
 * roman = "fonts/garamond.ttf"
 * bold = "fonts/garamond-bold.ttf"
 * italic = "fonts/garamond-italic.ttf"
 * bold_italic = "fonts/garamond-bold-italic.ttf"
 * ```
 * Keys may be dotted (`families.mono.roman = 'mono.ttf'`) and values are
 * TOML basic or literal strings. Other TOML value types are rejected.
 */
struct FontMap
{
	std::string default_family; ///< Default family, empty when unset
	std::map<std::string, std::map<FontStyle, std::filesystem::path>> families; ///< Font files for each family

	/**
	 * @brief Parses a font map
	 *
	 * @param f File to parse
	 * @param base Directory font paths are relative to
	 * @returns Parsed font map
	 * @throws FontMapError on syntax errors
	 */
	[[nodiscard]] static FontMap parse(const File& f, const std::filesystem::path& base);

	/**
	 * @brief Reads and parses a font map
	 *
	 * @param path Path to the font map
	 * @returns Parsed font map
	 * @throws FontMapError if the file cannot be read or is invalid
	 */
	[[nodiscard]] static FontMap load(const std::filesystem::path& path);
};

#endif // BURRO_FONTMAP_HPP
