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

#ifndef BURRO_PIPELINE_HPP
#define BURRO_PIPELINE_HPP

#include "Parser.hpp"
#include "Layout.hpp"

/**
 * @brief Result of every compilation stage
 */
struct Compilation
{
	Document doc; ///< Parsed document
	VariableTable vars; ///< Variable definitions
	LayoutResult layout; ///< Laid out pages
};

/**
 * @brief Runs lexing, parsing and layout on a source
 *
 * Every stage is timed with @ref Benchmarker
 *
 * @param f Source file, its content must outlive the compilation
 * @param fonts Font metrics
 * @returns Compilation results
 * @throws SourceError on the first fatal error
 */
[[nodiscard]] Compilation compile(const File& f, const FontProvider& fonts);

#endif // BURRO_PIPELINE_HPP
