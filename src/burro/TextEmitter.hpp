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

#ifndef BURRO_TEXTEMITTER_HPP
#define BURRO_TEXTEMITTER_HPP

#include "Emitter.hpp"

/**
 * @brief Writes every page and placement as a line of text
 *
 * ```
 * [page 1] 612.00x792.00
 * 72.00 79.55 12.00 courier/roman "Hello"
 * ```
 */
class TextEmitter : public Emitter
{
public:
	TextEmitter(EmitterOptions&& opts):
		Emitter(std::move(opts)) {}

	[[nodiscard]] virtual std::string get_name() const;
	[[nodiscard]] virtual std::string get_extension() const;
	virtual void emit(const LayoutResult& result) const;
};

#endif // BURRO_TEXTEMITTER_HPP
