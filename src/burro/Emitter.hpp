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

#ifndef BURRO_EMITTER_HPP
#define BURRO_EMITTER_HPP

#include <ostream>
#include "Layout.hpp"

/**
 * @brief Options for an emitter
 */
struct EmitterOptions
{
	std::ostream& stream; ///< Output stream

	/**
	 * Constructor
	 *
	 * @param stream Output stream
	 */
	EmitterOptions(std::ostream& stream):
		stream{stream} {}

	std::string title; ///< Document title, stored in metadata when supported
};

/**
 * @brief Abstract class for an output format
 */
class Emitter
{
protected:
	EmitterOptions m_opts;
public:
	/**
	 * @brief Constructor
	 * @param opts Options for the emitter
	 */
	Emitter(EmitterOptions&& opts):
		m_opts{std::move(opts)} {}

	/**
	 * @brief Destructor
	 */
	virtual ~Emitter() {}

	[[nodiscard]] const EmitterOptions& getOptions() const { return m_opts; }

	/**
	 * @brief Gets emitter name
	 *
	 * @returns Emitter's name
	 */
	[[nodiscard]] virtual std::string get_name() const = 0;

	/**
	 * @brief Gets extension of the produced files
	 *
	 * @returns Extension, without the dot
	 */
	[[nodiscard]] virtual std::string get_extension() const = 0;

	/**
	 * @brief Writes a laid out document to the output stream
	 *
	 * @param result Layout to write
	 */
	virtual void emit(const LayoutResult& result) const = 0;
};

#endif // BURRO_EMITTER_HPP
