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

#ifndef BURRO_PDFEMITTER_HPP
#define BURRO_PDFEMITTER_HPP

#include "Emitter.hpp"
#include "Font.hpp"

/**
 * @brief Converts a codepoint to WinAnsiEncoding
 *
 * @param cp Codepoint
 * @returns Byte for cp, `?` if cp has no WinAnsi equivalent
 */
[[nodiscard]] char toWinAnsi(char32_t cp) noexcept;

/**
 * @brief Converts a WinAnsiEncoding byte to a codepoint
 *
 * @param c Byte
 * @returns Codepoint for c, 0 if c is unassigned
 */
[[nodiscard]] char32_t fromWinAnsi(unsigned char c) noexcept;

/**
 * @brief Writes a PDF 1.4 document
 *
 * Builtin fonts are referenced by name, other fonts are embedded
 */
class PdfEmitter : public Emitter
{
	const FontProvider& m_fonts; ///< Metrics for embedded fonts
public:
	/**
	 * @brief Constructor
	 *
	 * @param opts Emitter options
	 * @param fonts Fonts used during layout
	 */
	PdfEmitter(EmitterOptions&& opts, const FontProvider& fonts):
		Emitter(std::move(opts)), m_fonts{fonts} {}

	[[nodiscard]] virtual std::string get_name() const;
	[[nodiscard]] virtual std::string get_extension() const;
	virtual void emit(const LayoutResult& result) const;
};

#endif // BURRO_PDFEMITTER_HPP
