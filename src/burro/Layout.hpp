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

#ifndef BURRO_LAYOUT_HPP
#define BURRO_LAYOUT_HPP

#include <string>
#include <vector>
#include <optional>

#include "Syntax.hpp"
#include "State.hpp"
#include "Tabs.hpp"
#include "Font.hpp"

/**
 * @brief A positioned piece of text
 *
 * Coordinates are in points, measured from the top left corner of the page.
 * `y` is the baseline.
 */
struct TextPlacement
{
	std::size_t page; ///< Page index
	double x; ///< Left edge
	double y; ///< Baseline
	std::string text; ///< UTF-8 text
	FontRef font; ///< Font
	double size; ///< Point size
	double letter_space; ///< Spacing after every character
	std::size_t pos; ///< Position in source
};

/**
 * @brief Page geometry
 */
struct Page
{
	double width;
	double height;
	double margin_left;
	double margin_right;
	double margin_top;
	double margin_bottom;
};

/**
 * @brief Output of the layout
 */
struct LayoutResult
{
	std::vector<Page> pages; ///< Allocated pages
	std::vector<TextPlacement> placements; ///< Placements, in reading order
	std::vector<Warning> warnings; ///< Non fatal diagnostics
};

/**
 * @brief Converts a document to positioned text
 *
 * Owns the typesetting state and the tab environment for one walk of the document
 */
class Layout
{
	/**
	 * @brief Text measured with a single style
	 */
	struct Piece
	{
		std::string text;
		FontRef font;
		double size;
		double letter_space;
		double width;
		double ascent; ///< Ascent in points
		double leading;
		std::size_t pos;
	};

	/**
	 * @brief Unbreakable sequence of pieces
	 */
	struct Word
	{
		std::vector<Piece> pieces;
		double width = 0.0; ///< Sum of piece widths
		double gap = 0.0; ///< Width of the space before this word
	};

	/**
	 * @brief Words laid out in the same column
	 */
	struct Segment
	{
		std::vector<Word> words;
		double left; ///< Left edge
		double width; ///< Available width
		Alignment align;
		bool quad; ///< Whether lines wrap
		double indent; ///< First line indent
	};

	/**
	 * @brief A line of a segment
	 */
	struct Line
	{
		std::size_t first; ///< First word
		std::size_t last; ///< Past the last word
		double natural; ///< Width with regular spaces
	};

	const Document& m_doc; ///< Document
	const FontProvider& m_fonts; ///< Font metrics
	TypesettingState m_state; ///< Current state
	Tabs m_tabs; ///< Tab environment
	LayoutResult m_result; ///< Output

	std::size_t m_page = 0; ///< Current page
	bool m_need_page = true; ///< Whether the next line starts a new page
	std::optional<double> m_baseline; ///< Last baseline on the current page
	double m_pending_space = 0.0; ///< Space before the next line

	std::vector<Segment> m_segments; ///< Segments of the current paragraph
	bool m_space = false; ///< Whether a space precedes the next piece
	double m_space_width = 0.0; ///< Width of that space

	[[nodiscard]] double pageWidth() const;
	void nextPage();
	void ensurePage();

	/**
	 * @brief Applies a command to the state or tabs
	 *
	 * @param cmd Command to apply
	 * @returns true if a new column starts
	 */
	bool apply(const Syntax::Command& cmd);

	void startSegment();
	void addSpace();
	void addPiece(std::string&& text, std::size_t pos);
	void addText(const std::string& text, std::size_t pos);
	void flatten(const Syntax::Fragment& frag);

	void paragraph(const Syntax::Paragraph& par);
	void layoutSegment(const Segment& seg);
	void placeLine(const Segment& seg, const Line& line, bool first, bool last);
public:
	/**
	 * @brief Constructor
	 *
	 * @param doc Document to lay out
	 * @param fonts Font metrics
	 */
	[[nodiscard]] Layout(const Document& doc, const FontProvider& fonts);

	/**
	 * @brief Lays out the document
	 *
	 * Must only be called once
	 *
	 * @returns Pages and placements
	 * @throws SourceError on errors applying commands
	 */
	[[nodiscard]] LayoutResult run();

	[[nodiscard]] const TypesettingState& state() const noexcept { return m_state; }
	[[nodiscard]] const Tabs& tabs() const noexcept { return m_tabs; }
};

#endif // BURRO_LAYOUT_HPP
