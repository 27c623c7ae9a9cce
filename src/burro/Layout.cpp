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

#include "Layout.hpp"

#include <algorithm>
#include <type_traits>
#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] Layout::Layout(const Document& doc, const FontProvider& fonts):
	m_doc{doc}, m_fonts{fonts}, m_state{fonts.default_family()}
{
}

//{{{ Pages
[[nodiscard]] double Layout::pageWidth() const
{
	if (!m_result.pages.empty() && !m_need_page)
		return m_result.pages[m_page].width;
	return m_state.length(Setting::PAGE_WIDTH);
}

void Layout::nextPage()
{
	if (!m_result.pages.empty() && m_page+1 < m_result.pages.size())
		++m_page; // Already allocated by another column
	else
	{
		m_result.pages.push_back(Page{
			.width = m_state.length(Setting::PAGE_WIDTH),
			.height = m_state.length(Setting::PAGE_HEIGHT),
			.margin_left = m_state.length(Setting::MARGIN_LEFT),
			.margin_right = m_state.length(Setting::MARGIN_RIGHT),
			.margin_top = m_state.length(Setting::MARGIN_TOP),
			.margin_bottom = m_state.length(Setting::MARGIN_BOTTOM),
		});
		m_page = m_result.pages.size()-1;
	}

	m_baseline.reset();
	m_need_page = false;
}

void Layout::ensurePage()
{
	if (m_result.pages.empty() || m_need_page)
		nextPage();
}
//}}}

//{{{ Commands
bool Layout::apply(const Syntax::Command& cmd)
{
	bool column = false;
	std::visit([&]<class T>(const T& p)
	{
		if constexpr (std::is_same_v<T, Syntax::SettingChange>)
		{
			for (const Setting key : p.keys)
			{
				if (p.value)
					m_state.set(key, *p.value);
				else
					m_state.reset(key);
			}
		}
		else if constexpr (std::is_same_v<T, Syntax::PageBreak>)
		{
			ensurePage();
			m_need_page = true;
			m_pending_space = 0.0;
		}
		else if constexpr (std::is_same_v<T, Syntax::TabDefinition>)
			m_tabs.define_tab(p.name, p.tab);
		else if constexpr (std::is_same_v<T, Syntax::TabListDefinition>)
			m_tabs.define_list(p.name, p.tabs);
		else if constexpr (std::is_same_v<T, Syntax::LoadTabs>)
			m_tabs.load(p.list, m_state);
		else if constexpr (std::is_same_v<T, Syntax::QuitTabs>)
			m_tabs.quit(m_state);
		else if constexpr (std::is_same_v<T, Syntax::SelectTab> || std::is_same_v<T, Syntax::NextTab> || std::is_same_v<T, Syntax::PreviousTab>)
		{
			bool overflow;
			if constexpr (std::is_same_v<T, Syntax::SelectTab>)
				overflow = m_tabs.select(p.name, m_state);
			else if constexpr (std::is_same_v<T, Syntax::NextTab>)
				overflow = m_tabs.next(m_state);
			else
				overflow = m_tabs.previous(m_state);

			if (overflow) [[unlikely]]
			{
				const Tab* tab = m_tabs.current();
				m_result.warnings.push_back(Warning{
					.category = "Layout Overflow"s,
					.message = fmt::format("Tab `{}` ends past the right margin (indent {}pt, length {}pt)",
						m_tabs.current_name(), tab->indent, tab->length),
					.pos = cmd.pos,
				});
			}
			column = true;
		}
		else
			throw Error(fmt::format("Command `{}` cannot be applied outside of a paragraph", cmd.name));
	}, cmd.payload);

	return column;
}
//}}}

//{{{ Flattening
void Layout::startSegment()
{
	const double left = m_state.length(Setting::MARGIN_LEFT);
	const Tab* tab = m_tabs.current();
	const std::optional<Column> column = m_tabs.column();
	m_segments.push_back(Segment{
		.words = {},
		.left = column ? column->left : left,
		.width = column ? column->width : pageWidth() - left - m_state.length(Setting::MARGIN_RIGHT),
		.align = m_state.alignment(),
		.quad = tab == nullptr || tab->quad,
		.indent = (!m_tabs.active() && m_segments.empty()) ? m_state.length(Setting::PAR_INDENT) : 0.0,
	});
	m_space = false;
}

void Layout::addSpace()
{
	if (m_space)
		return;

	m_space = true;
	m_space_width = m_state.length(Setting::SPACE_WIDTH);
	if (m_space_width < 0.0) // Automatic
	{
		const FontMetrics& metrics = m_fonts.resolve(FontRef{m_state.family(), m_state.style()});
		m_space_width = metrics.advance(U' ') * m_state.length(Setting::PT_SIZE) / 1000.0;
	}
}

void Layout::addPiece(std::string&& text, std::size_t pos)
{
	FontRef font{m_state.family(), m_state.style()};
	const FontMetrics& metrics = m_fonts.resolve(font);
	const double size = m_state.length(Setting::PT_SIZE);
	const double letter_space = m_state.length(Setting::LETTER_SPACE);
	const double width = metrics.measure(text, size, letter_space);

	Segment& seg = m_segments.back();
	if (m_space || seg.words.empty())
		seg.words.push_back(Word{.pieces = {}, .width = 0.0, .gap = seg.words.empty() ? 0.0 : m_space_width});
	m_space = false;

	Word& word = seg.words.back();
	word.width += width;
	word.pieces.push_back(Piece{
		.text = std::move(text),
		.font = std::move(font),
		.size = size,
		.letter_space = letter_space,
		.width = width,
		.ascent = metrics.ascent * size / 1000.0,
		.leading = m_state.length(Setting::LEADING),
		.pos = pos,
	});
}

void Layout::addText(const std::string& text, std::size_t pos)
{
	std::size_t i = 0;
	while (i < text.size())
	{
		const bool blank = text[i] == ' ' || text[i] == '\t' || text[i] == '\n' || text[i] == '\r';
		const std::size_t end = blank ? i+1 : std::min(text.find_first_of(" \t\n\r", i), text.size());
		try
		{
			if (blank)
				addSpace();
			else
				addPiece(text.substr(i, end-i), pos+i);
		}
		catch (SourceError& e)
		{
			e.locate(m_doc.file(), pos+i, end-i);
			throw;
		}
		i = end;
	}
}

void Layout::flatten(const Syntax::Fragment& frag)
{
	for (const Syntax::NodeId id : frag)
	{
		const Syntax::Node& node = m_doc.node(id);
		if (const auto* text = std::get_if<Syntax::Text>(&node))
		{
			addText(text->content, text->pos);
			continue;
		}

		const auto& cmd = std::get<Syntax::Command>(node);
		try
		{
			if (const auto* style = std::get_if<Syntax::Style>(&cmd.payload))
			{
				m_state.push(Setting::STYLE, combineStyles(m_state.style(), style->style));
				if (cmd.argument)
					flatten(*cmd.argument);
				m_state.reset(Setting::STYLE);
			}
			else if (std::holds_alternative<Syntax::Quote>(cmd.payload))
			{
				addPiece("“"s, cmd.pos);
				if (cmd.argument)
					flatten(*cmd.argument);
				// Closing quote is glued to the quoted text
				m_space = false;
				addPiece("”"s, cmd.pos);
			}
			else if (apply(cmd))
				startSegment();
		}
		catch (SourceError& e)
		{
			e.locate(m_doc.file(), cmd.pos, cmd.name.size()+1);
			throw;
		}
	}
}
//}}}

//{{{ Placement
void Layout::placeLine(const Segment& seg, const Line& line, bool first, bool last)
{
	double ascent = 0.0, leading = 0.0;
	for (std::size_t i = line.first; i < line.last; ++i)
	{
		for (const auto& piece : seg.words[i].pieces)
		{
			ascent = std::max(ascent, piece.ascent);
			leading = std::max(leading, piece.leading);
		}
	}

	// Vertical position
	ensurePage();
	double baseline;
	if (!m_baseline)
		baseline = m_result.pages[m_page].margin_top + ascent;
	else
	{
		baseline = *m_baseline + leading + m_pending_space;
		const Page& page = m_result.pages[m_page];
		if (baseline > page.height - page.margin_bottom)
		{
			nextPage();
			baseline = m_result.pages[m_page].margin_top + ascent;
		}
	}
	m_pending_space = 0.0;
	m_baseline = baseline;

	// Horizontal position
	const double indent = first ? seg.indent : 0.0;
	const double available = seg.width - indent;
	const std::size_t count = line.last - line.first;
	double x = seg.left + indent;
	double extra = 0.0;
	switch (seg.align)
	{
		case Alignment::LEFT:
			break;
		case Alignment::RIGHT:
			x += std::max(0.0, available - line.natural);
			break;
		case Alignment::CENTER:
			x += std::max(0.0, available - line.natural) / 2.0;
			break;
		case Alignment::JUSTIFY:
			if (!last && count > 1 && available > line.natural)
				extra = (available - line.natural) / static_cast<double>(count-1);
			break;
	}

	for (std::size_t i = line.first; i < line.last; ++i)
	{
		const Word& word = seg.words[i];
		if (i != line.first)
			x += word.gap + extra;
		for (const auto& piece : word.pieces)
		{
			m_result.placements.push_back(TextPlacement{
				.page = m_page,
				.x = x,
				.y = baseline,
				.text = piece.text,
				.font = piece.font,
				.size = piece.size,
				.letter_space = piece.letter_space,
				.pos = piece.pos,
			});
			x += piece.width;
		}
	}
}

void Layout::layoutSegment(const Segment& seg)
{
	// Greedy line breaking
	std::vector<Line> lines;
	Line line{0, 0, 0.0};
	for (std::size_t i = 0; i < seg.words.size(); ++i)
	{
		const Word& word = seg.words[i];
		if (line.first == line.last)
		{
			line.last = i+1;
			line.natural = word.width;
			continue;
		}

		const double available = seg.width - (lines.empty() ? seg.indent : 0.0);
		const double candidate = line.natural + word.gap + word.width;
		if (!seg.quad || candidate <= available + 1e-9)
		{
			line.last = i+1;
			line.natural = candidate;
		}
		else
		{
			lines.push_back(line);
			line = Line{i, i+1, word.width};
		}
	}
	lines.push_back(line);

	for (std::size_t i = 0; i < lines.size(); ++i)
		placeLine(seg, lines[i], i == 0, i+1 == lines.size());
}

void Layout::paragraph(const Syntax::Paragraph& par)
{
	m_segments.clear();
	startSegment();
	flatten(par.content);

	const bool empty = std::all_of(m_segments.cbegin(), m_segments.cend(), [](const Segment& seg) { return seg.words.empty(); });
	if (empty)
		return;

	if (m_segments.size() == 1)
		layoutSegment(m_segments.front());
	else
	{
		// Columns of a row start at the same position, the row ends after the longest column
		ensurePage();
		const std::size_t start_page = m_page;
		const std::optional<double> start_baseline = m_baseline;
		const double start_space = m_pending_space;

		std::size_t end_page = start_page;
		std::optional<double> end_baseline = start_baseline;
		for (const auto& seg : m_segments)
		{
			if (seg.words.empty())
				continue;

			m_page = start_page;
			m_baseline = start_baseline;
			m_pending_space = start_space;
			m_need_page = false;
			layoutSegment(seg);

			if (m_page > end_page || (m_page == end_page && (!end_baseline || *m_baseline > *end_baseline)))
			{
				end_page = m_page;
				end_baseline = m_baseline;
			}
		}

		m_page = end_page;
		m_baseline = end_baseline;
	}

	m_pending_space = m_state.length(Setting::PAR_SPACE);
}
//}}}

[[nodiscard]] LayoutResult Layout::run()
{
	for (const auto& block : m_doc.blocks())
	{
		if (const auto* par = std::get_if<Syntax::Paragraph>(&block))
		{
			paragraph(*par);
			continue;
		}

		const auto& cmd = std::get<Syntax::Command>(m_doc.node(std::get<Syntax::CommandBlock>(block).command));
		try
		{
			if (apply(cmd)) [[unlikely]]
				throw ParseError(fmt::format("Command `{}` must be used inside a paragraph", cmd.name));
		}
		catch (SourceError& e)
		{
			e.locate(m_doc.file(), cmd.pos, cmd.name.size()+1);
			throw;
		}
	}

	if (m_result.pages.empty())
		nextPage();

	return std::move(m_result);
}
