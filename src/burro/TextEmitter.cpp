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

#include "TextEmitter.hpp"
#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] std::string TextEmitter::get_name() const
{
	return "Text";
}

[[nodiscard]] std::string TextEmitter::get_extension() const
{
	return "txt";
}

/**
 * @brief Escapes quotes and backslashes
 *
 * @param s String to escape
 * @returns Escaped string
 */
[[nodiscard]] static std::string escape(std::string_view s)
{
	std::string r;
	r.reserve(s.size());
	for (const char c : s)
	{
		if (c == '"' || c == '\\')
			r.push_back('\\');
		r.push_back(c);
	}
	return r;
}

void TextEmitter::emit(const LayoutResult& result) const
{
	std::ostream& s = m_opts.stream;

	for (std::size_t i = 0; i < result.pages.size(); ++i)
	{
		const Page& page = result.pages[i];
		s << fmt::format("[page {}] {:.2f}x{:.2f}\n", i+1, page.width, page.height);

		// Columns of a row may come back to a previous page
		for (const auto& p : result.placements)
		{
			if (p.page != i)
				continue;
			s << fmt::format("{:.2f} {:.2f} {:.2f} {}/{} \"{}\"\n",
				p.x, p.y, p.size,
				p.font.family, getFontStyleName(p.font.style),
				escape(p.text));
		}
	}
}
