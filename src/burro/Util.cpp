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

#include "Util.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

using namespace std::literals;

bool Colors::enabled = true;
const std::string_view Colors::reset = "\033[0m"sv;
const std::string_view Colors::bold = "\033[1m"sv;
const std::string_view Colors::red = "\033[31m"sv;
const std::string_view Colors::green = "\033[32m"sv;
const std::string_view Colors::yellow = "\033[33m"sv;
const std::string_view Colors::blue = "\033[34m"sv;
const std::string_view Colors::magenta = "\033[35m"sv;

[[nodiscard]] std::string_view File::get_line(std::size_t start) const noexcept
{
	std::size_t endl = content.find('\n', start);
	if (endl == std::string::npos) [[unlikely]] // Current line is the last line in file
		return content.substr(start);
	return content.substr(start, endl-start);
}

/**
 * @brief Gets the offset of the line containing pos
 *
 * @param f File
 * @param pos Position
 * @returns Offset of the first character of the line
 */
[[nodiscard]] static std::size_t getLineStart(const File& f, std::size_t pos) noexcept
{
	if (pos == 0 || f.content.empty())
		return 0;
	const std::size_t start = f.content.rfind('\n', pos-1);
	if (start == std::string::npos) [[unlikely]]
		return 0;
	return start+1;
}

[[nodiscard]] std::pair<std::size_t, std::size_t> getPos(const File& f, std::size_t pos) noexcept
{
	pos = std::min(pos, f.content.size());
	const std::size_t start = getLineStart(f, pos);

	const std::size_t line_number = std::count(f.content.cbegin(), f.content.cbegin()+start, '\n'); // Line number
	const std::size_t line_pos = pos - start; // Position in line

	return {line_number, line_pos};
}

[[nodiscard]] std::string getErrorMessage(const File& f,
		const std::string_view& category, const std::string_view& msg,
		std::size_t pos, std::size_t count, std::string_view color)
{
	pos = std::min(pos, f.content.size());
	const std::size_t start = getLineStart(f, pos);

	const auto&& [line_number, line_pos] = getPos(f, pos);
	std::string_view line = f.get_line(start);
	if (!line.empty() && line.back() == '\r')
		line.remove_suffix(1);

	constexpr std::size_t width = 70; // Line printing width
	std::string r("\n");

	if (Colors::enabled)
		r.append(Colors::bold);
	r.append(fmt::format("{}:{}:{}: ", f.name, line_number + 1, line_pos + 1));
	if (Colors::enabled)
		r.append(Colors::reset).append(color);
	r.append(category).append(": ");
	if (Colors::enabled)
		r.append(Colors::reset);
	r.append(msg).append("\n");

	// Print line number
	const std::size_t line_number_width = 4 * (static_cast<std::size_t>(std::log10(line_number+1))/4 + 1);
	r.append(fmt::format("{: >{}} | ", line_number + 1, line_number_width));

	// Truncate line
	std::string_view truncated;
	std::size_t highlight_start, highlight_count;
	{
		highlight_count = std::min(count, width);
		const std::size_t skip = std::min(std::max(count+line_pos, width) - width, line.size());
		highlight_start = line_pos - std::min(skip, line_pos);

		truncated = line.substr(skip);
	}
	if (Colors::enabled)
	{
		const std::size_t hs = std::min(highlight_start, truncated.size());
		r.append(truncated.substr(0, hs))
			.append(color)
			.append(truncated.substr(hs, highlight_count))
			.append(Colors::reset)
			.append(truncated.substr(std::min(truncated.size(), hs + highlight_count)));
	}
	else
		r.append(truncated);

	// Print indicator
	r.append(fmt::format("\n{: >{}} | ", "", line_number_width));
	if (Colors::enabled)
		r.append(color);
	r.append(fmt::format("{:~>{}}", "^", highlight_start+1));
	if (Colors::enabled)
		r.append(Colors::reset);

	return r;
}

Error::Error(const std::string& msg, const std::source_location& loc)
{
	m_msg = fmt::format("{}({}:{}) `{}` {}", loc.file_name(), loc.line(), loc.column(), loc.function_name(), msg);
}

std::string Error::what() const throw()
{
	return m_msg;
}

SourceError::SourceError(std::string category, std::string msg):
	m_category{std::move(category)}, m_message{std::move(msg)}
{
	m_msg = fmt::format("{}: {}", m_category, m_message);
}

SourceError::SourceError(const File& f, std::string category, std::string msg, std::size_t pos, std::size_t count):
	m_category{std::move(category)}, m_message{std::move(msg)}
{
	locate(f, pos, count);
}

void SourceError::locate(const File& f, std::size_t pos, std::size_t count)
{
	if (m_loc)
		return;

	m_pos = pos;
	m_loc = getPos(f, pos);
	m_msg = getErrorMessage(f, m_category, m_message, pos, count);
}

[[nodiscard]] std::string Warning::format(const File& f) const
{
	return getErrorMessage(f, category, message, pos, 1, Colors::yellow);
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
	constexpr auto blanks = " \t\r\n"sv;
	const std::size_t start = s.find_first_not_of(blanks);
	if (start == std::string_view::npos)
		return {};
	const std::size_t end = s.find_last_not_of(blanks);
	return s.substr(start, end-start+1);
}
