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

#include "Units.hpp"
#include "Util.hpp"

#include <charconv>
#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] Length parseLength(std::string_view s)
{
	const std::string_view original = s;
	auto invalid = [&]
	{
		return ParseError(fmt::format("Invalid length `{}`, expected `[+-]number[pt|in|mm|cm|P]`", original));
	};

	s = trim(s);
	if (s.empty()) [[unlikely]]
		throw invalid();

	Length len{.value = 0.0, .relative = false};
	bool negative = false;
	if (s.front() == '+' || s.front() == '-')
	{
		len.relative = true;
		negative = s.front() == '-';
		s.remove_prefix(1);
	}

	// Number: digits with at most one dot, at least one digit
	std::size_t end = 0;
	std::size_t digits = 0, dots = 0;
	for (; end < s.size(); ++end)
	{
		if (s[end] >= '0' && s[end] <= '9')
			++digits;
		else if (s[end] == '.')
			++dots;
		else
			break;
	}
	if (digits == 0 || dots > 1) [[unlikely]]
		throw invalid();

	// std::from_chars does not accept a leading dot
	std::string number{s.substr(0, end)};
	if (number.front() == '.')
		number.insert(number.begin(), '0');
	double value;
	const auto [ptr, err] = std::from_chars(number.data(), number.data()+number.size(), value);
	if (err != std::errc{} || ptr != number.data()+number.size()) [[unlikely]]
		throw invalid();

	const std::string_view unit = s.substr(end);
	double factor;
	if (unit.empty() || unit == "pt"sv)
		factor = Units::PT;
	else if (unit == "in"sv)
		factor = Units::IN;
	else if (unit == "mm"sv)
		factor = Units::MM;
	else if (unit == "cm"sv)
		factor = Units::CM;
	else if (unit == "P"sv)
		factor = Units::PICA;
	else [[unlikely]]
		throw ParseError(fmt::format("Unknown unit `{}` in length `{}`", unit, original));

	len.value = (negative ? -value : value) * factor;
	return len;
}

[[nodiscard]] Alignment parseAlignment(std::string_view s)
{
	s = trim(s);
	if (s == "left"sv)
		return Alignment::LEFT;
	else if (s == "center"sv)
		return Alignment::CENTER;
	else if (s == "right"sv)
		return Alignment::RIGHT;
	else if (s == "justify"sv)
		return Alignment::JUSTIFY;
	throw ParseError(fmt::format("Invalid alignment `{}`, expected one of `left`, `center`, `right` or `justify`", s));
}

[[nodiscard]] FontStyle parseFontStyle(std::string_view s)
{
	s = trim(s);
	if (s == "roman"sv)
		return FontStyle::ROMAN;
	else if (s == "bold"sv)
		return FontStyle::BOLD;
	else if (s == "italic"sv)
		return FontStyle::ITALIC;
	else if (s == "bold_italic"sv)
		return FontStyle::BOLD_ITALIC;
	throw ParseError(fmt::format("Invalid font style `{}`", s));
}

[[nodiscard]] bool parseBool(std::string_view s)
{
	s = trim(s);
	if (s == "true"sv)
		return true;
	else if (s == "false"sv)
		return false;
	throw ParseError(fmt::format("Invalid boolean `{}`, expected `true` or `false`", s));
}

[[nodiscard]] std::string_view getAlignmentName(Alignment align) noexcept
{
	static constexpr auto names = make_array<std::string_view>(
		"left",
		"center",
		"right",
		"justify"
	);

	return names[static_cast<std::size_t>(align)];
}

[[nodiscard]] std::string_view getFontStyleName(FontStyle style) noexcept
{
	static constexpr auto names = make_array<std::string_view>(
		"roman",
		"bold",
		"italic",
		"bold_italic"
	);

	return names[static_cast<std::size_t>(style)];
}

[[nodiscard]] FontStyle combineStyles(FontStyle a, FontStyle b) noexcept
{
	const bool bold = a == FontStyle::BOLD || a == FontStyle::BOLD_ITALIC
		|| b == FontStyle::BOLD || b == FontStyle::BOLD_ITALIC;
	const bool italic = a == FontStyle::ITALIC || a == FontStyle::BOLD_ITALIC
		|| b == FontStyle::ITALIC || b == FontStyle::BOLD_ITALIC;

	if (bold && italic)
		return FontStyle::BOLD_ITALIC;
	else if (bold)
		return FontStyle::BOLD;
	else if (italic)
		return FontStyle::ITALIC;
	return FontStyle::ROMAN;
}
