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

#include "FontMap.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <utf8.h>

using namespace std::literals;

/**
 * @brief Parses a basic (`"..."`) or literal (`'...'`) string
 *
 * @param f File
 * @param line Line content
 * @param start Offset of line in f
 * @param i Position of the opening quote in line, set past the closing quote
 * @returns Unquoted string
 */
[[nodiscard]] static std::string parseString(const File& f, std::string_view line, std::size_t start, std::size_t& i)
{
	if (i < line.size() && line[i] == '\'')
	{
		const std::size_t end = line.find('\'', i+1);
		if (end == std::string_view::npos) [[unlikely]]
			throw FontMapError(f, "Unterminated string", start+line.size());
		std::string s{line.substr(i+1, end-i-1)};
		i = end+1;
		return s;
	}
	if (i >= line.size() || line[i] != '"') [[unlikely]]
		throw FontMapError(f, "Expected a quoted string", start+i);

	std::string s;
	for (++i; i < line.size(); ++i)
	{
		if (line[i] == '"')
		{
			++i;
			return s;
		}
		if (line[i] != '\\')
		{
			s.push_back(line[i]);
			continue;
		}

		const std::size_t esc = i++;
		if (i >= line.size()) [[unlikely]]
			break;
		switch (line[i])
		{
			case 'b': s.push_back('\b'); break;
			case 't': s.push_back('\t'); break;
			case 'n': s.push_back('\n'); break;
			case 'f': s.push_back('\f'); break;
			case 'r': s.push_back('\r'); break;
			case '"': s.push_back('"'); break;
			case '\\': s.push_back('\\'); break;
			case 'u':
			case 'U':
			{
				const std::size_t len = line[i] == 'u' ? 4 : 8;
				if (i+len >= line.size()) [[unlikely]]
					throw FontMapError(f, "Truncated unicode escape", start+esc, line.size()-esc);

				std::uint32_t cp = 0;
				for (std::size_t k = 1; k <= len; ++k)
				{
					const char h = line[i+k];
					if (h >= '0' && h <= '9')
						cp = cp*16 + static_cast<std::uint32_t>(h - '0');
					else if (h >= 'a' && h <= 'f')
						cp = cp*16 + static_cast<std::uint32_t>(h - 'a' + 10);
					else if (h >= 'A' && h <= 'F')
						cp = cp*16 + static_cast<std::uint32_t>(h - 'A' + 10);
					else [[unlikely]]
						throw FontMapError(f, fmt::format("Invalid hexadecimal digit `{}` in unicode escape", h), start+i+k);
				}
				if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) [[unlikely]]
					throw FontMapError(f, fmt::format("Invalid codepoint U+{:04X}", cp), start+esc, len+2);

				utf8::append(cp, std::back_inserter(s));
				i += len;
				break;
			}
			default: [[unlikely]]
				throw FontMapError(f, fmt::format("Invalid escape sequence `\\{}`", line[i]), start+esc, 2);
		}
	}
	throw FontMapError(f, "Unterminated string", start+line.size());
}

/**
 * @brief Parses a dotted key (`families."sans serif".bold`)
 *
 * @param f File
 * @param line Line content
 * @param start Offset of line in f
 * @param i Position of the key in line, set past the key and its trailing whitespace
 * @returns Key parts
 */
[[nodiscard]] static std::vector<std::string> parseKey(const File& f, std::string_view line, std::size_t start, std::size_t& i)
{
	static constexpr auto bare = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-"sv;

	std::vector<std::string> key;
	while (true)
	{
		i = std::min(line.find_first_not_of(" \t", i), line.size());
		if (i < line.size() && (line[i] == '"' || line[i] == '\''))
			key.push_back(parseString(f, line, start, i));
		else
		{
			const std::size_t end = std::min(line.find_first_not_of(bare, i), line.size());
			if (end == i) [[unlikely]]
				throw FontMapError(f, "Expected a key", start+i);
			key.emplace_back(line.substr(i, end-i));
			i = end;
		}

		i = std::min(line.find_first_not_of(" \t", i), line.size());
		if (i >= line.size() || line[i] != '.')
			return key;
		++i;
	}
}

/**
 * @brief Checks that only a comment follows
 */
static void expectEnd(const File& f, std::string_view line, std::size_t start, std::size_t i)
{
	const std::size_t pos = std::min(line.find_first_not_of(" \t", i), line.size());
	if (pos < line.size() && line[pos] != '#') [[unlikely]]
		throw FontMapError(f, "Unexpected content after value", start+pos, line.size()-pos);
}

[[nodiscard]] FontMap FontMap::parse(const File& f, const std::filesystem::path& base)
{
	static constexpr auto styles = make_array<std::pair<std::string_view, FontStyle>>(
		std::make_pair("roman"sv, FontStyle::ROMAN),
		std::make_pair("bold"sv, FontStyle::BOLD),
		std::make_pair("italic"sv, FontStyle::ITALIC),
		std::make_pair("bold_italic"sv, FontStyle::BOLD_ITALIC)
	);

	FontMap map;
	std::string table; // Current family, empty for the root table
	std::size_t start = 0;
	while (start < f.content.size())
	{
		const std::string_view raw = f.get_line(start);
		const std::size_t indent = raw.find_first_not_of(" \t");
		const std::string_view line = trim(raw);
		const std::size_t offset = start + (indent == std::string_view::npos ? 0 : indent);
		const std::size_t next = start + raw.size() + 1;

		if (line.empty() || line.front() == '#')
		{
			start = next;
			continue;
		}

		// Table header
		if (line.front() == '[')
		{
			std::size_t i = 1;
			const auto key = parseKey(f, line, offset, i);
			if (i >= line.size() || line[i] != ']') [[unlikely]]
				throw FontMapError(f, "Expected `]`", offset+i);
			expectEnd(f, line, offset, i+1);

			if (key.size() != 2 || key[0] != "families"sv) [[unlikely]]
				throw FontMapError(f, "Invalid table header, expected `[families.<name>]`", offset, line.size());

			table = key[1];
			if (table.empty()) [[unlikely]]
				throw FontMapError(f, "Empty family name", offset, line.size());
			if (map.families.find(table) != map.families.end()) [[unlikely]]
				throw FontMapError(f, fmt::format("Family `{}` is defined twice", table), offset, line.size());

			map.families[table];
			start = next;
			continue;
		}

		// Key = value
		std::size_t i = 0;
		std::vector<std::string> key = parseKey(f, line, offset, i);
		const std::size_t key_size = trim(line.substr(0, i)).size();
		if (i >= line.size() || line[i] != '=') [[unlikely]]
			throw FontMapError(f, "Expected `key = \"value\"`", offset, line.size());
		const std::size_t eq = i;
		i = line.find_first_not_of(" \t", eq+1);
		if (i == std::string_view::npos) [[unlikely]]
			throw FontMapError(f, fmt::format("Missing value for key `{}`", fmt::join(key, ".")), offset+eq);
		const std::string value = parseString(f, line, offset, i);
		expectEnd(f, line, offset, i);

		if (!table.empty())
			key.insert(key.begin(), {"families"s, table});

		if (key.size() == 1 && key[0] == "default"sv)
			map.default_family = value;
		else if (key.size() == 3 && key[0] == "families"sv)
		{
			const std::string& name = key[1];
			if (name.empty()) [[unlikely]]
				throw FontMapError(f, "Empty family name", offset, key_size);

			const auto style = std::find_if(styles.cbegin(), styles.cend(), [&](const auto& p) { return p.first == key[2]; });
			if (style == styles.cend()) [[unlikely]]
				throw FontMapError(f, fmt::format("Unknown style `{}`, expected one of `roman`, `bold`, `italic` or `bold_italic`", key[2]), offset, key_size);

			auto& family = map.families[name];
			if (family.find(style->second) != family.end()) [[unlikely]]
				throw FontMapError(f, fmt::format("Style `{}` is defined twice for family `{}`", key[2], name), offset, key_size);

			std::filesystem::path path{value};
			if (path.is_relative())
				path = base / path;
			family[style->second] = path;
		}
		else if (table.empty()) [[unlikely]]
			throw FontMapError(f, fmt::format("Unknown key `{}`, expected `default` or a `[families.<name>]` table", fmt::join(key, ".")), offset, key_size);
		else [[unlikely]]
			throw FontMapError(f, fmt::format("Unknown style `{}`, expected one of `roman`, `bold`, `italic` or `bold_italic`", fmt::join(key.begin()+2, key.end(), ".")), offset, key_size);

		start = next;
	}

	return map;
}

[[nodiscard]] FontMap FontMap::load(const std::filesystem::path& path)
{
	std::ifstream in(path);
	if (!in.good()) [[unlikely]]
		throw FontMapError(fmt::format("Unable to open font map `{}`", path.string()));
	std::string content((std::istreambuf_iterator<char>(in)), (std::istreambuf_iterator<char>()));
	in.close();

	return parse(File(path.string(), content), path.parent_path());
}
