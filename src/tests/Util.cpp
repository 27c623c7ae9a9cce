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
#include <array>
#include <ranges>
#include <iterator>
#include <utf8.h>

namespace
{
	struct CodepointRange
	{
		char32_t lo;
		char32_t hi;
	};
}

static constexpr auto ranges = std::to_array<CodepointRange>({ // {{{
	CodepointRange{0x0, 0x7F}, // Basic Latin
	CodepointRange{0x80, 0xFF}, // Latin-1 Supplement
	CodepointRange{0x100, 0x17F}, // Latin Extended-A
	CodepointRange{0x180, 0x24F}, // Latin Extended-B
	CodepointRange{0x250, 0x2AF}, // IPA Extensions
	CodepointRange{0x300, 0x36F}, // Combining Diacritical Marks
	CodepointRange{0x370, 0x3FF}, // Greek and Coptic
	CodepointRange{0x400, 0x4FF}, // Cyrillic
	CodepointRange{0x531, 0x58A}, // Armenian
	CodepointRange{0x591, 0x5F4}, // Hebrew
	CodepointRange{0x600, 0x6FF}, // Arabic
	CodepointRange{0x900, 0x97F}, // Devanagari
	CodepointRange{0xE01, 0xE5B}, // Thai
	CodepointRange{0x10A0, 0x10FC}, // Georgian
	CodepointRange{0x1100, 0x11FF}, // Hangul Jamo
	CodepointRange{0x13A0, 0x13F4}, // Cherokee
	CodepointRange{0x16A0, 0x16F0}, // Runic
	CodepointRange{0x1E00, 0x1EFF}, // Latin Extended Additional
	CodepointRange{0x2000, 0x206F}, // General Punctuation
	CodepointRange{0x20A0, 0x20B9}, // Currency Symbols
	CodepointRange{0x2100, 0x214F}, // Letterlike Symbols
	CodepointRange{0x2190, 0x21FF}, // Arrows
	CodepointRange{0x2200, 0x22FF}, // Mathematical Operators
	CodepointRange{0x2500, 0x257F}, // Box Drawing
	CodepointRange{0x25A0, 0x25FF}, // Geometric Shapes
	CodepointRange{0x2600, 0x26FF}, // Miscellaneous Symbols
	CodepointRange{0x2701, 0x27BF}, // Dingbats
	CodepointRange{0x3000, 0x303F}, // CJK Symbols and Punctuation
	CodepointRange{0x3041, 0x309F}, // Hiragana
	CodepointRange{0x30A0, 0x30FF}, // Katakana
	CodepointRange{0x4E00, 0x9FCB}, // CJK Unified Ideographs
	CodepointRange{0xFF01, 0xFFEE}, // Halfwidth and Fullwidth Forms
	CodepointRange{0x10330, 0x1034A}, // Gothic
	CodepointRange{0x1D100, 0x1D1DD}, // Musical Symbols
	CodepointRange{0x1F601, 0x1F64F}, // Emoticons
}); // }}}

std::string randomString(std::mt19937& mt, std::size_t len, std::u32string_view exclude)
{
	auto getCodepoint = [&mt, exclude] -> char32_t
	{
		std::uniform_int_distribution<std::size_t> distrib(0uz, ranges.size()-1uz);
		while (true)
		{
			const auto [lo, hi] = ranges[distrib(mt)];
			std::uniform_int_distribution<char32_t> codepoint(lo, hi);
			const char32_t cp = codepoint(mt);
			if (exclude.find(cp) == std::u32string_view::npos)
				return cp;
		}
	};

	std::string r;
	for ([[maybe_unused]] const auto _ : std::ranges::iota_view{0uz, len})
		utf8::append(getCodepoint(), std::back_inserter(r));

	return r;
}
