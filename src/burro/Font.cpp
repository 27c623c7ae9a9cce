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

#include "Font.hpp"
#include "FontMap.hpp"
#include "Util.hpp"

#include <utf8.h>
#include <fmt/format.h>
#include <ft2build.h>
#include FT_FREETYPE_H

using namespace std::literals;

[[nodiscard]] double FontMetrics::advance(char32_t cp) const
{
	if (const auto it = advances.find(cp); it != advances.end()) [[likely]]
		return it->second;
	return default_advance;
}

[[nodiscard]] double FontMetrics::measure(std::string_view text, double size, double letter_space) const
{
	double width = 0.0;
	auto it = text.begin();
	while (it != text.end())
	{
		const char32_t cp = utf8::next(it, text.end());
		width += advance(cp) * size / 1000.0 + letter_space;
	}
	return width;
}

//{{{ BuiltinFonts
BuiltinFonts::BuiltinFonts()
{
	static constexpr auto names = make_array<std::string_view>(
		"Courier",
		"Courier-Bold",
		"Courier-Oblique",
		"Courier-BoldOblique"
	);

	for (std::size_t i = 0; i < m_courier.size(); ++i)
	{
		m_courier[i] = FontMetrics{
			.name = std::string{names[i]},
			.path = {},
			.ascent = 629.0,
			.descent = -157.0,
			.default_advance = 600.0,
			.advances = {},
		};
	}
}

[[nodiscard]] const FontMetrics& BuiltinFonts::resolve(const FontRef& ref) const
{
	if (ref.family != "courier"sv) [[unlikely]]
		throw FontResolutionError(fmt::format("Unknown font family `{}`, builtin fonts only provide `courier`", ref.family));
	return m_courier[static_cast<std::size_t>(ref.style)];
}

[[nodiscard]] std::string BuiltinFonts::default_family() const
{
	return "courier"s;
}
//}}}

//{{{ FreeTypeFonts
/**
 * @brief Loads metrics of a font file
 *
 * @param lib FreeType library
 * @param path Font file
 * @param fallback_name Name used when the font has no PostScript name
 * @returns Metrics for codepoints in Latin-1 and Latin Extended
 */
[[nodiscard]] static FontMetrics loadMetrics(FT_Library lib, const std::string& path, const std::string& fallback_name)
{
	FT_Face face;
	if (FT_Error err = FT_New_Face(lib, path.c_str(), 0, &face); err != 0) [[unlikely]]
		throw FontMapError(fmt::format("Unable to load font file `{}` (FreeType error {})", path, err));

	const double upem = face->units_per_EM != 0 ? face->units_per_EM : 1000.0;
	const char* ps_name = FT_Get_Postscript_Name(face);

	FontMetrics metrics{
		.name = ps_name != nullptr ? std::string{ps_name} : fallback_name,
		.path = path,
		.ascent = face->ascender * 1000.0 / upem,
		.descent = face->descender * 1000.0 / upem,
		.default_advance = 500.0,
		.advances = {},
	};

	// `.notdef` is glyph 0
	if (FT_Load_Glyph(face, 0, FT_LOAD_NO_SCALE) == 0)
		metrics.default_advance = face->glyph->metrics.horiAdvance * 1000.0 / upem;

	for (char32_t cp = 0x20; cp <= 0x24F; ++cp)
	{
		const FT_UInt index = FT_Get_Char_Index(face, cp);
		if (index == 0)
			continue;
		if (FT_Load_Glyph(face, index, FT_LOAD_NO_SCALE) != 0) [[unlikely]]
			continue; // Measured as `.notdef`
		metrics.advances[cp] = face->glyph->metrics.horiAdvance * 1000.0 / upem;
	}

	FT_Done_Face(face);
	return metrics;
}

FreeTypeFonts::FreeTypeFonts(const FontMap& map):
	m_default{map.default_family.empty() ? m_builtin.default_family() : map.default_family}
{
	FT_Library lib;
	if (FT_Init_FreeType(&lib) != 0) [[unlikely]]
		throw Error("Unable to initialize FreeType");

	try
	{
		for (const auto& [family, styles] : map.families)
		{
			m_families[family] = styles.size();
			for (const auto& [style, path] : styles)
			{
				m_fonts.insert({FontRef{family, style},
					loadMetrics(lib, path.string(), fmt::format("{}-{}", family, getFontStyleName(style)))});
			}
		}
	}
	catch (Error&)
	{
		FT_Done_FreeType(lib);
		throw;
	}
	FT_Done_FreeType(lib);

	if (!map.default_family.empty() && m_families.find(map.default_family) == m_families.end() && map.default_family != m_builtin.default_family()) [[unlikely]]
		throw FontMapError(fmt::format("Default family `{}` is not defined in the font map", map.default_family));
}

[[nodiscard]] const FontMetrics& FreeTypeFonts::resolve(const FontRef& ref) const
{
	if (m_families.find(ref.family) == m_families.end())
		return m_builtin.resolve(ref);

	const auto it = m_fonts.find(ref);
	if (it == m_fonts.end()) [[unlikely]]
		throw FontResolutionError(fmt::format("Font family `{}` has no `{}` font in the font map", ref.family, getFontStyleName(ref.style)));
	return it->second;
}

[[nodiscard]] std::string FreeTypeFonts::default_family() const
{
	return m_default;
}
//}}}
