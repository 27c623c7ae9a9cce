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

#include "PdfEmitter.hpp"

#include <map>
#include <fstream>
#include <utf8.h>
#include <fmt/format.h>

using namespace std::literals;

/**
 * @brief Codepoints of WinAnsiEncoding in range 0x80-0x9F
 */
static constexpr auto winAnsiHigh = make_array<char32_t>(
	U'€', U'\0', U'‚', U'ƒ', U'„', U'…', U'†', U'‡',
	U'ˆ', U'‰', U'Š', U'‹', U'Œ', U'\0', U'Ž', U'\0',
	U'\0', U'‘', U'’', U'“', U'”', U'•', U'–', U'—',
	U'˜', U'™', U'š', U'›', U'œ', U'\0', U'ž', U'Ÿ'
);

[[nodiscard]] char toWinAnsi(char32_t cp) noexcept
{
	if ((cp >= 0x20 && cp < 0x7F) || (cp >= 0xA0 && cp <= 0xFF)) [[likely]]
		return static_cast<char>(cp);
	for (std::size_t i = 0; i < winAnsiHigh.size(); ++i)
	{
		if (winAnsiHigh[i] != 0 && winAnsiHigh[i] == cp)
			return static_cast<char>(0x80 + i);
	}
	return '?';
}

[[nodiscard]] char32_t fromWinAnsi(unsigned char c) noexcept
{
	if ((c >= 0x20 && c < 0x7F) || c >= 0xA0)
		return c;
	if (c >= 0x80 && c <= 0x9F)
		return winAnsiHigh[c - 0x80];
	return 0;
}

[[nodiscard]] std::string PdfEmitter::get_name() const
{
	return "PDF";
}

[[nodiscard]] std::string PdfEmitter::get_extension() const
{
	return "pdf";
}

//{{{ Helpers
/**
 * @brief Encodes UTF-8 text as a PDF literal string
 *
 * @param text UTF-8 text
 * @returns WinAnsi encoded string, with parentheses
 */
[[nodiscard]] static std::string pdfString(std::string_view text)
{
	std::string r = "("s;
	auto it = text.begin();
	while (it != text.end())
	{
		const char c = toWinAnsi(utf8::next(it, text.end()));
		if (c == '(' || c == ')' || c == '\\')
		{
			r.push_back('\\');
			r.push_back(c);
		}
		else if (static_cast<unsigned char>(c) >= 0x80)
			r.append(fmt::format("\\{:03o}", static_cast<unsigned char>(c)));
		else
			r.push_back(c);
	}
	r.push_back(')');
	return r;
}

/**
 * @brief Formats a PDF name
 *
 * @param name Name without the slash
 * @returns Name with irregular characters escaped
 */
[[nodiscard]] static std::string pdfName(std::string_view name)
{
	std::string r = "/"s;
	for (const char c : name)
	{
		const auto u = static_cast<unsigned char>(c);
		if (u <= 0x20 || u >= 0x7F || "#()<>[]{}/%"sv.find(c) != std::string_view::npos)
			r.append(fmt::format("#{:02X}", u));
		else
			r.push_back(c);
	}
	return r;
}

/**
 * @brief Reads a binary file
 *
 * @param path File's path
 * @returns File content
 */
[[nodiscard]] static std::string readFile(const std::string& path)
{
	std::ifstream in(path, std::ios::binary);
	if (!in.good()) [[unlikely]]
		throw Error(fmt::format("Unable to read font file `{}`", path));
	return std::string((std::istreambuf_iterator<char>(in)), (std::istreambuf_iterator<char>()));
}

/**
 * @brief Objects of a PDF file
 *
 * Ids are allocated before bodies are known so objects can reference each other
 */
class PdfObjects
{
	std::vector<std::string> m_bodies;
public:
	[[nodiscard]] std::size_t allocate()
	{
		m_bodies.emplace_back();
		return m_bodies.size();
	}

	void set(std::size_t id, std::string&& body) { m_bodies[id-1] = std::move(body); }

	/**
	 * @brief Adds an object
	 *
	 * @param body Object's content
	 * @returns Object's id
	 */
	[[nodiscard]] std::size_t add(std::string&& body)
	{
		m_bodies.push_back(std::move(body));
		return m_bodies.size();
	}

	/**
	 * @brief Serializes the file
	 *
	 * @param root Catalog id
	 * @param info Info dictionary id
	 * @returns PDF file content
	 */
	[[nodiscard]] std::string write(std::size_t root, std::size_t info) const
	{
		std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n"s;
		std::vector<std::size_t> offsets;
		offsets.reserve(m_bodies.size());
		for (std::size_t i = 0; i < m_bodies.size(); ++i)
		{
			offsets.push_back(out.size());
			out.append(fmt::format("{} 0 obj\n", i+1));
			out.append(m_bodies[i]);
			out.append("\nendobj\n");
		}

		const std::size_t xref = out.size();
		out.append(fmt::format("xref\n0 {}\n0000000000 65535 f \n", m_bodies.size()+1));
		for (const auto offset : offsets)
			out.append(fmt::format("{:010} 00000 n \n", offset));
		out.append(fmt::format("trailer\n<< /Size {} /Root {} 0 R /Info {} 0 R >>\nstartxref\n{}\n%%EOF\n",
			m_bodies.size()+1, root, info, xref));
		return out;
	}
};
//}}}

void PdfEmitter::emit(const LayoutResult& result) const
{
	PdfObjects objs;
	const std::size_t catalog = objs.allocate();
	const std::size_t pages = objs.allocate();
	objs.set(catalog, fmt::format("<< /Type /Catalog /Pages {} 0 R >>", pages));

	std::string info = "<< /Producer (Burro)"s;
	if (!m_opts.title.empty())
		info.append(fmt::format(" /Title {}", pdfString(utf8::replace_invalid(m_opts.title)))); // Titles come from file names
	info.append(" >>");
	const std::size_t info_id = objs.add(std::move(info));

	// Fonts
	std::map<FontRef, std::size_t> fonts; // Font -> Resource number
	for (const auto& p : result.placements)
		fonts.insert({p.font, fonts.size()+1});

	std::string resources = "<< /Font <<"s;
	for (const auto& [ref, num] : fonts)
	{
		const FontMetrics& metrics = m_fonts.resolve(ref);
		std::size_t id;
		if (metrics.builtin())
		{
			id = objs.add(fmt::format("<< /Type /Font /Subtype /Type1 /BaseFont {} /Encoding /WinAnsiEncoding >>",
				pdfName(metrics.name)));
		}
		else
		{
			const std::string data = readFile(metrics.path);
			const std::size_t file = objs.add(fmt::format("<< /Length {0} /Length1 {0} >>\nstream\n", data.size())
				+ data + "\nendstream"s);

			const std::size_t descriptor = objs.add(fmt::format(
				"<< /Type /FontDescriptor /FontName {} /Flags 32 /FontBBox [0 {:.0f} 1000 {:.0f}] /ItalicAngle 0 "
				"/Ascent {:.0f} /Descent {:.0f} /CapHeight {:.0f} /StemV 80 /FontFile2 {} 0 R >>",
				pdfName(metrics.name), metrics.descent, metrics.ascent,
				metrics.ascent, metrics.descent, metrics.ascent, file));

			std::string widths;
			for (std::size_t c = 32; c <= 255; ++c)
			{
				const char32_t cp = fromWinAnsi(static_cast<unsigned char>(c));
				widths.append(fmt::format("{}{:.0f}", c == 32 ? "" : " ",
					cp == 0 ? metrics.default_advance : metrics.advance(cp)));
			}

			id = objs.add(fmt::format(
				"<< /Type /Font /Subtype /TrueType /BaseFont {} /FirstChar 32 /LastChar 255 /Widths [{}] "
				"/FontDescriptor {} 0 R /Encoding /WinAnsiEncoding >>",
				pdfName(metrics.name), widths, descriptor));
		}
		resources.append(fmt::format(" /F{} {} 0 R", num, id));
	}
	resources.append(" >> >>");

	// Pages
	std::string kids;
	for (std::size_t i = 0; i < result.pages.size(); ++i)
	{
		const Page& page = result.pages[i];

		std::string content = "BT\n"s;
		const FontRef* font = nullptr;
		double size = 0.0, letter_space = 0.0;
		for (const auto& p : result.placements)
		{
			if (p.page != i)
				continue;

			if (font == nullptr || *font != p.font || size != p.size)
			{
				font = &p.font;
				size = p.size;
				content.append(fmt::format("/F{} {:.2f} Tf\n", fonts.at(p.font), p.size));
			}
			if (letter_space != p.letter_space)
			{
				letter_space = p.letter_space;
				content.append(fmt::format("{:.2f} Tc\n", letter_space));
			}
			content.append(fmt::format("1 0 0 1 {:.2f} {:.2f} Tm\n{} Tj\n", p.x, page.height - p.y, pdfString(p.text)));
		}
		content.append("ET");

		const std::size_t stream = objs.add(fmt::format("<< /Length {} >>\nstream\n{}\nendstream", content.size(), content));
		const std::size_t id = objs.add(fmt::format(
			"<< /Type /Page /Parent {} 0 R /MediaBox [0 0 {:.2f} {:.2f}] /Resources {} /Contents {} 0 R >>",
			pages, page.width, page.height, resources, stream));
		kids.append(fmt::format("{}{} 0 R", kids.empty() ? "" : " ", id));
	}
	objs.set(pages, fmt::format("<< /Type /Pages /Kids [{}] /Count {} >>", kids, result.pages.size()));

	const std::string out = objs.write(catalog, info_id);
	m_opts.stream.write(out.data(), static_cast<std::streamsize>(out.size()));
}
