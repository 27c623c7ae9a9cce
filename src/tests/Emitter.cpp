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
#include "../burro/Parser.hpp"
#include "../burro/TextEmitter.hpp"
#include "../burro/PdfEmitter.hpp"

#include <sstream>

using namespace std::literals;

[[nodiscard]] static LayoutResult layout(std::string_view source, const FontProvider& fonts)
{
	const File f = testFile(source);
	const auto [doc, vars] = Parser(f).parse(Lexer(f).lex());
	return Layout(doc, fonts).run();
}

[[nodiscard]] static std::string emit(const Emitter& e, const LayoutResult& r)
{
	e.emit(r);
	return static_cast<const std::ostringstream&>(e.getOptions().stream).str();
}

[[nodiscard]] static TextPlacement placement(std::size_t page, std::string text)
{
	return TextPlacement{
		.page = page,
		.x = 72.0,
		.y = 100.0,
		.text = std::move(text),
		.font = FontRef{"courier", FontStyle::ROMAN},
		.size = 10.0,
		.letter_space = 0.0,
		.pos = 0,
	};
}

static const Page letter{.width = 612.0, .height = 792.0, .margin_left = 72.0, .margin_right = 72.0, .margin_top = 72.0, .margin_bottom = 72.0};

TEST_CASE("Text emitter", "[Emitter]")
{
	const BuiltinFonts fonts;
	std::ostringstream ss;
	const TextEmitter e{EmitterOptions{ss}};
	CHECK(e.get_name() == "Text");
	CHECK(e.get_extension() == "txt");

	SECTION("Placements")
	{
		CHECK(emit(e, layout("Hello", fonts)) ==
			"[page 1] 612.00x792.00\n"
			"72.00 79.55 12.00 courier/roman \"Hello\"\n");
	}

	SECTION("Styles")
	{
		const std::string out = emit(e, layout(".italic[a]", fonts));
		CHECK(out.find("courier/italic \"a\"") != std::string::npos);
	}

	SECTION("Placements are grouped by page")
	{
		LayoutResult r{.pages = {letter, letter}, .placements = {}, .warnings = {}};
		r.placements.push_back(placement(1, "second"));
		r.placements.push_back(placement(0, "first"));
		CHECK(emit(e, r) ==
			"[page 1] 612.00x792.00\n"
			"72.00 100.00 10.00 courier/roman \"first\"\n"
			"[page 2] 612.00x792.00\n"
			"72.00 100.00 10.00 courier/roman \"second\"\n");
	}

	SECTION("Escaping")
	{
		LayoutResult r{.pages = {letter}, .placements = {placement(0, "\"a\\b\"")}, .warnings = {}};
		CHECK(emit(e, r).ends_with("\"\\\"a\\\\b\\\"\"\n"));
	}
}

TEST_CASE("WinAnsi encoding", "[Emitter]")
{
	CHECK(toWinAnsi(U'a') == 'a');
	CHECK(toWinAnsi(U'é') == '\xE9');
	CHECK(toWinAnsi(U'“') == '\x93');
	CHECK(toWinAnsi(U'”') == '\x94');
	CHECK(toWinAnsi(U'€') == '\x80');
	CHECK(toWinAnsi(U'中') == '?');
	CHECK(toWinAnsi(U'\n') == '?');

	CHECK(fromWinAnsi(0x41) == U'A');
	CHECK(fromWinAnsi(0x93) == U'“');
	CHECK(fromWinAnsi(0x81) == 0);
	CHECK(fromWinAnsi(0x10) == 0);
	for (unsigned c = 0x20; c <= 0xFF; ++c)
	{
		const char32_t cp = fromWinAnsi(static_cast<unsigned char>(c));
		if (cp != 0)
			CHECK(static_cast<unsigned char>(toWinAnsi(cp)) == c);
	}
}

TEST_CASE("PDF emitter", "[Emitter]")
{
	const BuiltinFonts fonts;
	std::ostringstream ss;
	EmitterOptions opts{ss};
	opts.title = "hello";
	const PdfEmitter e{std::move(opts), fonts};
	CHECK(e.get_name() == "PDF");
	CHECK(e.get_extension() == "pdf");

	SECTION("Document structure")
	{
		const std::string out = emit(e, layout("Hello", fonts));
		CHECK(out.starts_with("%PDF-1.4\n"));
		CHECK(out.ends_with("%%EOF\n"));
		CHECK(out.find("<< /Type /Catalog /Pages 2 0 R >>") != std::string::npos);
		CHECK(out.find("/Producer (Burro) /Title (hello)") != std::string::npos);
		CHECK(out.find("/BaseFont /Courier /Encoding /WinAnsiEncoding") != std::string::npos);
		CHECK(out.find("/MediaBox [0 0 612.00 792.00]") != std::string::npos);
		CHECK(out.find("/Count 1") != std::string::npos);
		CHECK(out.find("/F1 12.00 Tf\n1 0 0 1 72.00 712.45 Tm\n(Hello) Tj\n") != std::string::npos);

		// Cross reference table
		const std::size_t startxref = out.rfind("startxref\n");
		REQUIRE(startxref != std::string::npos);
		const std::size_t xref = std::stoul(out.substr(startxref + 10));
		CHECK(out.compare(xref, 5, "xref\n") == 0);

		const std::size_t first = out.find("0000000000 65535 f \n");
		REQUIRE(first != std::string::npos);
		const std::size_t object = std::stoul(out.substr(first + 20, 10));
		CHECK(out.compare(object, 8, "1 0 obj\n") == 0);
	}

	SECTION("Fonts are shared between pages")
	{
		const std::string out = emit(e, layout("a .bold[b] .page_break\n\nc", fonts));
		CHECK(out.find("/Count 2") != std::string::npos);
		CHECK(out.find("/BaseFont /Courier-Bold") != std::string::npos);
		CHECK(out.find("/F2 12.00 Tf") != std::string::npos);

		std::size_t font_objects = 0;
		for (std::size_t i = out.find("/Type /Font "); i != std::string::npos; i = out.find("/Type /Font ", i+1))
			++font_objects;
		CHECK(font_objects == 2);
	}

	SECTION("Strings")
	{
		LayoutResult r{.pages = {letter}, .placements = {placement(0, "(été)\\"), placement(0, "“中”")}, .warnings = {}};
		r.placements[1].letter_space = 1.5;
		const std::string out = emit(e, r);
		CHECK(out.find("(\\(\\351t\\351\\)\\\\) Tj") != std::string::npos);
		CHECK(out.find("1.50 Tc\n") != std::string::npos);
		CHECK(out.find("(\\223?\\224) Tj") != std::string::npos);
	}

	SECTION("Titles with invalid UTF-8")
	{
		std::ostringstream out;
		EmitterOptions raw{out};
		raw.title = "caf\xE9 \xFF";
		const PdfEmitter pdf{std::move(raw), fonts};
		LayoutResult r{.pages = {letter}, .placements = {}, .warnings = {}};
		CHECK(emit(pdf, r).find("/Title (caf? ?)") != std::string::npos);
	}

	SECTION("Blank pages")
	{
		LayoutResult r{.pages = {letter}, .placements = {}, .warnings = {}};
		const std::string out = emit(e, r);
		CHECK(out.find("stream\nBT\nET\nendstream") != std::string::npos);
	}
}
