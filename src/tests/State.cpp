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
#include "../burro/State.hpp"

#include <catch2/matchers/catch_matchers_floating_point.hpp>

using Catch::Matchers::WithinAbs;

TEST_CASE("Lengths", "[Units]")
{
	SECTION("Units")
	{
		CHECK(parseLength("12").value == 12.0);
		CHECK(parseLength("12pt").value == 12.0);
		CHECK(parseLength("1in").value == 72.0);
		CHECK(parseLength("2P").value == 24.0);
		CHECK(parseLength(".5in").value == 36.0);
		CHECK_THAT(parseLength("10mm").value, WithinAbs(28.3464576, 1e-9));
		CHECK_THAT(parseLength("2.5cm").value, WithinAbs(70.866144, 1e-9));
		CHECK_FALSE(parseLength(" 3 ").relative);
	}

	SECTION("Relative lengths")
	{
		const Length plus = parseLength("+2pt");
		CHECK(plus.relative);
		CHECK(plus.value == 2.0);
		CHECK(plus.resolve(10.0) == 12.0);

		const Length minus = parseLength("-1P");
		CHECK(minus.relative);
		CHECK(minus.value == -12.0);
		CHECK(minus.resolve(20.0) == 8.0);

		CHECK(parseLength("5").resolve(100.0) == 5.0);
	}

	SECTION("Invalid lengths")
	{
		CHECK_THROWS_AS(parseLength(""), ParseError);
		CHECK_THROWS_AS(parseLength("abc"), ParseError);
		CHECK_THROWS_AS(parseLength("+"), ParseError);
		CHECK_THROWS_AS(parseLength("."), ParseError);
		CHECK_THROWS_AS(parseLength("1.2.3"), ParseError);
		CHECK_THROWS_AS(parseLength("12km"), ParseError);
		CHECK_THROWS_AS(parseLength("1 in"), ParseError);
		CHECK_THROWS_AS(parseLength("in"), ParseError);
	}
}

TEST_CASE("Keywords", "[Units]")
{
	SECTION("Alignment")
	{
		CHECK(parseAlignment("left") == Alignment::LEFT);
		CHECK(parseAlignment(" center ") == Alignment::CENTER);
		CHECK(parseAlignment("right") == Alignment::RIGHT);
		CHECK(parseAlignment("justify") == Alignment::JUSTIFY);
		CHECK_THROWS_AS(parseAlignment("Left"), ParseError);
		CHECK(getAlignmentName(Alignment::JUSTIFY) == "justify");
	}

	SECTION("Booleans")
	{
		CHECK(parseBool("true"));
		CHECK_FALSE(parseBool("false"));
		CHECK_THROWS_AS(parseBool("yes"), ParseError);
	}

	SECTION("Styles")
	{
		CHECK(parseFontStyle("bold_italic") == FontStyle::BOLD_ITALIC);
		CHECK_THROWS_AS(parseFontStyle("oblique"), ParseError);
		CHECK(getFontStyleName(FontStyle::ITALIC) == "italic");

		CHECK(combineStyles(FontStyle::ROMAN, FontStyle::BOLD) == FontStyle::BOLD);
		CHECK(combineStyles(FontStyle::BOLD, FontStyle::BOLD) == FontStyle::BOLD);
		CHECK(combineStyles(FontStyle::BOLD, FontStyle::ITALIC) == FontStyle::BOLD_ITALIC);
		CHECK(combineStyles(FontStyle::ITALIC, FontStyle::ROMAN) == FontStyle::ITALIC);
		CHECK(combineStyles(FontStyle::ROMAN, FontStyle::ROMAN) == FontStyle::ROMAN);
	}
}

TEST_CASE("Defaults", "[State]")
{
	const TypesettingState state;
	CHECK(state.alignment() == Alignment::LEFT);
	CHECK(state.style() == FontStyle::ROMAN);
	CHECK(state.family() == "courier");
	CHECK(state.length(Setting::MARGIN_LEFT) == 72.0);
	CHECK(state.length(Setting::MARGIN_RIGHT) == 72.0);
	CHECK(state.length(Setting::MARGIN_TOP) == 72.0);
	CHECK(state.length(Setting::MARGIN_BOTTOM) == 72.0);
	CHECK(state.length(Setting::PAGE_WIDTH) == 612.0);
	CHECK(state.length(Setting::PAGE_HEIGHT) == 792.0);
	CHECK(state.length(Setting::PT_SIZE) == 12.0);
	CHECK_THAT(state.length(Setting::LEADING), WithinAbs(14.4, 1e-9));
	CHECK(state.length(Setting::PAR_SPACE) == 0.0);
	CHECK(state.length(Setting::PAR_INDENT) == 0.0);
	CHECK(state.length(Setting::LETTER_SPACE) == 0.0);
	CHECK(state.length(Setting::SPACE_WIDTH) < 0.0);
	CHECK(state.depth(Setting::ALIGN) == 1);

	CHECK(TypesettingState("times").family() == "times");
}

TEST_CASE("Set and reset", "[State]")
{
	TypesettingState state;

	SECTION("Values stack")
	{
		state.set(Setting::MARGIN_LEFT, "1in");
		state.set(Setting::MARGIN_LEFT, "+10");
		CHECK(state.length(Setting::MARGIN_LEFT) == 82.0);
		CHECK(state.depth(Setting::MARGIN_LEFT) == 3);

		state.reset(Setting::MARGIN_LEFT);
		CHECK(state.length(Setting::MARGIN_LEFT) == 72.0);
		state.set(Setting::MARGIN_LEFT, " - ");
		CHECK(state.depth(Setting::MARGIN_LEFT) == 1);
	}

	SECTION("Resetting a default")
	{
		CHECK_THROWS_AS(state.reset(Setting::ALIGN), StateUnderflowError);
		CHECK_THROWS_AS(state.set(Setting::PT_SIZE, "-"), StateUnderflowError);
	}

	SECTION("Keywords")
	{
		state.set(Setting::ALIGN, "justify");
		state.set(Setting::STYLE, "italic");
		state.set(Setting::FAMILY, "times");
		CHECK(state.alignment() == Alignment::JUSTIFY);
		CHECK(state.style() == FontStyle::ITALIC);
		CHECK(state.family() == "times");
		CHECK_THROWS_AS(state.set(Setting::ALIGN, "middle"), ParseError);
	}

	SECTION("Automatic leading follows the point size")
	{
		state.set(Setting::PT_SIZE, "20");
		CHECK_THAT(state.length(Setting::LEADING), WithinAbs(24.0, 1e-9));
		state.set(Setting::LEADING, "+2");
		CHECK_THAT(state.length(Setting::LEADING), WithinAbs(26.0, 1e-9));
		state.set(Setting::LEADING, "16");
		state.reset(Setting::PT_SIZE);
		CHECK(state.length(Setting::LEADING) == 16.0);
	}

	SECTION("Automatic space width")
	{
		CHECK_THROWS_AS(state.set(Setting::SPACE_WIDTH, "+1"), ParseError);
		state.set(Setting::SPACE_WIDTH, "5");
		state.set(Setting::SPACE_WIDTH, "+1");
		CHECK(state.length(Setting::SPACE_WIDTH) == 6.0);
	}

	SECTION("Range checks")
	{
		CHECK_THROWS_AS(state.set(Setting::MARGIN_LEFT, "-100"), ParseError);
		CHECK_THROWS_AS(state.set(Setting::PT_SIZE, "-12"), ParseError);
		CHECK_THROWS_AS(state.set(Setting::PAGE_WIDTH, "0"), ParseError);
		state.set(Setting::LETTER_SPACE, "-1");
		CHECK(state.length(Setting::LETTER_SPACE) == -1.0);
		CHECK(state.depth(Setting::MARGIN_LEFT) == 1);
	}

	SECTION("Snapshots")
	{
		const auto saved = state.snapshot({Setting::ALIGN, Setting::MARGIN_LEFT});
		state.set(Setting::ALIGN, "right");
		state.set(Setting::MARGIN_LEFT, "10");
		state.set(Setting::PT_SIZE, "10");

		state.restore(saved);
		CHECK(state.alignment() == Alignment::LEFT);
		CHECK(state.length(Setting::MARGIN_LEFT) == 72.0);
		CHECK(state.length(Setting::PT_SIZE) == 10.0);
	}
}

TEST_CASE("Validation", "[State]")
{
	CHECK_NOTHROW(TypesettingState::validate(Setting::PT_SIZE, "-2"));
	CHECK_NOTHROW(TypesettingState::validate(Setting::LEADING, "-"));
	CHECK_THROWS_AS(TypesettingState::validate(Setting::PT_SIZE, "0"), ParseError);
	CHECK_THROWS_AS(TypesettingState::validate(Setting::ALIGN, "top"), ParseError);
	CHECK_THROWS_AS(TypesettingState::validate(Setting::MARGIN_TOP, "ten"), ParseError);

	try
	{
		TypesettingState::validate(Setting::MARGIN_TOP, "ten");
	}
	catch (ParseError& e)
	{
		CHECK_FALSE(e.located());
		CHECK(e.line() == 0);
	}
}
