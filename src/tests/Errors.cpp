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

TEST_CASE("Positions", "[Util]")
{
	const File f("t.bur", "ab\ncd\n\nef");
	CHECK(getPos(f, 0) == std::make_pair(0uz, 0uz));
	CHECK(getPos(f, 4) == std::make_pair(1uz, 1uz));
	CHECK(getPos(f, 6) == std::make_pair(2uz, 0uz));
	CHECK(getPos(f, 8) == std::make_pair(3uz, 1uz));
	CHECK(f.get_line(3) == "cd");

	CHECK(trim("  a b \t\r\n") == "a b");
	CHECK(trim(" \n ").empty());
}

TEST_CASE("Error messages", "[Util]")
{
	const File f("t.bur", "ab\ncd");
	Colors::enabled = false;

	SECTION("Format")
	{
		CHECK(getErrorMessage(f, "Parse Error", "oops", 4) ==
			"\nt.bur:2:2: Parse Error: oops\n"
			"   2 | cd\n"
			"     | ~^");
	}

	SECTION("Located errors")
	{
		ParseError e(f, "oops", 4);
		CHECK(e.located());
		CHECK(e.line() == 2);
		CHECK(e.column() == 2);
		CHECK(e.what() == getErrorMessage(f, "Parse Error", "oops", 4));

		// Errors keep their first location
		e.locate(f, 0);
		CHECK(e.pos() == 4);
	}

	SECTION("Unlocated errors")
	{
		UndefinedTabError e("Tab `x` is not defined");
		CHECK_FALSE(e.located());
		CHECK(e.category() == "Undefined Tab");
		CHECK(e.what() == "Undefined Tab: Tab `x` is not defined");

		e.locate(f, 1);
		CHECK(e.line() == 1);
		CHECK(e.column() == 2);
		CHECK(e.message() == "Tab `x` is not defined");
	}

	SECTION("Warnings")
	{
		const Warning w{.category = "Layout Overflow", .message = "too wide", .pos = 0};
		CHECK(w.format(f).starts_with("\nt.bur:1:1: Layout Overflow: too wide\n"));
	}

	Colors::enabled = true;
}
