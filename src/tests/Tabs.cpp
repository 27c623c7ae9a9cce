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
#include "../burro/Tabs.hpp"

TEST_CASE("Tab environment", "[Tabs]")
{
	TypesettingState state;
	Tabs tabs;
	tabs.define_tab("a", Tab{.indent = 0.0, .direction = Alignment::LEFT, .length = 200.0, .quad = true});
	tabs.define_tab("b", Tab{.indent = 250.0, .direction = Alignment::RIGHT, .length = 200.0, .quad = false});
	tabs.define_tab("wide", Tab{.indent = 400.0, .direction = Alignment::LEFT, .length = 200.0, .quad = true});
	tabs.define_list("cols", {"a", "b"});
	tabs.define_list("overflow", {"wide"});

	SECTION("Definitions")
	{
		CHECK_THROWS_AS(tabs.define_tab("a", Tab{}), ParseError);
		CHECK_THROWS_AS(tabs.define_list("cols", {"a"}), ParseError);
		CHECK_THROWS_AS(tabs.define_list("bad", {"a", "missing"}), UndefinedTabError);
	}

	SECTION("Loading")
	{
		CHECK_FALSE(tabs.active());
		CHECK_THROWS_AS(tabs.load("missing", state), UndefinedTabListError);

		tabs.load("cols", state);
		CHECK(tabs.active());
		CHECK_FALSE(tabs.cursor().has_value());
		CHECK(tabs.current() == nullptr);
		CHECK_FALSE(tabs.column().has_value());
		CHECK(tabs.current_name().empty());
		CHECK_THROWS_AS(tabs.load("overflow", state), TabNestingError);
	}

	SECTION("Selection")
	{
		state.set(Setting::ALIGN, "justify");
		tabs.load("cols", state);

		CHECK_FALSE(tabs.select("b", state));
		CHECK(tabs.cursor() == 2);
		CHECK(tabs.current_name() == "b");
		CHECK_FALSE(tabs.current()->quad);
		CHECK(state.alignment() == Alignment::RIGHT);
		CHECK(state.length(Setting::MARGIN_LEFT) == 322.0);
		CHECK(state.length(Setting::MARGIN_RIGHT) == 90.0);
		REQUIRE(tabs.column().has_value());
		CHECK(tabs.column()->left == 322.0);
		CHECK(tabs.column()->width == 200.0);

		// Selecting again starts from the saved state
		CHECK_FALSE(tabs.select("a", state));
		CHECK(state.alignment() == Alignment::LEFT);
		CHECK(state.length(Setting::MARGIN_LEFT) == 72.0);
		CHECK(state.length(Setting::MARGIN_RIGHT) == 340.0);
		CHECK(state.depth(Setting::MARGIN_LEFT) == 2);

		CHECK_THROWS_AS(tabs.select("wide", state), UndefinedTabError);
	}

	SECTION("Navigation")
	{
		tabs.load("cols", state);
		CHECK_THROWS_AS(tabs.previous(state), TabNavigationOutOfRangeError);

		CHECK_FALSE(tabs.next(state));
		CHECK(tabs.current_name() == "a");
		CHECK_FALSE(tabs.next(state));
		CHECK(tabs.current_name() == "b");

		CHECK_THROWS_AS(tabs.next(state), TabNavigationOutOfRangeError);
		CHECK(tabs.cursor() == 2);
		CHECK(state.length(Setting::MARGIN_LEFT) == 322.0);

		CHECK_FALSE(tabs.previous(state));
		CHECK(tabs.current_name() == "a");
		CHECK_THROWS_AS(tabs.previous(state), TabNavigationOutOfRangeError);
	}

	SECTION("Quitting")
	{
		CHECK_THROWS_AS(tabs.quit(state), NoTabsLoadedError);

		state.set(Setting::MARGIN_LEFT, "90");
		state.set(Setting::ALIGN, "right");
		tabs.load("cols", state);
		CHECK_FALSE(tabs.select("b", state));
		CHECK(state.length(Setting::MARGIN_LEFT) == 340.0);

		tabs.quit(state);
		CHECK_FALSE(tabs.active());
		CHECK(state.alignment() == Alignment::RIGHT);
		CHECK(state.length(Setting::MARGIN_LEFT) == 90.0);
		CHECK(state.length(Setting::MARGIN_RIGHT) == 72.0);

		// Lists can be loaded again
		tabs.load("cols", state);
		CHECK(tabs.active());
	}

	SECTION("Without a loaded list")
	{
		CHECK_THROWS_AS(tabs.select("a", state), NoTabsLoadedError);
		CHECK_THROWS_AS(tabs.next(state), NoTabsLoadedError);
		CHECK_THROWS_AS(tabs.previous(state), NoTabsLoadedError);
	}

	SECTION("Overflow")
	{
		tabs.load("overflow", state);
		CHECK(tabs.next(state));
		CHECK(state.length(Setting::MARGIN_LEFT) == 472.0);

		// The column keeps its full length past the page edge
		const auto column = tabs.column();
		REQUIRE(column.has_value());
		CHECK(column->left == 472.0);
		CHECK(column->width == 200.0);
	}
}
