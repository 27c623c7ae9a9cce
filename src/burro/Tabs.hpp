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

#ifndef BURRO_TABS_HPP
#define BURRO_TABS_HPP

#include <map>
#include <string>
#include <vector>
#include <optional>
#include "State.hpp"

/**
 * @brief A tab (column) definition
 */
struct Tab
{
	double indent = 0.0; ///< Offset from the left margin at load time
	Alignment direction = Alignment::LEFT; ///< Alignment inside the column
	double length = 0.0; ///< Column width
	bool quad = true; ///< Whether text wraps inside the column
};

/**
 * @brief Geometry of the selected column
 */
struct Column
{
	double left; ///< Left edge
	double width; ///< Wrap width, the tab's length
};

/**
 * @brief Tab definitions and the active tab environment
 *
 * At most one tab list can be active. Loading a list saves alignment
 * and margins, quitting restores them.
 */
class Tabs
{
	/**
	 * @brief The active environment
	 */
	struct Environment
	{
		std::string list; ///< Name of the loaded list
		std::optional<std::size_t> cursor; ///< Selected position (starting at 1)
		TypesettingState::Snapshot saved; ///< State before loading
		double origin; ///< Left margin before loading
	};

	std::map<std::string, Tab> m_tabs; ///< Tab definitions
	std::map<std::string, std::vector<std::string>> m_lists; ///< Tab lists
	std::optional<Environment> m_env; ///< Active environment

	/**
	 * @brief Moves to position
	 *
	 * @param position Position (starting at 1)
	 * @param state State to modify
	 * @returns true if the selected tab overflows the page
	 */
	[[nodiscard]] bool moveTo(std::size_t position, TypesettingState& state);
public:
	/**
	 * @brief Registers a tab
	 *
	 * @param name Tab's name
	 * @param tab Tab definition
	 */
	void define_tab(const std::string& name, const Tab& tab);

	/**
	 * @brief Registers a tab list
	 *
	 * @param name List's name
	 * @param tabs Ordered tab names
	 * @throws UndefinedTabError if a tab in tabs is not defined
	 */
	void define_list(const std::string& name, const std::vector<std::string>& tabs);

	/**
	 * @brief Activates a tab list
	 *
	 * @param list List's name
	 * @param state State to save
	 * @throws UndefinedTabListError if list is not defined
	 * @throws TabNestingError if a list is already loaded
	 */
	void load(const std::string& list, TypesettingState& state);

	/**
	 * @brief Selects a tab in the active list
	 *
	 * @param name Tab's name
	 * @param state State to modify
	 * @returns true if the tab overflows the page's usable width
	 * @throws NoTabsLoadedError if no list is loaded
	 * @throws UndefinedTabError if name is not in the active list
	 */
	[[nodiscard]] bool select(const std::string& name, TypesettingState& state);

	/**
	 * @brief Selects next tab in the active list
	 *
	 * @param state State to modify
	 * @returns true if the tab overflows the page's usable width
	 * @throws TabNavigationOutOfRangeError if the current tab is the last one
	 */
	[[nodiscard]] bool next(TypesettingState& state);

	/**
	 * @brief Selects previous tab in the active list
	 *
	 * @param state State to modify
	 * @returns true if the tab overflows the page's usable width
	 * @throws TabNavigationOutOfRangeError if there is no previous tab
	 */
	[[nodiscard]] bool previous(TypesettingState& state);

	/**
	 * @brief Deactivates the current list, restoring the state saved by @ref load
	 *
	 * @param state State to restore
	 * @throws NoTabsLoadedError if no list is loaded
	 */
	void quit(TypesettingState& state);

	[[nodiscard]] bool active() const noexcept { return m_env.has_value(); }

	/**
	 * @brief Gets current position
	 *
	 * @returns Current position (starting at 1), empty if inactive or before the first selection
	 */
	[[nodiscard]] std::optional<std::size_t> cursor() const noexcept;

	/**
	 * @brief Gets current tab
	 *
	 * @returns Currently selected tab, nullptr if none
	 */
	[[nodiscard]] const Tab* current() const;

	/**
	 * @brief Gets current tab's name
	 *
	 * @returns Currently selected tab's name, empty if none
	 */
	[[nodiscard]] std::string current_name() const;

	/**
	 * @brief Gets the column of the current tab
	 *
	 * The column is not clipped to the page: a tab ending past the right
	 * margin keeps its full length.
	 *
	 * @returns Current column, empty if no tab is selected
	 */
	[[nodiscard]] std::optional<Column> column() const;
};

#endif // BURRO_TABS_HPP
