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

#ifndef BURRO_STATE_HPP
#define BURRO_STATE_HPP

#include <map>
#include <vector>
#include <string>
#include <variant>
#include <initializer_list>
#include "Units.hpp"

/**
 * @brief Keys of the typesetting state
 */
enum class Setting : std::uint8_t
{
	ALIGN,
	MARGIN_LEFT,
	MARGIN_RIGHT,
	MARGIN_TOP,
	MARGIN_BOTTOM,
	PAGE_WIDTH,
	PAGE_HEIGHT,
	PT_SIZE,
	LEADING,
	PAR_SPACE,
	PAR_INDENT,
	LETTER_SPACE,
	SPACE_WIDTH,
	FAMILY,
	STYLE,
};

[[nodiscard]] std::string_view getSettingName(Setting key) noexcept;

/**
 * @brief Cumulative typesetting configuration
 *
 * Every setting is a stack whose bottom element is the default value.
 * Setting a value pushes it, resetting pops it.
 */
class TypesettingState
{
public:
	/**
	 * @brief A setting's value
	 *
	 * `std::monostate` stands for a computed value (automatic leading or space width)
	 */
	using Value = std::variant<std::monostate, double, Alignment, FontStyle, std::string>;
	using Snapshot = std::map<Setting, std::vector<Value>>;

private:
	std::map<Setting, std::vector<Value>> m_stacks; ///< Stack for each setting

public:
	/**
	 * @brief Constructor
	 *
	 * @param family Default font family
	 */
	[[nodiscard]] explicit TypesettingState(const std::string& family = "courier");

	/**
	 * @brief Pushes a value
	 *
	 * @param key Setting to push to
	 * @param value Value to push
	 */
	void push(Setting key, Value value);

	/**
	 * @brief Pushes a value from it's textual representation
	 *
	 * `-` pops the setting instead, relative lengths are added to the current value
	 *
	 * @param key Setting to modify
	 * @param raw Textual value
	 * @throws ParseError if raw is not valid for key
	 * @throws StateUnderflowError when resetting a setting that only holds its default
	 */
	void set(Setting key, std::string_view raw);

	/**
	 * @brief Pops a value
	 *
	 * @param key Setting to pop
	 * @throws StateUnderflowError when the setting only holds its default
	 */
	void reset(Setting key);

	/**
	 * @brief Gets current value
	 *
	 * @param key Setting
	 * @returns Value on top of key's stack
	 */
	[[nodiscard]] const Value& get(Setting key) const;

	/**
	 * @brief Gets stack depth
	 *
	 * @param key Setting
	 * @returns Number of values on key's stack (at least 1)
	 */
	[[nodiscard]] std::size_t depth(Setting key) const;

	/**
	 * @brief Gets a length setting
	 *
	 * Automatic leading is resolved from the current point size,
	 * automatic space width yields a negative value
	 *
	 * @param key Setting
	 * @returns Length in points
	 */
	[[nodiscard]] double length(Setting key) const;

	[[nodiscard]] Alignment alignment() const;
	[[nodiscard]] FontStyle style() const;
	[[nodiscard]] const std::string& family() const;

	/**
	 * @brief Copies stacks
	 *
	 * @param keys Settings to copy
	 * @returns Copy of the stacks for every key
	 */
	[[nodiscard]] Snapshot snapshot(std::initializer_list<Setting> keys) const;

	/**
	 * @brief Replaces stacks with a snapshot
	 *
	 * @param snapshot Snapshot obtained from @ref snapshot
	 */
	void restore(const Snapshot& snapshot);

	/**
	 * @brief Checks that a textual value is acceptable for a setting
	 *
	 * @param key Setting
	 * @param raw Textual value
	 * @throws ParseError if raw can never be a value of key
	 */
	static void validate(Setting key, std::string_view raw);
};

#endif // BURRO_STATE_HPP
