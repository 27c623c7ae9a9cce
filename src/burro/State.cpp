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

#include "State.hpp"
#include "Util.hpp"

#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] std::string_view getSettingName(Setting key) noexcept
{
	static constexpr auto names = make_array<std::string_view>(
		"align",
		"margin_left",
		"margin_right",
		"margin_top",
		"margin_bottom",
		"page_width",
		"page_height",
		"pt_size",
		"leading",
		"par_space",
		"par_indent",
		"letter_space",
		"space_width",
		"family",
		"style"
	);

	return names[static_cast<std::size_t>(key)];
}

/**
 * @brief Kind of value held by a setting
 */
enum class ValueKind
{
	ALIGNMENT,
	LENGTH, ///< Non negative length
	SIZE, ///< Strictly positive length
	SIGNED_LENGTH, ///< Any length
	AUTO_LENGTH, ///< Length or automatic
	NAME,
	STYLE,
};

[[nodiscard]] static ValueKind getValueKind(Setting key) noexcept
{
	switch (key)
	{
		case Setting::ALIGN:
			return ValueKind::ALIGNMENT;
		case Setting::PAGE_WIDTH:
		case Setting::PAGE_HEIGHT:
		case Setting::PT_SIZE:
			return ValueKind::SIZE;
		case Setting::LETTER_SPACE:
			return ValueKind::SIGNED_LENGTH;
		case Setting::LEADING:
		case Setting::SPACE_WIDTH:
			return ValueKind::AUTO_LENGTH;
		case Setting::FAMILY:
			return ValueKind::NAME;
		case Setting::STYLE:
			return ValueKind::STYLE;
		default:
			return ValueKind::LENGTH;
	}
}

TypesettingState::TypesettingState(const std::string& family)
{
	m_stacks[Setting::ALIGN] = {Alignment::LEFT};
	m_stacks[Setting::MARGIN_LEFT] = {72.0};
	m_stacks[Setting::MARGIN_RIGHT] = {72.0};
	m_stacks[Setting::MARGIN_TOP] = {72.0};
	m_stacks[Setting::MARGIN_BOTTOM] = {72.0};
	m_stacks[Setting::PAGE_WIDTH] = {612.0};
	m_stacks[Setting::PAGE_HEIGHT] = {792.0};
	m_stacks[Setting::PT_SIZE] = {12.0};
	m_stacks[Setting::LEADING] = {std::monostate{}};
	m_stacks[Setting::PAR_SPACE] = {0.0};
	m_stacks[Setting::PAR_INDENT] = {0.0};
	m_stacks[Setting::LETTER_SPACE] = {0.0};
	m_stacks[Setting::SPACE_WIDTH] = {std::monostate{}};
	m_stacks[Setting::FAMILY] = {family};
	m_stacks[Setting::STYLE] = {FontStyle::ROMAN};
}

void TypesettingState::push(Setting key, Value value)
{
	m_stacks.at(key).push_back(std::move(value));
}

void TypesettingState::set(Setting key, std::string_view raw)
{
	raw = trim(raw);
	if (raw == "-"sv)
	{
		reset(key);
		return;
	}

	validate(key, raw);
	switch (getValueKind(key))
	{
		case ValueKind::ALIGNMENT:
			push(key, parseAlignment(raw));
			break;
		case ValueKind::STYLE:
			push(key, parseFontStyle(raw));
			break;
		case ValueKind::NAME:
			push(key, std::string{raw});
			break;
		case ValueKind::AUTO_LENGTH:
		{
			const Length len = parseLength(raw);
			if (len.relative && std::holds_alternative<std::monostate>(get(key)) && key != Setting::LEADING) [[unlikely]]
				throw ParseError(fmt::format("Relative value `{}` cannot be applied to automatic `{}`", raw, getSettingName(key)));
			const double value = len.resolve(len.relative ? length(key) : 0.0);
			if (value < 0.0) [[unlikely]]
				throw ParseError(fmt::format("Value `{}` makes `{}` negative ({}pt)", raw, getSettingName(key), value));
			push(key, value);
			break;
		}
		default:
		{
			const Length len = parseLength(raw);
			const double value = len.resolve(length(key));
			const ValueKind kind = getValueKind(key);
			if (kind == ValueKind::SIZE && value <= 0.0) [[unlikely]]
				throw ParseError(fmt::format("Value `{}` makes `{}` non positive ({}pt)", raw, getSettingName(key), value));
			else if (kind == ValueKind::LENGTH && value < 0.0) [[unlikely]]
				throw ParseError(fmt::format("Value `{}` makes `{}` negative ({}pt)", raw, getSettingName(key), value));
			push(key, value);
			break;
		}
	}
}

void TypesettingState::reset(Setting key)
{
	auto& stack = m_stacks.at(key);
	if (stack.size() <= 1) [[unlikely]]
		throw StateUnderflowError(fmt::format("Cannot reset `{}`: it holds no value besides its default", getSettingName(key)));
	stack.pop_back();
}

[[nodiscard]] const TypesettingState::Value& TypesettingState::get(Setting key) const
{
	return m_stacks.at(key).back();
}

[[nodiscard]] std::size_t TypesettingState::depth(Setting key) const
{
	return m_stacks.at(key).size();
}

[[nodiscard]] double TypesettingState::length(Setting key) const
{
	const Value& value = get(key);
	if (const double* d = std::get_if<double>(&value); d != nullptr) [[likely]]
		return *d;

	if (key == Setting::LEADING)
		return length(Setting::PT_SIZE) * 1.2;
	else if (key == Setting::SPACE_WIDTH)
		return -1.0;
	throw Error(fmt::format("Setting `{}` does not hold a length", getSettingName(key)));
}

[[nodiscard]] Alignment TypesettingState::alignment() const
{
	return std::get<Alignment>(get(Setting::ALIGN));
}

[[nodiscard]] FontStyle TypesettingState::style() const
{
	return std::get<FontStyle>(get(Setting::STYLE));
}

[[nodiscard]] const std::string& TypesettingState::family() const
{
	return std::get<std::string>(get(Setting::FAMILY));
}

[[nodiscard]] TypesettingState::Snapshot TypesettingState::snapshot(std::initializer_list<Setting> keys) const
{
	Snapshot s;
	for (const Setting key : keys)
		s[key] = m_stacks.at(key);
	return s;
}

void TypesettingState::restore(const Snapshot& snapshot)
{
	for (const auto& [key, stack] : snapshot)
		m_stacks.at(key) = stack;
}

void TypesettingState::validate(Setting key, std::string_view raw)
{
	raw = trim(raw);
	if (raw == "-"sv)
		return;

	switch (getValueKind(key))
	{
		case ValueKind::ALIGNMENT:
			static_cast<void>(parseAlignment(raw));
			break;
		case ValueKind::STYLE:
			static_cast<void>(parseFontStyle(raw));
			break;
		case ValueKind::NAME:
			if (raw.empty()) [[unlikely]]
				throw ParseError(fmt::format("Setting `{}` requires a name", getSettingName(key)));
			break;
		default:
		{
			const Length len = parseLength(raw);
			if (!len.relative && len.value <= 0.0 && getValueKind(key) == ValueKind::SIZE) [[unlikely]]
				throw ParseError(fmt::format("Setting `{}` must be positive", getSettingName(key)));
			break;
		}
	}
}
