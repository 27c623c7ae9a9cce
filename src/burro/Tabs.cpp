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

#include "Tabs.hpp"
#include "Util.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace std::literals;

void Tabs::define_tab(const std::string& name, const Tab& tab)
{
	if (m_tabs.find(name) != m_tabs.end()) [[unlikely]]
		throw ParseError(fmt::format("Tab `{}` is already defined", name));
	m_tabs.insert({name, tab});
}

void Tabs::define_list(const std::string& name, const std::vector<std::string>& tabs)
{
	if (m_lists.find(name) != m_lists.end()) [[unlikely]]
		throw ParseError(fmt::format("Tab list `{}` is already defined", name));
	for (const auto& tab : tabs)
	{
		if (m_tabs.find(tab) == m_tabs.end()) [[unlikely]]
			throw UndefinedTabError(fmt::format("Tab list `{}` refers to undefined tab `{}`", name, tab));
	}
	m_lists.insert({name, tabs});
}

void Tabs::load(const std::string& list, TypesettingState& state)
{
	if (m_env) [[unlikely]]
		throw TabNestingError(fmt::format("Cannot load tab list `{}`: tab list `{}` is already loaded", list, m_env->list));
	if (m_lists.find(list) == m_lists.end()) [[unlikely]]
		throw UndefinedTabListError(fmt::format("Tab list `{}` is not defined", list));

	m_env = Environment{
		.list = list,
		.cursor = std::nullopt,
		.saved = state.snapshot({Setting::ALIGN, Setting::MARGIN_LEFT, Setting::MARGIN_RIGHT, Setting::MARGIN_TOP, Setting::MARGIN_BOTTOM}),
		.origin = state.length(Setting::MARGIN_LEFT),
	};
}

[[nodiscard]] bool Tabs::moveTo(std::size_t position, TypesettingState& state)
{
	const auto& names = m_lists.at(m_env->list);
	const Tab& tab = m_tabs.at(names[position-1]);

	state.restore(m_env->saved);
	const double width = state.length(Setting::PAGE_WIDTH);
	const double usable = width - state.length(Setting::MARGIN_LEFT) - state.length(Setting::MARGIN_RIGHT);

	state.push(Setting::ALIGN, tab.direction);
	state.push(Setting::MARGIN_LEFT, m_env->origin + tab.indent);
	state.push(Setting::MARGIN_RIGHT, std::max(0.0, width - (m_env->origin + tab.indent + tab.length)));
	m_env->cursor = position;

	return tab.indent + tab.length > usable + 1e-6;
}

[[nodiscard]] bool Tabs::select(const std::string& name, TypesettingState& state)
{
	if (!m_env) [[unlikely]]
		throw NoTabsLoadedError(fmt::format("Cannot select tab `{}`: no tab list is loaded", name));

	const auto& names = m_lists.at(m_env->list);
	const auto it = std::find(names.cbegin(), names.cend(), name);
	if (it == names.cend()) [[unlikely]]
		throw UndefinedTabError(fmt::format("Tab `{}` is not part of tab list `{}`", name, m_env->list));

	return moveTo(std::distance(names.cbegin(), it) + 1, state);
}

[[nodiscard]] bool Tabs::next(TypesettingState& state)
{
	if (!m_env) [[unlikely]]
		throw NoTabsLoadedError("Cannot move to next tab: no tab list is loaded");

	const std::size_t size = m_lists.at(m_env->list).size();
	const std::size_t position = m_env->cursor.value_or(0) + 1;
	if (position > size) [[unlikely]]
		throw TabNavigationOutOfRangeError(fmt::format("Cannot move past the last tab of `{}` ({} tabs)", m_env->list, size));

	return moveTo(position, state);
}

[[nodiscard]] bool Tabs::previous(TypesettingState& state)
{
	if (!m_env) [[unlikely]]
		throw NoTabsLoadedError("Cannot move to previous tab: no tab list is loaded");

	if (m_env->cursor.value_or(0) <= 1) [[unlikely]]
		throw TabNavigationOutOfRangeError(fmt::format("Cannot move before the first tab of `{}`", m_env->list));

	return moveTo(*m_env->cursor - 1, state);
}

void Tabs::quit(TypesettingState& state)
{
	if (!m_env) [[unlikely]]
		throw NoTabsLoadedError("Cannot quit tabs: no tab list is loaded");

	state.restore(m_env->saved);
	m_env.reset();
}

[[nodiscard]] std::optional<std::size_t> Tabs::cursor() const noexcept
{
	if (!m_env)
		return {};
	return m_env->cursor;
}

[[nodiscard]] const Tab* Tabs::current() const
{
	if (!m_env || !m_env->cursor)
		return nullptr;
	return &m_tabs.at(m_lists.at(m_env->list)[*m_env->cursor-1]);
}

[[nodiscard]] std::string Tabs::current_name() const
{
	if (!m_env || !m_env->cursor)
		return ""s;
	return m_lists.at(m_env->list)[*m_env->cursor-1];
}

[[nodiscard]] std::optional<Column> Tabs::column() const
{
	const Tab* tab = current();
	if (!tab)
		return {};
	return Column{.left = m_env->origin + tab->indent, .width = tab->length};
}
