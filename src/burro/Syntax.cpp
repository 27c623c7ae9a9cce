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

#include "Syntax.hpp"
#include <utility>
#include <algorithm>
#include <fmt/format.h>

using namespace std::literals;

using Syntax::CommandInfo;
using Syntax::CommandKind;
using Syntax::Shape;

static constexpr auto commands = make_array<CommandInfo>( // {{{
	CommandInfo{"align"sv,         CommandKind::ALIGN,         Shape::VALUE,   true},
	CommandInfo{"margins"sv,       CommandKind::MARGINS,       Shape::VALUE,   true},
	CommandInfo{"margin_left"sv,   CommandKind::MARGIN_LEFT,   Shape::VALUE,   true},
	CommandInfo{"margin_right"sv,  CommandKind::MARGIN_RIGHT,  Shape::VALUE,   true},
	CommandInfo{"margin_top"sv,    CommandKind::MARGIN_TOP,    Shape::VALUE,   true},
	CommandInfo{"margin_bottom"sv, CommandKind::MARGIN_BOTTOM, Shape::VALUE,   true},
	CommandInfo{"page_width"sv,    CommandKind::PAGE_WIDTH,    Shape::VALUE,   true},
	CommandInfo{"page_height"sv,   CommandKind::PAGE_HEIGHT,   Shape::VALUE,   true},
	CommandInfo{"leading"sv,       CommandKind::LEADING,       Shape::VALUE,   true},
	CommandInfo{"par_space"sv,     CommandKind::PAR_SPACE,     Shape::VALUE,   true},
	CommandInfo{"par_indent"sv,    CommandKind::PAR_INDENT,    Shape::VALUE,   true},
	CommandInfo{"page_break"sv,    CommandKind::PAGE_BREAK,    Shape::BARE,    true},
	CommandInfo{"tab"sv,           CommandKind::TAB,           Shape::BLOCK,   true},
	CommandInfo{"tab_list"sv,      CommandKind::TAB_LIST,      Shape::BLOCK,   true},
	CommandInfo{"load_tabs"sv,     CommandKind::LOAD_TABS,     Shape::VALUE,   true},
	CommandInfo{"quit_tabs"sv,     CommandKind::QUIT_TABS,     Shape::BARE,    true},
	CommandInfo{"pt_size"sv,       CommandKind::PT_SIZE,       Shape::VALUE,   false},
	CommandInfo{"family"sv,        CommandKind::FAMILY,        Shape::VALUE,   false},
	CommandInfo{"letter_space"sv,  CommandKind::LETTER_SPACE,  Shape::VALUE,   false},
	CommandInfo{"space_width"sv,   CommandKind::SPACE_WIDTH,   Shape::VALUE,   false},
	CommandInfo{"bold"sv,          CommandKind::BOLD,          Shape::CONTENT, false},
	CommandInfo{"italic"sv,        CommandKind::ITALIC,        Shape::CONTENT, false},
	CommandInfo{"quote"sv,         CommandKind::QUOTE,         Shape::CONTENT, false},
	CommandInfo{"tab"sv,           CommandKind::SELECT_TAB,    Shape::VALUE,   false},
	CommandInfo{"next_tab"sv,      CommandKind::NEXT_TAB,      Shape::BARE,    false},
	CommandInfo{"previous_tab"sv,  CommandKind::PREVIOUS_TAB,  Shape::BARE,    false}
); // }}}

[[nodiscard]] const CommandInfo* Syntax::getCommandInfo(std::string_view name) noexcept
{
	// `tab` is resolved to SELECT_TAB, the parser turns it into TAB when followed by a brace block
	const auto it = std::find_if(commands.crbegin(), commands.crend(), [&](const CommandInfo& info) { return info.name == name; });
	if (it == commands.crend())
		return nullptr;
	return &*it;
}

[[nodiscard]] const CommandInfo& Syntax::getCommandInfo(CommandKind kind) noexcept
{
	return commands[static_cast<std::size_t>(kind)];
}

[[nodiscard]] std::vector<Setting> Syntax::getCommandSettings(CommandKind kind)
{
	switch (kind)
	{
		case CommandKind::ALIGN: return {Setting::ALIGN};
		case CommandKind::MARGINS: return {Setting::MARGIN_LEFT, Setting::MARGIN_RIGHT, Setting::MARGIN_TOP, Setting::MARGIN_BOTTOM};
		case CommandKind::MARGIN_LEFT: return {Setting::MARGIN_LEFT};
		case CommandKind::MARGIN_RIGHT: return {Setting::MARGIN_RIGHT};
		case CommandKind::MARGIN_TOP: return {Setting::MARGIN_TOP};
		case CommandKind::MARGIN_BOTTOM: return {Setting::MARGIN_BOTTOM};
		case CommandKind::PAGE_WIDTH: return {Setting::PAGE_WIDTH};
		case CommandKind::PAGE_HEIGHT: return {Setting::PAGE_HEIGHT};
		case CommandKind::LEADING: return {Setting::LEADING};
		case CommandKind::PAR_SPACE: return {Setting::PAR_SPACE};
		case CommandKind::PAR_INDENT: return {Setting::PAR_INDENT};
		case CommandKind::PT_SIZE: return {Setting::PT_SIZE};
		case CommandKind::FAMILY: return {Setting::FAMILY};
		case CommandKind::LETTER_SPACE: return {Setting::LETTER_SPACE};
		case CommandKind::SPACE_WIDTH: return {Setting::SPACE_WIDTH};
		default: return {};
	}
}

[[nodiscard]] Syntax::NodeId Document::emplace(Syntax::Node&& node)
{
	m_nodes.push_back(std::move(node));
	return m_nodes.size()-1;
}

[[nodiscard]] std::optional<std::string> Document::plain_text(const Syntax::Fragment& frag) const
{
	std::string s;
	for (const auto id : frag)
	{
		const auto* text = std::get_if<Syntax::Text>(&node(id));
		if (text == nullptr)
			return {};
		s.append(text->content);
	}
	return s;
}

void Document::for_each_node(const Syntax::Fragment& frag, std::function<void(const Syntax::Node&, std::size_t)> fn) const
{
	std::function<void(const Syntax::Fragment&, std::size_t)> walk = [&](const Syntax::Fragment& frag, std::size_t depth)
	{
		for (const auto id : frag)
		{
			const Syntax::Node& n = node(id);
			fn(n, depth);
			if (const auto* cmd = std::get_if<Syntax::Command>(&n); cmd != nullptr && cmd->argument)
				walk(*cmd->argument, depth+1);
		}
	};
	walk(frag, 0);
}

[[nodiscard]] std::string Document::dump() const
{
	std::string s;
	auto format = [&](const Syntax::Node& n, std::size_t depth)
	{
		std::visit([&]<class T>(const T& node)
		{
			if constexpr (std::is_same_v<T, Syntax::Text>)
				s.append(fmt::format("{: <{}}[Text]: \"{}\"\n", "", 2*depth, node.content));
			else
			{
				s.append(fmt::format("{: <{}}[Command]: .{}", "", 2*depth, node.name));
				if (node.sub_settings)
				{
					s.append(" {");
					for (const auto& [key, value] : *node.sub_settings)
						s.append(fmt::format(" {}={}", key, value));
					s.append(" }");
				}
				s.push_back('\n');
			}
		}, n);
	};

	for (const auto& block : m_blocks)
	{
		if (const auto* par = std::get_if<Syntax::Paragraph>(&block); par != nullptr)
		{
			s.append("[Paragraph]\n");
			for_each_node(par->content, [&](const Syntax::Node& n, std::size_t depth) { format(n, depth+1); });
		}
		else
			format(node(std::get<Syntax::CommandBlock>(block).command), 0);
	}

	return s;
}
