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

#include "Parser.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace std::literals;

//{{{ VariableTable
void VariableTable::collect(const File& f, const std::vector<Token>& tokens)
{
	for (const auto& tok : tokens)
	{
		if (tok.type != Token::VARIABLE_DEFINE)
			continue;

		if (auto it = m_vars.find(tok.text); it != m_vars.end()) [[unlikely]]
		{
			const auto [line, column] = getPos(f, it->second.pos);
			throw ParseError(f, fmt::format("Variable `{}` is already defined at {}:{}", tok.text, line+1, column+1), tok.pos, 8+tok.text.size());
		}

		const auto brk = std::find_if(tok.fragment.cbegin(), tok.fragment.cend(), [](const Token& t) { return t.type == Token::PARAGRAPH_BREAK; });
		if (brk != tok.fragment.cend()) [[unlikely]]
			throw ParseError(f, fmt::format("Definition of variable `{}` cannot contain a paragraph break", tok.text), brk->pos);

		m_vars.insert({tok.text, Variable{.tokens = tok.fragment, .pos = tok.pos}});
		collect(f, tok.fragment);
	}
}

[[nodiscard]] const std::vector<Token>& VariableTable::resolve(const File& f, const std::string& name, std::size_t pos, std::vector<std::string>& stack)
{
	if (auto it = m_resolved.find(name); it != m_resolved.end())
		return it->second;

	const auto var = m_vars.find(name);
	if (var == m_vars.end()) [[unlikely]]
		throw UndefinedVariableError(f, fmt::format("Variable `{}` is not defined", name), pos, name.size()+1);

	if (std::find(stack.cbegin(), stack.cend(), name) != stack.cend()) [[unlikely]]
	{
		std::string chain;
		for (const auto& s : stack)
			chain.append(s).append(" -> ");
		chain.append(name);
		throw ParseError(f, fmt::format("Variable `{}` is defined recursively ({})", name, chain), pos, name.size()+1);
	}

	stack.push_back(name);
	std::vector<Token> expanded = expand(f, var->second.tokens, stack);
	stack.pop_back();

	return m_resolved.insert({name, std::move(expanded)}).first->second;
}

[[nodiscard]] std::vector<Token> VariableTable::expand(const File& f, const std::vector<Token>& tokens, std::vector<std::string>& stack)
{
	std::vector<Token> out;
	out.reserve(tokens.size());
	for (const auto& tok : tokens)
	{
		if (tok.type == Token::VARIABLE_DEFINE)
			continue;
		else if (tok.type != Token::VARIABLE_REF)
		{
			out.push_back(tok);
			continue;
		}

		const auto& resolved = resolve(f, tok.text, tok.pos, stack);
		out.insert(out.end(), resolved.cbegin(), resolved.cend());
	}
	return out;
}

[[nodiscard]] std::vector<Token> VariableTable::expand(const File& f, const std::vector<Token>& tokens)
{
	std::vector<std::string> stack;
	return expand(f, tokens, stack);
}

void VariableTable::for_each(std::function<void(const std::string&, const std::vector<Token>&)> fn) const
{
	for (const auto& [name, var] : m_vars)
		fn(name, var.tokens);
}
//}}}

Parser::Parser(const File& f):
	m_file{f}, m_doc{f}
{
}

[[nodiscard]] const Token* Parser::peek() const noexcept
{
	if (m_pos >= m_tokens.size())
		return nullptr;
	return &m_tokens[m_pos];
}

[[nodiscard]] bool Parser::isDirective(std::size_t index) const noexcept
{
	if (index >= m_tokens.size() || m_tokens[index].type != Token::DOT)
		return false;

	const Syntax::CommandInfo* info = Syntax::getCommandInfo(m_tokens[index].text);
	if (info == nullptr)
		return false;
	if (info->kind == Syntax::CommandKind::SELECT_TAB) // `.tab{...}` is a definition
		return index+1 < m_tokens.size() && m_tokens[index+1].type == Token::OPEN_BRACE;
	return info->directive;
}

void Parser::skipBlanks()
{
	while (const Token* tok = peek())
	{
		if (tok->type == Token::COMMENT || (tok->type == Token::TEXT && trim(tok->text).empty()))
			++m_pos;
		else
			break;
	}
}

void Parser::addText(Syntax::Fragment& frag, const std::string& text, std::size_t pos)
{
	if (!frag.empty())
	{
		if (auto* last = std::get_if<Syntax::Text>(&m_doc.node(frag.back())); last != nullptr)
		{
			last->content.append(text);
			return;
		}
	}
	frag.push_back(m_doc.emplace(Syntax::Text{.content = text, .pos = pos}));
}

void Parser::parseBlock()
{
	// Leading directives
	while (true)
	{
		skipBlanks();
		if (!isDirective(m_pos))
			break;
		m_doc.push_block(Syntax::CommandBlock{parseCommand()});
	}

	const std::size_t start = peek() ? peek()->pos : m_file.content.size();
	std::vector<Syntax::NodeId> trailing;
	Syntax::Fragment content = parseFragment(Mode::BLOCK, start, &trailing);

	const bool empty = std::all_of(content.cbegin(), content.cend(), [&](Syntax::NodeId id)
	{
		const auto* text = std::get_if<Syntax::Text>(&m_doc.node(id));
		return text != nullptr && trim(text->content).empty();
	});
	if (!empty)
		m_doc.push_block(Syntax::Paragraph{.content = std::move(content), .pos = start});

	for (const auto id : trailing)
		m_doc.push_block(Syntax::CommandBlock{id});
}

[[nodiscard]] Syntax::Fragment Parser::parseFragment(Mode mode, std::size_t open, std::vector<Syntax::NodeId>* trailing)
{
	auto misplaced = [&]
	{
		const auto& cmd = std::get<Syntax::Command>(m_doc.node(trailing->front()));
		return ParseError(m_file, fmt::format("`.{}` must be placed at the start or at the end of a paragraph", cmd.name), cmd.pos, cmd.name.size()+1);
	};

	Syntax::Fragment frag;
	while (const Token* tok = peek())
	{
		switch (tok->type)
		{
			case Token::TEXT:
			case Token::ESCAPE:
				if (trailing && !trailing->empty() && !trim(tok->text).empty()) [[unlikely]]
					throw misplaced();
				addText(frag, tok->text, tok->pos);
				++m_pos;
				break;
			case Token::DOT:
				if (isDirective(m_pos))
				{
					if (mode != Mode::BLOCK) [[unlikely]]
						throw ParseError(m_file, fmt::format("`.{}` cannot be used inside an argument", tok->text), tok->pos, tok->text.size()+1);
					trailing->push_back(parseCommand());
					break;
				}
				if (trailing && !trailing->empty()) [[unlikely]]
					throw misplaced();
				frag.push_back(parseCommand());
				break;
			case Token::CLOSE_BRACKET:
				if (mode == Mode::BRACKET)
				{
					++m_pos;
					return frag;
				}
				throw ParseError(m_file, "Unmatched `]`", tok->pos);
			case Token::PIPE:
				if (mode == Mode::INLINE)
				{
					++m_pos;
					return frag;
				}
				throw ParseError(m_file, "Unexpected `|` outside of an inline argument", tok->pos);
			case Token::PARAGRAPH_BREAK:
				if (mode == Mode::BRACKET) [[unlikely]]
					throw ParseError(m_file, "Unterminated `[`, reached the end of the paragraph", open);
				return frag;
			case Token::OPEN_BRACKET:
				throw ParseError(m_file, "Unexpected `[`, arguments must directly follow a command", tok->pos);
			case Token::OPEN_BRACE:
				throw ParseError(m_file, "Unexpected `{`, brace blocks must directly follow `.tab` or `.tab_list`", tok->pos);
			case Token::CLOSE_BRACE:
				throw ParseError(m_file, "Unmatched `}`", tok->pos);
			default: // Comments, expanded variables
				++m_pos;
				break;
		}
	}

	if (mode == Mode::BRACKET) [[unlikely]]
		throw ParseError(m_file, "Unterminated `[`, reached the end of the input", open);
	return frag;
}

[[nodiscard]] Syntax::Fragment Parser::parseArgument(const Token& dot)
{
	if (const Token* tok = peek(); tok && tok->type == Token::OPEN_BRACKET)
	{
		const std::size_t open = tok->pos;
		++m_pos;
		return parseFragment(Mode::BRACKET, open, nullptr);
	}

	// Inline argument
	while (m_pos < m_tokens.size() && m_tokens[m_pos].type == Token::TEXT)
	{
		Token& tok = m_tokens[m_pos];
		const std::size_t blanks = std::min(tok.text.find_first_not_of(" \t\r"), tok.text.size());
		tok.text.erase(0, blanks);
		tok.pos += blanks;
		if (!tok.text.empty())
			break;
		++m_pos;
	}

	const Token* tok = peek();
	if (tok == nullptr || tok->type == Token::PARAGRAPH_BREAK || tok->type == Token::PIPE) [[unlikely]]
		throw ParseError(m_file, fmt::format("`.{}` expects an argument", dot.text), dot.pos, dot.text.size()+1);
	return parseFragment(Mode::INLINE, dot.pos, nullptr);
}

[[nodiscard]] std::string Parser::parseValue(const Token& dot, const Syntax::Fragment& arg)
{
	const auto text = m_doc.plain_text(arg);
	if (!text) [[unlikely]]
		throw ParseError(m_file, fmt::format("`.{}` expects a plain value, not markup", dot.text), dot.pos, dot.text.size()+1);
	const std::string_view value = trim(*text);
	if (value.empty()) [[unlikely]]
		throw ParseError(m_file, fmt::format("`.{}` expects a value", dot.text), dot.pos, dot.text.size()+1);
	return std::string{value};
}

[[nodiscard]] std::vector<Parser::Entry> Parser::parseBraceBlock(const Token& dot, Syntax::CommandKind kind)
{
	static constexpr auto tab_keys = make_array<std::string_view>("indent", "direction", "length", "quad");

	const std::size_t open = peek()->pos;
	++m_pos;

	std::vector<Entry> entries;
	while (true)
	{
		const Token* tok = peek();
		if (tok == nullptr || tok->type == Token::PARAGRAPH_BREAK) [[unlikely]]
			throw ParseError(m_file, fmt::format("Unterminated `{{` for `.{}`", dot.text), open);

		switch (tok->type)
		{
			case Token::CLOSE_BRACE:
				++m_pos;
				return entries;
			case Token::COMMENT:
				++m_pos;
				break;
			case Token::TEXT:
				if (!trim(tok->text).empty()) [[unlikely]]
					throw ParseError(m_file, fmt::format("Unexpected text in `.{}` block, expected `.key[value]`", dot.text), tok->pos);
				++m_pos;
				break;
			case Token::DOT:
			{
				const Token key = *tok;
				++m_pos;
				if (kind == Syntax::CommandKind::TAB)
				{
					if (std::find(tab_keys.cbegin(), tab_keys.cend(), key.text) == tab_keys.cend()) [[unlikely]]
						throw ParseError(m_file, fmt::format("Unknown key `.{}` in `.tab` block, expected one of `.indent`, `.direction`, `.length` or `.quad`", key.text), key.pos, key.text.size()+1);
					if (std::find_if(entries.cbegin(), entries.cend(), [&](const Entry& e) { return e.key == key.text; }) != entries.cend()) [[unlikely]]
						throw ParseError(m_file, fmt::format("Duplicate key `.{}` in `.tab` block", key.text), key.pos, key.text.size()+1);
				}
				else if (key.text != "tab"sv) [[unlikely]]
					throw ParseError(m_file, fmt::format("Unknown key `.{}` in `.tab_list` block, expected `.tab`", key.text), key.pos, key.text.size()+1);

				const std::size_t argpos = peek() ? peek()->pos : key.pos;
				const Syntax::Fragment arg = parseArgument(key);
				entries.push_back(Entry{.key = key.text, .value = parseValue(key, arg), .pos = argpos});
				break;
			}
			default:
				throw ParseError(m_file, fmt::format("Unexpected {} in `.{}` block", getTokenName(tok->type), dot.text), tok->pos);
		}
	}
}

[[nodiscard]] Syntax::Payload Parser::makePayload(const Token& dot, Syntax::Command& cmd, const std::vector<Entry>& entries, std::size_t argpos)
{
	using namespace Syntax;
	auto located = [&]<class F>(std::size_t pos, F&& f)
	{
		try
		{
			return f();
		}
		catch (SourceError& e)
		{
			e.locate(m_file, pos);
			throw;
		}
	};

	switch (cmd.kind)
	{
		case CommandKind::BOLD:
			return Style{.style = FontStyle::BOLD};
		case CommandKind::ITALIC:
			return Style{.style = FontStyle::ITALIC};
		case CommandKind::QUOTE:
			return Quote{};
		case CommandKind::PAGE_BREAK:
			return PageBreak{};
		case CommandKind::QUIT_TABS:
			return QuitTabs{};
		case CommandKind::NEXT_TAB:
			return NextTab{};
		case CommandKind::PREVIOUS_TAB:
			return PreviousTab{};
		case CommandKind::LOAD_TABS:
			return LoadTabs{.list = parseValue(dot, *cmd.argument)};
		case CommandKind::SELECT_TAB:
			return SelectTab{.name = parseValue(dot, *cmd.argument)};
		case CommandKind::TAB:
		{
			++m_tab_count;
			const std::string name = cmd.argument ? parseValue(dot, *cmd.argument) : fmt::format("{}", m_tab_count);
			if (!m_tab_names.insert(name).second) [[unlikely]]
				throw ParseError(m_file, fmt::format("Tab `{}` is already defined", name), dot.pos, dot.text.size()+1);

			Tab tab;
			bool has_length = false;
			for (const auto& entry : entries)
			{
				located(entry.pos, [&]
				{
					if (entry.key == "direction"sv)
						tab.direction = parseAlignment(entry.value);
					else if (entry.key == "quad"sv)
						tab.quad = parseBool(entry.value);
					else
					{
						const Length len = parseLength(entry.value);
						if (len.relative || len.value < 0.0) [[unlikely]]
							throw ParseError(fmt::format("Tab `.{}` must be a non negative absolute length", entry.key));
						if (entry.key == "indent"sv)
							tab.indent = len.value;
						else
						{
							tab.length = len.value;
							has_length = true;
						}
					}
				});
			}
			if (!has_length) [[unlikely]]
				throw ParseError(m_file, fmt::format("Tab `{}` requires a `.length`", name), dot.pos, dot.text.size()+1);

			return TabDefinition{.name = name, .tab = tab};
		}
		case CommandKind::TAB_LIST:
		{
			if (!cmd.argument) [[unlikely]]
				throw ParseError(m_file, "`.tab_list` requires a name, e.g. `.tab_list{...}[name]`", dot.pos, dot.text.size()+1);
			const std::string name = parseValue(dot, *cmd.argument);
			if (!m_list_names.insert(name).second) [[unlikely]]
				throw ParseError(m_file, fmt::format("Tab list `{}` is already defined", name), dot.pos, dot.text.size()+1);

			TabListDefinition list{.name = name, .tabs = {}};
			for (const auto& entry : entries)
				list.tabs.push_back(entry.value);
			return list;
		}
		default: // Settings
		{
			SettingChange change{.keys = getCommandSettings(cmd.kind), .value = parseValue(dot, *cmd.argument)};
			located(argpos, [&]
			{
				for (const Setting key : change.keys)
					TypesettingState::validate(key, *change.value);
			});
			if (*change.value == "-"sv)
				change.value.reset();
			return change;
		}
	}
}

[[nodiscard]] Syntax::NodeId Parser::parseCommand()
{
	const Token dot = m_tokens[m_pos++];
	const Syntax::CommandInfo* info = Syntax::getCommandInfo(dot.text);
	if (info == nullptr) [[unlikely]]
		throw ParseError(m_file, fmt::format("Unknown command `.{}`", dot.text), dot.pos, dot.text.size()+1);

	const Token* next = peek();
	const bool brace = next != nullptr && next->type == Token::OPEN_BRACE;
	if (brace && info->kind == Syntax::CommandKind::SELECT_TAB)
		info = &Syntax::getCommandInfo(Syntax::CommandKind::TAB);
	if (brace && info->shape != Syntax::Shape::BLOCK) [[unlikely]]
		throw ParseError(m_file, fmt::format("`.{}` does not accept a brace block", dot.text), next->pos);

	Syntax::Command cmd{
		.name = dot.text,
		.kind = info->kind,
		.sub_settings = {},
		.argument = {},
		.payload = Syntax::PageBreak{},
		.pos = dot.pos,
	};

	std::vector<Entry> entries;
	const std::size_t argpos = next ? next->pos : dot.pos;
	switch (info->shape)
	{
		case Syntax::Shape::BARE:
			if (next != nullptr && next->type == Token::OPEN_BRACKET) [[unlikely]]
				throw ParseError(m_file, fmt::format("`.{}` does not take an argument", dot.text), next->pos);
			break;
		case Syntax::Shape::VALUE:
		case Syntax::Shape::CONTENT:
			cmd.argument = parseArgument(dot);
			break;
		case Syntax::Shape::BLOCK:
		{
			if (!brace) [[unlikely]]
				throw ParseError(m_file, fmt::format("`.{}` requires a brace block", dot.text), dot.pos, dot.text.size()+1);
			entries = parseBraceBlock(dot, info->kind);

			std::vector<std::pair<std::string, std::string>> settings;
			for (const auto& entry : entries)
				settings.push_back({entry.key, entry.value});
			cmd.sub_settings = std::move(settings);

			if (const Token* tok = peek(); tok && tok->type == Token::OPEN_BRACKET)
			{
				const std::size_t open = tok->pos;
				++m_pos;
				cmd.argument = parseFragment(Mode::BRACKET, open, nullptr);
			}
			break;
		}
	}

	cmd.payload = makePayload(dot, cmd, entries, argpos);
	return m_doc.emplace(std::move(cmd));
}

[[nodiscard]] std::pair<Document, VariableTable> Parser::parse(const std::vector<Token>& tokens)
{
	m_vars.collect(m_file, tokens);
	m_tokens = m_vars.expand(m_file, tokens);
	m_pos = 0;

	while (const Token* tok = peek())
	{
		if (tok->type == Token::PARAGRAPH_BREAK)
		{
			++m_pos;
			continue;
		}
		parseBlock();
	}

	return {std::move(m_doc), std::move(m_vars)};
}
