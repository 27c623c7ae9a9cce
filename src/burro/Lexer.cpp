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

#include "Lexer.hpp"

#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] std::string_view getTokenName(Token::Type type) noexcept
{
	static constexpr auto names = make_array<std::string_view>(
		"Text",
		"Dot",
		"Open Bracket",
		"Close Bracket",
		"Open Brace",
		"Close Brace",
		"Pipe",
		"Paragraph Break",
		"Comment",
		"Escape",
		"Variable Define",
		"Variable Ref"
	);

	return names[type];
}

Lexer::Lexer(const File& f, LexerOptions opts):
	m_file{f}, m_opts{opts}, m_begin{0}, m_end{f.content.size()}, m_define{false}
{
	reset();
}

Lexer::Lexer(const File& f, LexerOptions opts, std::size_t begin, std::size_t end):
	m_file{f}, m_opts{opts}, m_begin{begin}, m_end{end}, m_define{true}
{
	reset();
}

void Lexer::reset()
{
	m_pos = m_begin;
	m_after_command = false;
	m_pending.clear();

	// Leading blank lines and comments are not significant
	if (!m_define)
		static_cast<void>(skipLines());
}

[[nodiscard]] bool Lexer::isSpecial(char c) const noexcept
{
	static constexpr auto specials = ".[]{}|~\\"sv;
	if (m_define && (c == '(' || c == ')'))
		return true;
	return specials.find(c) != std::string_view::npos;
}

std::size_t Lexer::skipLines()
{
	std::size_t blank = 0;
	while (m_pos < m_end)
	{
		std::size_t eol = m_file.content.find('\n', m_pos);
		if (eol == std::string_view::npos || eol > m_end)
			eol = m_end;

		const std::string_view line = m_file.content.substr(m_pos, eol-m_pos);
		const std::string_view content = trim(line);
		if (content.empty())
			++blank;
		else if (content.front() == ';')
		{
			if (m_opts.keep_comments)
				m_pending.push_back(Token{
					.type = Token::COMMENT,
					.text = std::string{content.substr(1)},
					.pos = m_pos + line.find(';'),
					.fragment = {},
				});
		}
		else
			break;

		m_pos = std::min(eol+1, m_end);
	}

	return blank;
}

[[nodiscard]] bool Lexer::isCommand() const noexcept
{
	const std::string_view content = m_file.content;
	if (m_pos+1 >= m_end || !isIdentifierStart(content[m_pos+1]))
		return false;
	if (m_pos == m_begin || m_after_command)
		return true;

	static constexpr auto before = " \t\r\n[]{}|"sv;
	return before.find(content[m_pos-1]) != std::string_view::npos;
}

[[nodiscard]] Token Lexer::lexDefine()
{
	static constexpr auto keyword = "#define("sv;
	const std::string_view content = m_file.content;
	const std::size_t start = m_pos;

	std::size_t i = m_pos + keyword.size();
	const std::size_t name_start = i;
	while (i < m_end && isIdentifier(content[i]))
		++i;
	if (i == name_start || !isIdentifierStart(content[name_start])) [[unlikely]]
		throw LexError(m_file, "Invalid variable name in definition", start, keyword.size());
	const std::string name{content.substr(name_start, i-name_start)};

	if (i >= m_end || content[i] != ')') [[unlikely]]
		throw LexError(m_file, fmt::format("Expected `)` after variable name `{}`", name), i);
	++i;
	if (i >= m_end || content[i] != '(') [[unlikely]]
		throw LexError(m_file, fmt::format("Expected `(` after `#define({})`", name), i);
	++i;

	const std::size_t body = i;
	std::size_t depth = 1;
	while (i < m_end)
	{
		if (content[i] == '\\' && i+1 < m_end)
		{
			i += 2;
			continue;
		}
		else if (content[i] == '(')
			++depth;
		else if (content[i] == ')' && --depth == 0)
			break;
		++i;
	}
	if (depth != 0) [[unlikely]]
		throw LexError(m_file, fmt::format("Unterminated definition of variable `{}`", name), start, keyword.size());

	Lexer sub(m_file, m_opts, body, i);
	m_pos = i+1;
	m_after_command = false;

	return Token{
		.type = Token::VARIABLE_DEFINE,
		.text = name,
		.pos = start,
		.fragment = sub.lex(),
	};
}

[[nodiscard]] std::optional<Token> Lexer::next()
{
	if (!m_pending.empty())
	{
		Token tok = std::move(m_pending.front());
		m_pending.pop_front();
		return tok;
	}

	const std::string_view content = m_file.content;
	std::string text;
	std::size_t text_pos = m_pos;
	auto append = [&](char c, std::size_t pos)
	{
		if (text.empty())
			text_pos = pos;
		text.push_back(c);
	};
	auto textToken = [&]
	{
		return Token{.type = Token::TEXT, .text = std::move(text), .pos = text_pos, .fragment = {}};
	};
	auto single = [&](Token::Type type)
	{
		Token tok{.type = type, .text = {}, .pos = m_pos, .fragment = {}};
		++m_pos;
		m_after_command = false;
		return tok;
	};
	auto identifier = [&](std::size_t start)
	{
		std::size_t end = start;
		while (end < m_end && isIdentifier(content[end]))
			++end;
		return std::string{content.substr(start, end-start)};
	};

	while (m_pos < m_end)
	{
		const char c = content[m_pos];
		switch (c)
		{
			case '\r':
				if (m_pos+1 < m_end && content[m_pos+1] == '\n')
				{
					++m_pos;
					continue;
				}
				append(c, m_pos++);
				break;
			case '\n':
			{
				const std::size_t newline = m_pos++;
				const std::size_t blank = skipLines();
				if (m_pos >= m_end) // Trailing newlines
					break;
				m_after_command = false;
				if (blank != 0)
				{
					m_pending.push_back(Token{.type = Token::PARAGRAPH_BREAK, .text = {}, .pos = newline, .fragment = {}});
					if (!text.empty())
						return textToken();
					return next();
				}

				append(' ', newline);
				if (!m_pending.empty()) // Comments
					return textToken();
				break;
			}
			case '\\':
			{
				if (m_pos+1 >= m_end) [[unlikely]]
					throw LexError(m_file, "Truncated escape sequence", m_pos);
				if (!isSpecial(content[m_pos+1]))
				{
					append(c, m_pos++);
					m_after_command = false;
					break;
				}

				if (!text.empty())
					return textToken();
				Token tok{.type = Token::ESCAPE, .text = std::string(1, content[m_pos+1]), .pos = m_pos, .fragment = {}};
				m_pos += 2;
				m_after_command = false;
				return tok;
			}
			case '.':
			{
				if (!isCommand())
				{
					append(c, m_pos++);
					m_after_command = false;
					break;
				}

				if (!text.empty())
					return textToken();
				Token tok{.type = Token::DOT, .text = identifier(m_pos+1), .pos = m_pos, .fragment = {}};
				m_pos += 1 + tok.text.size();
				m_after_command = true;
				return tok;
			}
			case '[':
				if (!text.empty())
					return textToken();
				return single(Token::OPEN_BRACKET);
			case ']':
				if (!text.empty())
					return textToken();
				return single(Token::CLOSE_BRACKET);
			case '{':
				if (!text.empty())
					return textToken();
				return single(Token::OPEN_BRACE);
			case '}':
				if (!text.empty())
					return textToken();
				return single(Token::CLOSE_BRACE);
			case '|':
				if (!text.empty())
					return textToken();
				return single(Token::PIPE);
			case '~':
			{
				if (m_pos+1 >= m_end || !isIdentifierStart(content[m_pos+1]))
				{
					append(c, m_pos++);
					m_after_command = false;
					break;
				}

				if (!text.empty())
					return textToken();
				Token tok{.type = Token::VARIABLE_REF, .text = identifier(m_pos+1), .pos = m_pos, .fragment = {}};
				m_pos += 1 + tok.text.size();
				m_after_command = false;
				return tok;
			}
			case '#':
				if (content.substr(m_pos, std::min(m_end-m_pos, 8uz)) == "#define("sv)
				{
					if (!text.empty())
						return textToken();
					return lexDefine();
				}
				append(c, m_pos++);
				m_after_command = false;
				break;
			default:
				append(c, m_pos++);
				m_after_command = false;
				break;
		}
	}

	if (!text.empty())
		return textToken();
	if (!m_pending.empty())
		return next();
	return {};
}

[[nodiscard]] std::vector<Token> Lexer::lex()
{
	std::vector<Token> tokens;
	while (auto tok = next())
		tokens.push_back(std::move(*tok));
	return tokens;
}
