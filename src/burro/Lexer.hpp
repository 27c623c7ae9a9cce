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

#ifndef BURRO_LEXER_HPP
#define BURRO_LEXER_HPP

#include <string>
#include <vector>
#include <deque>
#include <optional>
#include "Util.hpp"

/**
 * @brief A lexical token
 */
struct Token
{
	enum Type : std::uint8_t
	{
		TEXT,
		DOT, ///< Command marker, `text` holds the command's name
		OPEN_BRACKET,
		CLOSE_BRACKET,
		OPEN_BRACE,
		CLOSE_BRACE,
		PIPE,
		PARAGRAPH_BREAK,
		COMMENT,
		ESCAPE, ///< Escaped character, `text` holds the character
		VARIABLE_DEFINE, ///< `#define(name)(...)`, `fragment` holds the definition
		VARIABLE_REF, ///< `~name`
	};

	Type type; ///< Token type
	std::string text; ///< Token content
	std::size_t pos; ///< Offset of the first character in the source
	std::vector<Token> fragment; ///< Definition (for VARIABLE_DEFINE)

	[[nodiscard]] bool operator==(const Token&) const = default;
};

/**
 * @brief Gets the name of a token type
 *
 * @param type Token type
 * @returns Display name for type
 */
[[nodiscard]] std::string_view getTokenName(Token::Type type) noexcept;

/**
 * @brief Options for the lexer
 */
struct LexerOptions
{
	bool keep_comments = false; ///< Emit COMMENT tokens instead of dropping comments
};

/**
 * @brief Splits source into tokens
 */
class Lexer
{
	const File& m_file; ///< Source
	LexerOptions m_opts; ///< Options
	std::size_t m_begin; ///< Start of lexed range
	std::size_t m_end; ///< End of lexed range
	bool m_define; ///< Whether lexing a variable definition

	std::size_t m_pos; ///< Current position
	bool m_after_command; ///< Whether the last token was a command name
	std::deque<Token> m_pending; ///< Tokens produced but not yet returned

	/**
	 * @brief Constructor for variable definitions
	 */
	[[nodiscard]] Lexer(const File& f, LexerOptions opts, std::size_t begin, std::size_t end);

	[[nodiscard]] bool isSpecial(char c) const noexcept;

	/**
	 * @brief Skips blank and comment lines
	 *
	 * Must be called at the start of a line
	 *
	 * @returns Number of blank lines skipped
	 */
	std::size_t skipLines();

	/**
	 * @brief Lexes a `#define(name)(...)`
	 *
	 * @returns The VARIABLE_DEFINE token
	 */
	[[nodiscard]] Token lexDefine();

	/**
	 * @brief Checks if a dot at the current position starts a command
	 */
	[[nodiscard]] bool isCommand() const noexcept;
public:
	/**
	 * @brief Constructor
	 *
	 * @param f File to lex, must outlive the lexer
	 * @param opts Lexer options
	 */
	[[nodiscard]] Lexer(const File& f, LexerOptions opts = {});

	/**
	 * @brief Restarts lexing from the beginning
	 */
	void reset();

	/**
	 * @brief Gets next token
	 *
	 * @returns Next token, empty when the end is reached
	 * @throws LexError on truncated escape or malformed definition
	 */
	[[nodiscard]] std::optional<Token> next();

	/**
	 * @brief Lexes everything
	 *
	 * @returns Every remaining token
	 */
	[[nodiscard]] std::vector<Token> lex();
};

#endif // BURRO_LEXER_HPP
