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

#ifndef BURRO_PARSER_HPP
#define BURRO_PARSER_HPP

#include <map>
#include <set>
#include <string>
#include <vector>
#include <functional>

#include "Lexer.hpp"
#include "Syntax.hpp"

/**
 * @brief Variables defined with `#define(name)(...)`
 *
 * Definitions are collected before parsing, references are expanded
 * in place so a variable can be used before its definition.
 */
class VariableTable
{
	/**
	 * @brief A variable
	 */
	struct Variable
	{
		std::vector<Token> tokens; ///< Definition
		std::size_t pos; ///< Position of the definition
	};

	std::map<std::string, Variable> m_vars; ///< Definitions
	std::map<std::string, std::vector<Token>> m_resolved; ///< Expanded definitions

	/**
	 * @brief Gets the expansion of a variable
	 *
	 * @param f Source
	 * @param name Variable's name
	 * @param pos Position of the reference
	 * @param stack Variables being expanded
	 * @returns Expanded tokens
	 */
	[[nodiscard]] const std::vector<Token>& resolve(const File& f, const std::string& name, std::size_t pos, std::vector<std::string>& stack);

	[[nodiscard]] std::vector<Token> expand(const File& f, const std::vector<Token>& tokens, std::vector<std::string>& stack);
public:
	/**
	 * @brief Registers every definition in tokens (including nested definitions)
	 *
	 * @param f Source
	 * @param tokens Tokens to search
	 * @throws ParseError on redefinition or when a definition contains a paragraph break
	 */
	void collect(const File& f, const std::vector<Token>& tokens);

	/**
	 * @brief Replaces every reference with its definition and removes definitions
	 *
	 * @param f Source
	 * @param tokens Tokens to expand
	 * @returns Expanded tokens
	 * @throws UndefinedVariableError for references to unknown variables
	 * @throws ParseError for recursive definitions
	 */
	[[nodiscard]] std::vector<Token> expand(const File& f, const std::vector<Token>& tokens);

	[[nodiscard]] bool contains(const std::string& name) const { return m_vars.find(name) != m_vars.end(); }
	[[nodiscard]] std::size_t size() const noexcept { return m_vars.size(); }

	/**
	 * @brief Iterates over definitions
	 *
	 * @param fn Callback receiving the name and tokens of each variable
	 */
	void for_each(std::function<void(const std::string&, const std::vector<Token>&)> fn) const;
};

/**
 * @brief Recursive descent parser
 */
class Parser
{
	/**
	 * @brief What ends a fragment
	 */
	enum class Mode
	{
		BLOCK, ///< Paragraph break or end of input
		BRACKET, ///< `]`
		INLINE, ///< `|`, paragraph break or end of input
	};

	/**
	 * @brief Entry of a brace block
	 */
	struct Entry
	{
		std::string key;
		std::string value;
		std::size_t pos; ///< Position of the value
	};

	const File& m_file; ///< Source
	Document m_doc; ///< Document being built
	VariableTable m_vars; ///< Variables
	std::vector<Token> m_tokens; ///< Expanded tokens
	std::size_t m_pos = 0; ///< Current token

	std::size_t m_tab_count = 0; ///< Number of tab definitions
	std::set<std::string> m_tab_names; ///< Defined tabs
	std::set<std::string> m_list_names; ///< Defined tab lists

	[[nodiscard]] const Token* peek() const noexcept;
	[[nodiscard]] bool isDirective(std::size_t index) const noexcept;
	void skipBlanks();
	void addText(Syntax::Fragment& frag, const std::string& text, std::size_t pos);

	void parseBlock();
	[[nodiscard]] Syntax::Fragment parseFragment(Mode mode, std::size_t open, std::vector<Syntax::NodeId>* trailing);
	[[nodiscard]] Syntax::NodeId parseCommand();
	[[nodiscard]] Syntax::Fragment parseArgument(const Token& dot);
	[[nodiscard]] std::vector<Entry> parseBraceBlock(const Token& dot, Syntax::CommandKind kind);
	[[nodiscard]] std::string parseValue(const Token& dot, const Syntax::Fragment& arg);
	[[nodiscard]] Syntax::Payload makePayload(const Token& dot, Syntax::Command& cmd, const std::vector<Entry>& entries, std::size_t argpos);
public:
	/**
	 * @brief Constructor
	 *
	 * @param f File to parse, must outlive the parser and the document
	 */
	[[nodiscard]] explicit Parser(const File& f);

	/**
	 * @brief Parse tokens
	 *
	 * @param tokens Tokens obtained from lexing the parser's file
	 * @returns Parsed document and variables
	 * @throws ParseError, UndefinedVariableError
	 */
	[[nodiscard]] std::pair<Document, VariableTable> parse(const std::vector<Token>& tokens);
};

#endif // BURRO_PARSER_HPP
