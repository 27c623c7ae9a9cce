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

#ifndef BURRO_SYNTAX_HPP
#define BURRO_SYNTAX_HPP

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <functional>
#include "Util.hpp"
#include "State.hpp"
#include "Tabs.hpp"

namespace Syntax
{
	using NodeId = std::size_t;
	using Fragment = std::vector<NodeId>; ///< Ordered nodes

	/**
	 * @brief Every known command
	 */
	enum class CommandKind : std::uint8_t
	{
		ALIGN,
		MARGINS,
		MARGIN_LEFT,
		MARGIN_RIGHT,
		MARGIN_TOP,
		MARGIN_BOTTOM,
		PAGE_WIDTH,
		PAGE_HEIGHT,
		LEADING,
		PAR_SPACE,
		PAR_INDENT,
		PAGE_BREAK,
		TAB,
		TAB_LIST,
		LOAD_TABS,
		QUIT_TABS,
		PT_SIZE,
		FAMILY,
		LETTER_SPACE,
		SPACE_WIDTH,
		BOLD,
		ITALIC,
		QUOTE,
		SELECT_TAB,
		NEXT_TAB,
		PREVIOUS_TAB,
	};

	/**
	 * @brief What a command accepts
	 */
	enum class Shape : std::uint8_t
	{
		BARE, ///< No argument
		VALUE, ///< Plain text argument
		CONTENT, ///< Markup argument
		BLOCK, ///< Brace block, then optional name
	};

	/**
	 * @brief Catalog entry
	 */
	struct CommandInfo
	{
		std::string_view name; ///< Name in source
		CommandKind kind; ///< Command kind
		Shape shape; ///< Accepted arguments
		bool directive; ///< Whether the command must stand at a paragraph's boundary
	};

	/**
	 * @brief Finds a command
	 *
	 * @param name Command's name
	 * @returns Catalog entry, nullptr if name is unknown
	 */
	[[nodiscard]] const CommandInfo* getCommandInfo(std::string_view name) noexcept;

	/**
	 * @brief Gets command information by kind
	 *
	 * @param kind Command kind
	 * @returns Catalog entry
	 */
	[[nodiscard]] const CommandInfo& getCommandInfo(CommandKind kind) noexcept;

	/**
	 * @brief Gets settings modified by a setting command
	 *
	 * @param kind Command kind
	 * @returns Settings affected by kind, empty if kind does not modify settings
	 */
	[[nodiscard]] std::vector<Setting> getCommandSettings(CommandKind kind);

	struct Style
	{
		FontStyle style; ///< Style to combine with the current one
	};

	struct Quote {};

	struct SettingChange
	{
		std::vector<Setting> keys; ///< Modified settings
		std::optional<std::string> value; ///< Raw value, empty to reset
	};

	struct PageBreak {};

	struct TabDefinition
	{
		std::string name; ///< Tab's name
		Tab tab; ///< Definition
	};

	struct TabListDefinition
	{
		std::string name; ///< List's name
		std::vector<std::string> tabs; ///< Tab names, in order
	};

	struct LoadTabs
	{
		std::string list; ///< List to load
	};

	struct QuitTabs {};

	struct SelectTab
	{
		std::string name; ///< Tab to select
	};

	struct NextTab {};
	struct PreviousTab {};

	using Payload = std::variant<
		Style,
		Quote,
		SettingChange,
		PageBreak,
		TabDefinition,
		TabListDefinition,
		LoadTabs,
		QuitTabs,
		SelectTab,
		NextTab,
		PreviousTab>;

	/**
	 * @brief Text run
	 */
	struct Text
	{
		std::string content; ///< Text content
		std::size_t pos; ///< Position in source
	};

	/**
	 * @brief Command invocation
	 */
	struct Command
	{
		std::string name; ///< Command's name
		CommandKind kind; ///< Command kind
		std::optional<std::vector<std::pair<std::string, std::string>>> sub_settings; ///< Brace block entries
		std::optional<Fragment> argument; ///< Argument
		Payload payload; ///< Validated content
		std::size_t pos; ///< Position in source
	};

	using Node = std::variant<Text, Command>;

	struct Paragraph
	{
		Fragment content; ///< Paragraph's content
		std::size_t pos; ///< Position in source
	};

	struct CommandBlock
	{
		NodeId command; ///< Directive
	};

	using Block = std::variant<Paragraph, CommandBlock>;
} // Syntax

/**
 * @brief A parsed document
 *
 * Nodes are stored in a single arena and refered to by their id.
 */
class Document
{
	File m_file; ///< Source
	std::vector<Syntax::Node> m_nodes; ///< Node arena
	std::vector<Syntax::Block> m_blocks; ///< Blocks in reading order
public:
	/**
	 * @brief Constructor
	 *
	 * @param f Source file, its content must outlive the document
	 */
	[[nodiscard]] explicit Document(const File& f):
		m_file{f} {}

	/**
	 * @brief Adds a node to the arena
	 *
	 * @param node Node to add
	 * @returns Node's id
	 */
	[[nodiscard]] Syntax::NodeId emplace(Syntax::Node&& node);

	[[nodiscard]] const Syntax::Node& node(Syntax::NodeId id) const { return m_nodes.at(id); }
	[[nodiscard]] Syntax::Node& node(Syntax::NodeId id) { return m_nodes.at(id); }
	[[nodiscard]] std::size_t size() const noexcept { return m_nodes.size(); }

	/**
	 * @brief Appends a block
	 *
	 * @param block Block to append
	 */
	void push_block(Syntax::Block&& block) { m_blocks.push_back(std::move(block)); }

	[[nodiscard]] const std::vector<Syntax::Block>& blocks() const noexcept { return m_blocks; }
	[[nodiscard]] const File& file() const noexcept { return m_file; }

	/**
	 * @brief Concatenates text in a fragment
	 *
	 * @param frag Fragment
	 * @returns Text content, empty if frag contains commands
	 */
	[[nodiscard]] std::optional<std::string> plain_text(const Syntax::Fragment& frag) const;

	/**
	 * @brief Iterates over every node of a fragment, recursing into arguments
	 *
	 * @param frag Fragment to walk
	 * @param fn Callback, receives the node and its depth
	 */
	void for_each_node(const Syntax::Fragment& frag, std::function<void(const Syntax::Node&, std::size_t)> fn) const;

	/**
	 * @brief Formats the tree
	 *
	 * @returns Human readable tree
	 */
	[[nodiscard]] std::string dump() const;
};

#endif // BURRO_SYNTAX_HPP
