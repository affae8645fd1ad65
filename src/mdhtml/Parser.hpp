/* mdhtml a small markdown to html converter
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

#ifndef MDHTML_PARSER_HPP
#define MDHTML_PARSER_HPP

#include <string>
#include <string_view>

#include "Attributes.hpp"
#include "Document.hpp"
#include "Inline.hpp"
#include "ListStack.hpp"

/**
 * @brief Represents a file to be parsed
 */
struct File
{
	std::string name; ///< File's path (for displaying and default title)
	std::string_view content; ///< File's content
};

/**
 * @brief Per parse state
 *
 * Created for every call to Parser::parse, so nothing leaks between documents
 */
struct ParserData
{
	ListStack list; ///< Currently open lists
	std::vector<Syntax::Fragment> pending; ///< Fragments of the block being built

	bool in_fence = false; ///< Whether we are inside a ``` block
	std::string fence_lang; ///< Language of current code block
	std::size_t fence_line = 0; ///< Line where current code block was opened
	std::vector<std::string> code; ///< Lines of current code block

	std::vector<Syntax::Block> blocks; ///< Finished blocks

	[[nodiscard]] explicit ParserData(const AttributeTable& attrs):
		list{attrs} {}
};

/**
 * @brief Parser
 */
class Parser
{
	AttributeTable m_attrs;
	InlineFormatter m_inline;

	/**
	 * @brief Turns pending fragments into a block
	 */
	void flush(ParserData& data) const;

	/**
	 * @brief Closes any open list(s) and flushes them
	 */
	void closeList(ParserData& data) const;

	/**
	 * @brief Processes a non blank line outside of code blocks
	 */
	void parseLine(std::string_view line, ParserData& data) const;

public:
	static constexpr std::size_t BLOCK_INDENT = 2; ///< Indentation of block lines
	static constexpr std::size_t ITEM_INDENT = 4; ///< Indentation of list items

	/**
	 * @brief Constructor
	 * Builds inline rules
	 *
	 * @param attrs Attributes for generated elements
	 */
	[[nodiscard]] explicit Parser(const AttributeTable& attrs = AttributeTable::plain());

	/**
	 * @brief Parse file
	 * Extracts front matter, then splits body into blocks
	 *
	 * @param f File to parse
	 * @returns Document containing parsed file
	 */
	[[nodiscard]] Document parse(const File& f) const;

	/**
	 * @brief Splits text into blocks
	 *
	 * @param f File being parsed (for diagnostics)
	 * @param body Text to split (without front matter)
	 * @param first_line Line number of body's first line in f
	 * @param warnings Non fatal issues are appended here
	 * @returns Blocks in document order
	 */
	[[nodiscard]] std::vector<Syntax::Block> parse_blocks(const File& f, std::string_view body,
			std::size_t first_line, std::vector<std::string>& warnings) const;

	/**
	 * @brief Gets whether line is a list item
	 *
	 * @param line Line to check
	 * @returns true for `- x`, `* x` and `N. x`
	 */
	[[nodiscard]] bool is_list_item(std::string_view line) const;

	/**
	 * @brief Gets title used when front matter has none
	 *
	 * @param path File path
	 * @returns Path's stem
	 */
	[[nodiscard]] static std::string defaultTitle(std::string_view path);
};

#endif // MDHTML_PARSER_HPP
