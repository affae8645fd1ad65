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

#ifndef MDHTML_SYNTAX_HPP
#define MDHTML_SYNTAX_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace Syntax
{
/**
 * @brief Kind of a rendered line fragment
 */
enum class FragmentType : std::uint8_t
{
	TEXT = 0,
	HEADER = 1,
	LIST_OPEN = 2,
	LIST_ITEM = 3,
	LIST_CLOSE = 4,
};

/**
 * @brief Gets whether fragment type belongs to a list region
 *
 * @param type Type
 * @returns True for list open, item and close
 */
[[nodiscard]] constexpr bool isListFragment(FragmentType type) noexcept
{
	return type == FragmentType::LIST_OPEN ||
		   type == FragmentType::LIST_ITEM ||
		   type == FragmentType::LIST_CLOSE;
}

/**
 * @brief A piece of html produced from one source line
 */
struct Fragment
{
	FragmentType type; ///< What produced this fragment
	std::string html; ///< Rendered content
};

/**
 * @brief Type of blocks
 */
enum class BlockType : std::uint8_t
{
	HEADER = 0,
	PARAGRAPH = 1,
	LIST = 2,
	CODE = 3,
};

/**
 * @brief A block of html
 */
struct Block
{
	/**
	 * @brief Single output line
	 */
	struct Line
	{
		std::size_t indent; ///< Number of spaces to put before html
		std::string html; ///< Line content
	};

	BlockType type;
	std::vector<Line> lines;

	/**
	 * @brief Renders block with its indentation
	 *
	 * @returns Lines joined with '\n'
	 */
	[[nodiscard]] std::string render() const;
};
} // Syntax

#endif // MDHTML_SYNTAX_HPP
