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

#ifndef MDHTML_DOCUMENT_HPP
#define MDHTML_DOCUMENT_HPP

#include "Metadata.hpp"
#include "Syntax.hpp"

#include <string>
#include <vector>

/**
 * @brief A parsed document
 */
struct Document
{
	std::string title; ///< Metadata's title, or the file's stem
	Metadata metadata; ///< Front matter
	std::vector<Syntax::Block> blocks; ///< Body, in document order
	std::vector<std::string> warnings; ///< Non fatal parsing issues

	/**
	 * @brief Renders every block
	 *
	 * @returns Blocks joined with '\n'
	 */
	[[nodiscard]] std::string body() const;

	/**
	 * @brief Gets number of blocks of type
	 *
	 * @param type Block type
	 * @returns Number of blocks
	 */
	[[nodiscard]] std::size_t count(Syntax::BlockType type) const noexcept;
};

#endif // MDHTML_DOCUMENT_HPP
