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

#ifndef MDHTML_FRONTMATTER_HPP
#define MDHTML_FRONTMATTER_HPP

#include "Metadata.hpp"

#include <string_view>

/**
 * @brief Result of front matter extraction
 */
struct FrontMatter
{
	Metadata metadata; ///< Parsed `key: value` pairs
	std::string_view body; ///< Text after the closing delimiter (view into the source)
	std::size_t body_line = 0; ///< Line number (0-based) at which body starts in the source
};

/**
 * @brief Extracts the front matter block at the start of a document
 *
 * The block must start at offset zero with a `---` line and end with an other `---` line.
 * When there is no such block, the metadata is empty and the body is the whole source.
 *
 * @param source Document's content
 * @returns Metadata and remaining body
 */
[[nodiscard]] FrontMatter extractFrontMatter(std::string_view source);

/**
 * @brief Parses a single `key: value` line
 *
 * @param line Line to parse
 * @param metadata Metadata to store the pair in
 * @returns false if the line has no ':'
 */
bool parseMetadataLine(std::string_view line, Metadata& metadata);

#endif // MDHTML_FRONTMATTER_HPP
