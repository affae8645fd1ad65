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

#ifndef MDHTML_COMPILER_HPP
#define MDHTML_COMPILER_HPP

#include "Attributes.hpp"
#include "Document.hpp"

#include <chrono>
#include <functional>
#include <string>

/**
 * @brief Options for a compiler
 */
struct CompilerOptions
{
	AttributeTable attributes = AttributeTable::plain(); ///< Attributes for the byline
	std::string stylesheet = "./styles/style.css"; ///< Stylesheet linked by the default page
	std::chrono::minutes utc_offset = std::chrono::hours{7}; ///< Timezone of generated dates
	std::function<std::chrono::system_clock::time_point()> clock = &std::chrono::system_clock::now; ///< Source of current time
};

/**
 * @brief Abstract class for a document compiler
 */
class Compiler
{
protected:
	CompilerOptions m_opts;

public:
	/**
	 * @brief Constructor
	 * @param opts Options for the compiler
	 */
	[[nodiscard]] explicit Compiler(CompilerOptions&& opts):
		m_opts{std::move(opts)} {}

	/**
	 * @brief Destructor
	 */
	virtual ~Compiler() {}

	/**
	 * @param Gets compiler name
	 *
	 * @returns Compiler's name
	 */
	[[nodiscard]] virtual std::string get_name() const = 0;

	/**
	 * @brief Compile a document
	 *
	 * @param doc Document to compile
	 * @returns Compiled document
	 */
	[[nodiscard]] virtual std::string compile(const Document& doc) const = 0;

	/**
	 * @brief Renders the byline
	 *
	 * Author, creation date (from `datetime`, or now) and edition date (`updatetime`).
	 *
	 * @param metadata Document's metadata
	 * @returns Byline html, empty if metadata is empty
	 */
	[[nodiscard]] std::string byline(const Metadata& metadata) const;

	/**
	 * @brief Gets current date in the configured timezone
	 *
	 * @returns Date formatted as `%Y-%m-%d %H:%M:%S`
	 */
	[[nodiscard]] std::string now() const;

	/**
	 * @brief Gets the content of a document: byline followed by every block
	 *
	 * @param doc Document
	 * @returns Content html
	 */
	[[nodiscard]] std::string content(const Document& doc) const;
};

#endif // MDHTML_COMPILER_HPP
