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

#ifndef MDHTML_ATTRIBUTES_HPP
#define MDHTML_ATTRIBUTES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Html elements that can carry attributes
 */
enum class Element : std::uint8_t
{
	HEADER1 = 0,
	HEADER2,
	HEADER3,
	HEADER4,
	HEADER5,
	HEADER6,
	PARAGRAPH,
	STRONG,
	EMPHASIS,
	IMAGE,
	LINK,
	CODE,
	ORDERED_LIST,
	UNORDERED_LIST,
	LIST_ITEM,
	BYLINE,
	BYLINE_TEXT,
	BYLINE_DATES,

	COUNT,
};

/**
 * @brief Static table of attributes for every element
 *
 * Attributes are stored already formatted, with a leading space (e.g ` class="italic"`),
 * so they can be appended right after the tag name.
 */
class AttributeTable
{
	std::array<std::string, static_cast<std::size_t>(Element::COUNT)> m_attrs;

public:
	/**
	 * @brief Gets attributes of element
	 *
	 * @param elem Element
	 * @returns Formatted attributes (empty if none)
	 */
	[[nodiscard]] const std::string& get(Element elem) const noexcept
	{ return m_attrs[static_cast<std::size_t>(elem)]; }

	/**
	 * @brief Gets attributes of header
	 *
	 * @param level Header level (1-6)
	 * @returns Formatted attributes (empty if none)
	 */
	[[nodiscard]] const std::string& header(std::size_t level) const noexcept;

	/**
	 * @brief Sets class attribute of element
	 *
	 * @param elem Element
	 * @param classes Class list, empty to remove the attribute
	 */
	void set_class(Element elem, std::string_view classes);

	/**
	 * @brief Table without any attribute
	 */
	[[nodiscard]] static AttributeTable plain();

	/**
	 * @brief Table using tailwind's utility classes
	 */
	[[nodiscard]] static AttributeTable tailwind();

	/**
	 * @brief Gets preset by name
	 *
	 * @param name Preset name (`plain` or `tailwind`)
	 * @returns Preset, nothing if name is unknown
	 */
	[[nodiscard]] static std::optional<AttributeTable> preset(std::string_view name);
};

#endif // MDHTML_ATTRIBUTES_HPP
