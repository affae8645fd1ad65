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

#ifndef MDHTML_LISTSTACK_HPP
#define MDHTML_LISTSTACK_HPP

#include "Syntax.hpp"
#include "Attributes.hpp"

#include <deque>

/**
 * @brief An open list
 */
struct ListFrame
{
	std::size_t indent; ///< Leading whitespace of the list's items
	bool ordered; ///< Whether list is ordered
};

/**
 * @brief Stack of currently open lists
 *
 * Frames are ordered by strictly increasing indent from bottom to top.
 */
class ListStack
{
	const AttributeTable& m_attrs;
	std::deque<ListFrame> m_frames;

	/**
	 * @brief Pops top frame and writes its closing tag
	 */
	void pop(std::vector<Syntax::Fragment>& out);

public:
	[[nodiscard]] explicit ListStack(const AttributeTable& attrs):
		m_attrs{attrs} {}

	/**
	 * @brief Adds a list item
	 *
	 * Closes every list deeper than indent, opens a new list if indent is deeper than
	 * the current list (or if there is no list). At the same indent the current list is
	 * kept, even if its ordering differs from `ordered`.
	 *
	 * @param indent Item's leading whitespace
	 * @param ordered Whether item uses an ordered marker
	 * @param content Item's formatted content
	 * @param out Fragments output
	 */
	void item(std::size_t indent, bool ordered, const std::string& content, std::vector<Syntax::Fragment>& out);

	/**
	 * @brief Closes any open list(s)
	 *
	 * @param out Fragments output
	 */
	void close(std::vector<Syntax::Fragment>& out);

	[[nodiscard]] bool empty() const noexcept { return m_frames.empty(); }
	[[nodiscard]] std::size_t depth() const noexcept { return m_frames.size(); }
	[[nodiscard]] const ListFrame& top() const { return m_frames.back(); }
};

#endif // MDHTML_LISTSTACK_HPP
