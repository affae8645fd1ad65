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

#include "ListStack.hpp"

#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] static std::string_view listTag(bool ordered) noexcept
{
	return ordered ? "ol"sv : "ul"sv;
}

void ListStack::pop(std::vector<Syntax::Fragment>& out)
{
	out.push_back({Syntax::FragmentType::LIST_CLOSE, fmt::format("</{}>", listTag(m_frames.back().ordered))});
	m_frames.pop_back();
}

void ListStack::item(std::size_t indent, bool ordered, const std::string& content, std::vector<Syntax::Fragment>& out)
{
	while (!m_frames.empty() && m_frames.back().indent > indent)
		pop(out);

	if (m_frames.empty() || m_frames.back().indent < indent)
	{
		m_frames.push_back({indent, ordered});
		out.push_back({Syntax::FragmentType::LIST_OPEN, fmt::format("<{}{}>", listTag(ordered),
			m_attrs.get(ordered ? Element::ORDERED_LIST : Element::UNORDERED_LIST))});
	}

	out.push_back({Syntax::FragmentType::LIST_ITEM, fmt::format("<li{}>{}</li>", m_attrs.get(Element::LIST_ITEM), content)});
}

void ListStack::close(std::vector<Syntax::Fragment>& out)
{
	while (!m_frames.empty())
		pop(out);
}
