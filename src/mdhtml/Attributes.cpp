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

#include "Attributes.hpp"

#include <algorithm>
#include <utility>
#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] const std::string& AttributeTable::header(std::size_t level) const noexcept
{
	level = std::clamp(level, 1uz, 6uz);
	return get(static_cast<Element>(static_cast<std::size_t>(Element::HEADER1) + level - 1));
}

void AttributeTable::set_class(Element elem, std::string_view classes)
{
	auto& attr = m_attrs[static_cast<std::size_t>(elem)];
	if (classes.empty())
		attr.clear();
	else
		attr = fmt::format(" class=\"{}\"", classes);
}

[[nodiscard]] AttributeTable AttributeTable::plain()
{
	return AttributeTable{};
}

[[nodiscard]] AttributeTable AttributeTable::tailwind()
{
	static constexpr std::string_view header_style = "text-red-900 mb-5 font-black uppercase"sv;
	static constexpr std::array<std::pair<Element, std::string_view>, 10> classes = {{
		{Element::PARAGRAPH,      "mb-5 text-justify"sv},
		{Element::STRONG,         "font-bold"sv},
		{Element::EMPHASIS,       "italic"sv},
		{Element::LINK,           "underline"sv},
		{Element::CODE,           "bg-slate-300"sv},
		{Element::ORDERED_LIST,   "list-decimal list-inside"sv},
		{Element::UNORDERED_LIST, "list-disc list-inside"sv},
		{Element::BYLINE,         "flex flex-row justify-between mb-5"sv},
		{Element::BYLINE_TEXT,    "text-xs text-slate-500"sv},
		{Element::BYLINE_DATES,   "flex flex-row gap-x-4"sv},
	}};

	AttributeTable table;
	for (const auto& [elem, cls] : classes)
		table.set_class(elem, cls);

	table.set_class(Element::HEADER1, fmt::format("text-6xl {}", header_style));
	table.set_class(Element::HEADER2, fmt::format("text-4xl {}", header_style));
	for (const auto elem : {Element::HEADER3, Element::HEADER4, Element::HEADER5, Element::HEADER6})
		table.set_class(elem, fmt::format("text-2xl {}", header_style));

	return table;
}

[[nodiscard]] std::optional<AttributeTable> AttributeTable::preset(std::string_view name)
{
	if (name == "plain"sv)
		return plain();
	if (name == "tailwind"sv)
		return tailwind();

	return {};
}
