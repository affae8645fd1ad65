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

#include "Inline.hpp"
#include "Util.hpp"

#include <fmt/format.h>

using namespace std::literals;

[[nodiscard]] InlineFormatter::Rule::Rule(std::string&& name, std::string&& open, std::string&& middle, std::string&& close,
		std::size_t min_length, Callback&& callback):
	name{std::move(name)}, open{std::move(open)}, middle{std::move(middle)}, close{std::move(close)},
	min_length{min_length}, callback{std::move(callback)}
{
	if (this->open.empty() || this->close.empty()) [[unlikely]]
		throw Error(fmt::format("Rule `{}` needs an opening and a closing delimiter", this->name));
}

[[nodiscard]] std::optional<InlineFormatter::Rule::Capture> InlineFormatter::Rule::match(std::string_view text, std::size_t pos) const
{
	Capture cap{};
	std::size_t cur = pos + open.size();
	if (!middle.empty())
	{
		const std::size_t mid = text.find(middle, cur + min_length);
		if (mid == std::string_view::npos)
			return {};
		cap.first = text.substr(cur, mid - cur);
		cur = mid + middle.size();
	}

	const std::size_t end = text.find(close, cur + min_length);
	if (end == std::string_view::npos)
		return {};

	(middle.empty() ? cap.first : cap.second) = text.substr(cur, end - cur);
	cap.end = end + close.size();
	return cap;
}

[[nodiscard]] std::string InlineFormatter::Rule::apply(std::string_view text) const
{
	std::string r;
	std::size_t pos = 0;
	while (pos < text.size())
	{
		const std::size_t start = text.find(open, pos);
		if (start == std::string_view::npos)
			break;

		// Delimiters only get further away, no later opening can match
		const auto cap = match(text, start);
		if (!cap)
			break;

		r.append(text.substr(pos, start - pos)).append(callback(cap->first, cap->second));
		pos = cap->end;
	}
	r.append(text.substr(pos));

	return r;
}

[[nodiscard]] InlineFormatter::InlineFormatter(const AttributeTable& attrs)
{
	// Bold must run before italic, image before link
	m_rules.emplace_back("bold"s, "**"s, ""s, "**"s, 1, [attr = attrs.get(Element::STRONG)](std::string_view text, std::string_view)
	{
		return fmt::format("<strong{}>{}</strong>", attr, text);
	});
	m_rules.emplace_back("italic"s, "*"s, ""s, "*"s, 1, [attr = attrs.get(Element::EMPHASIS)](std::string_view text, std::string_view)
	{
		return fmt::format("<em{}>{}</em>", attr, text);
	});
	m_rules.emplace_back("image"s, "!["s, "]("s, ")"s, 1, [attr = attrs.get(Element::IMAGE)](std::string_view alt, std::string_view src)
	{
		return fmt::format("<img src=\"{}\" alt=\"{}\"{} />", src, alt, attr);
	});
	m_rules.emplace_back("link"s, "["s, "]("s, ")"s, 1, [attr = attrs.get(Element::LINK)](std::string_view text, std::string_view href)
	{
		return fmt::format("<a href=\"{}\"{}>{}</a>", href, attr, text);
	});
	m_rules.emplace_back("code"s, "`"s, ""s, "`"s, 0, [attr = attrs.get(Element::CODE)](std::string_view text, std::string_view)
	{
		return fmt::format("<code{}>{}</code>", attr, text);
	});
}

[[nodiscard]] std::string InlineFormatter::format(std::string_view line) const
{
	std::string text(line);
	for (const auto& rule : m_rules)
		text = rule.apply(text);

	return text;
}
