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

#include "Compiler.hpp"

#include <fmt/format.h>
#include <fmt/chrono.h>

using namespace std::literals;

[[nodiscard]] std::string Compiler::now() const
{
	const auto local = std::chrono::time_point_cast<std::chrono::system_clock::duration>(m_opts.clock() + m_opts.utc_offset);
	const auto t = std::chrono::system_clock::to_time_t(local);
	return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::gmtime(t));
}

[[nodiscard]] std::string Compiler::byline(const Metadata& metadata) const
{
	if (metadata.empty())
		return ""s;

	const auto& attrs = m_opts.attributes;
	auto text = [&](std::string_view content)
	{
		return fmt::format("<p{}>{}</p>", attrs.get(Element::BYLINE_TEXT), content);
	};

	const std::string* datetime = metadata.get("datetime"sv);
	std::string dates = text(fmt::format("at {}", datetime && !datetime->empty() ? *datetime : now()));
	if (const std::string* updated = metadata.get("updatetime"sv); updated && !updated->empty())
		dates.append("\n").append(text(fmt::format("edited at {}", *updated)));

	std::string r = fmt::format("<section{}>", attrs.get(Element::BYLINE));
	if (const std::string* author = metadata.get("author"sv))
		r.append(text(fmt::format("Written by {}", *author))).append("\n");
	r.append(fmt::format("<section{}>{}</section></section>", attrs.get(Element::BYLINE_DATES), dates));

	return r;
}

[[nodiscard]] std::string Compiler::content(const Document& doc) const
{
	std::string r = byline(doc.metadata);
	const std::string body = doc.body();
	if (!r.empty() && !body.empty())
		r.push_back('\n');

	return r.append(body);
}
