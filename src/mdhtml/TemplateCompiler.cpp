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

#include "TemplateCompiler.hpp"

#include <fmt/format.h>

[[nodiscard]] TemplateCompiler::TemplateCompiler(CompilerOptions&& opts, std::string&& templ):
	Compiler(std::move(opts)), m_template{std::move(templ)}
{
	if (m_template.find(CONTENT) == std::string::npos) [[unlikely]]
		throw TemplateError(fmt::format("Template must contain {} mark in the body", CONTENT));
}

[[nodiscard]] std::string TemplateCompiler::get_name() const
{
	return "Template";
}

[[nodiscard]] std::string TemplateCompiler::compile(const Document& doc) const
{
	std::string r = m_template;
	replaceAll(r, TITLE, doc.title);

	doc.metadata.for_each([&](const std::string& key, const std::string& value)
	{
		if (key.empty())
			return;
		replaceAll(r, fmt::format("{{{{{}}}}}", key), value);
	});

	// Last, so placeholders written in the document are left untouched
	replaceAll(r, CONTENT, content(doc));
	return r;
}
