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

#ifndef MDHTML_TEMPLATECOMPILER_HPP
#define MDHTML_TEMPLATECOMPILER_HPP

#include "Compiler.hpp"
#include "Util.hpp"

/**
 * @brief Thrown when a template cannot be used
 */
class TemplateError : public Error
{
public:
	TemplateError(const std::string& msg, const std::source_location& loc = std::source_location::current()):
		Error(msg, loc) {}
};

/**
 * @brief Compiles by filling a user supplied template
 *
 * Placeholders are replaced literally: `{{title}}`, then `{{key}}` for every
 * metadata key, then `{{content}}`.
 */
class TemplateCompiler : public Compiler
{
	std::string m_template;

public:
	static constexpr std::string_view CONTENT = "{{content}}";
	static constexpr std::string_view TITLE = "{{title}}";

	/**
	 * @brief Constructor
	 *
	 * @param opts Options
	 * @param templ Template text
	 * @throws TemplateError if templ has no `{{content}}` placeholder
	 */
	[[nodiscard]] TemplateCompiler(CompilerOptions&& opts, std::string&& templ);

	[[nodiscard]] virtual std::string get_name() const;
	[[nodiscard]] virtual std::string compile(const Document& doc) const;
};

#endif // MDHTML_TEMPLATECOMPILER_HPP
