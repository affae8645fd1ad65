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

#ifndef MDHTML_HTMLCOMPILER_HPP
#define MDHTML_HTMLCOMPILER_HPP

#include "Compiler.hpp"

/**
 * @brief Compiles to a minimal standalone html page
 */
class HTMLCompiler : public Compiler
{
public:
	[[nodiscard]] explicit HTMLCompiler(CompilerOptions&& opts):
		Compiler(std::move(opts)) {}

	[[nodiscard]] virtual std::string get_name() const;
	[[nodiscard]] virtual std::string compile(const Document& doc) const;
};

#endif // MDHTML_HTMLCOMPILER_HPP
