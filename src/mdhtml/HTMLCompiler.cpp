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

#include "HTMLCompiler.hpp"

#include <fmt/format.h>

[[nodiscard]] std::string HTMLCompiler::get_name() const
{
	return "HTML";
}

[[nodiscard]] std::string HTMLCompiler::compile(const Document& doc) const
{
	return fmt::format(R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>{}</title>
    <link rel="stylesheet" href="{}" />
</head>
<body>
    {}
</body>
</html>)", doc.title, m_opts.stylesheet, content(doc));
}
