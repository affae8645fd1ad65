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

#include "Document.hpp"

#include <algorithm>

[[nodiscard]] std::string Document::body() const
{
	std::string r;
	bool first = true;
	for (const auto& block : blocks)
	{
		if (!first)
			r.push_back('\n');
		r.append(block.render());
		first = false;
	}

	return r;
}

[[nodiscard]] std::size_t Document::count(Syntax::BlockType type) const noexcept
{
	return std::count_if(blocks.cbegin(), blocks.cend(), [type](const Syntax::Block& b) { return b.type == type; });
}
