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

#include "Metadata.hpp"

#include <algorithm>

void Metadata::set(std::string key, std::string value)
{
	const auto it = std::find_if(m_entries.begin(), m_entries.end(), [&](const auto& e) { return e.first == key; });
	if (it != m_entries.end())
		it->second = std::move(value);
	else
		m_entries.emplace_back(std::move(key), std::move(value));
}

[[nodiscard]] const std::string* Metadata::get(std::string_view key) const noexcept
{
	const auto it = std::find_if(m_entries.cbegin(), m_entries.cend(), [&](const auto& e) { return e.first == key; });
	return it == m_entries.cend() ? nullptr : &it->second;
}

[[nodiscard]] std::string Metadata::get_default(std::string_view key, const std::string& value) const
{
	if (const std::string* v = get(key))
		return *v;
	return value;
}

void Metadata::for_each(const std::function<void(const std::string&, const std::string&)>& fn) const
{
	for (const auto& [key, value] : m_entries)
		fn(key, value);
}
