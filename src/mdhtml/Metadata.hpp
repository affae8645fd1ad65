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

#ifndef MDHTML_METADATA_HPP
#define MDHTML_METADATA_HPP

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <functional>

/**
 * @brief Key/value pairs from a document's front matter
 *
 * Keys keep the order of their first insertion
 */
class Metadata
{
	std::vector<std::pair<std::string, std::string>> m_entries;

public:
	/**
	 * @brief Sets a value
	 * If the key already exists, its value is overwritten in place
	 *
	 * @param key Key
	 * @param value Value
	 */
	void set(std::string key, std::string value);

	/**
	 * @brief Gets a value
	 *
	 * @param key Key
	 * @returns A pointer to the value if found, nullptr otherwise
	 */
	[[nodiscard]] const std::string* get(std::string_view key) const noexcept;

	/**
	 * @brief Gets a value or a default value
	 *
	 * @param key Key
	 * @param value Value returned when key is not set
	 * @returns Value for key or `value`
	 */
	[[nodiscard]] std::string get_default(std::string_view key, const std::string& value) const;

	[[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
	[[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

	/**
	 * @brief Iterates over every entry, in insertion order
	 *
	 * @param fn Function called with (key, value)
	 */
	void for_each(const std::function<void(const std::string&, const std::string&)>& fn) const;
};

#endif // MDHTML_METADATA_HPP
