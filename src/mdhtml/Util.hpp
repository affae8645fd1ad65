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

#ifndef MDHTML_UTIL_HPP
#define MDHTML_UTIL_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include <source_location>

namespace Colors
{
	extern bool enabled;

	extern const std::string_view reset;
	extern const std::string_view red;
	extern const std::string_view green;
	extern const std::string_view yellow;
} // Colors

/**
 * @brief Error exception
 *
 * Thrown when there is an error
 */
class Error
{
	std::string m_msg; ///< Error message
	std::string m_where; ///< Location the error was thrown from

public:
	/**
	 * @brief Constructor
	 *
	 * @param msg Error message
	 * @param loc Location
	 */
	Error(const std::string& msg, const std::source_location& loc = std::source_location::current());

	virtual ~Error() = default;

	/**
	 * @brief what()
	 *
	 * @returns Error message
	 */
	[[nodiscard]] virtual std::string what() const throw();

	/**
	 * @brief Gets the error message prefixed with the location it was thrown from
	 *
	 * @returns Error message with location
	 */
	[[nodiscard]] std::string where() const;
};

/**
 * @brief Removes leading and trailing whitespaces
 *
 * @param s String to trim
 * @returns View on the trimmed part of s
 */
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/**
 * @brief Removes trailing whitespaces
 *
 * @param s String to trim
 * @returns View on the trimmed part of s
 */
[[nodiscard]] std::string_view trimRight(std::string_view s) noexcept;

/**
 * @brief Gets whether a string is empty or only made of whitespaces
 */
[[nodiscard]] bool isBlank(std::string_view s) noexcept;

/**
 * @brief Replaces every occurence of `from` in `s`
 *
 * @param s String to modify in place
 * @param from Text to search for (non empty)
 * @param to Replacement
 * @returns Number of replacements made
 */
std::size_t replaceAll(std::string& s, std::string_view from, std::string_view to);

/**
 * @brief Splits text on '\n'
 * A trailing '\r' is removed from every line.
 *
 * @param text Text to split
 * @returns Lines (views into text)
 */
[[nodiscard]] std::vector<std::string_view> splitLines(std::string_view text);

/**
 * @brief Joins strings
 *
 * @param parts Strings to join
 * @param sep Separator
 * @returns Joined string
 */
[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view sep);

/**
 * @brief Reads a whole file
 *
 * @param path Path of the file
 * @returns File's content, or nothing if the file could not be opened
 */
[[nodiscard]] std::optional<std::string> readFile(const std::filesystem::path& path);

#endif // MDHTML_UTIL_HPP
