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

#include "FrontMatter.hpp"
#include "Util.hpp"

using namespace std::literals;

static constexpr std::string_view delimiter = "---"sv;

/**
 * @brief Gets line starting from `start`
 *
 * @param source Source text
 * @param start Start position of line
 * @returns The line (without '\n') and the position of the next line
 */
[[nodiscard]] static std::pair<std::string_view, std::size_t> getLine(std::string_view source, std::size_t start) noexcept
{
	const std::size_t end = source.find('\n', start);
	if (end == std::string_view::npos)
		return {source.substr(start), source.size()};

	return {source.substr(start, end-start), end+1};
}

[[nodiscard]] static bool isDelimiter(std::string_view line) noexcept
{
	return trimRight(line) == delimiter;
}

bool parseMetadataLine(std::string_view line, Metadata& metadata)
{
	const std::size_t colon = line.find(':');
	if (colon == std::string_view::npos)
		return false;

	const std::string_view key = trim(line.substr(0, colon));
	std::string_view value = trim(line.substr(colon+1));

	if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
		value = value.substr(1, value.size()-2);

	metadata.set(std::string(key), std::string(value));
	return true;
}

[[nodiscard]] FrontMatter extractFrontMatter(std::string_view source)
{
	FrontMatter fm;
	fm.body = source;

	if (!source.starts_with(delimiter))
		return fm;

	auto [first, pos] = getLine(source, 0);
	if (!isDelimiter(first) || pos == source.size())
		return fm;

	// Find closing delimiter before parsing anything
	std::size_t lines = 1;
	const std::size_t block_start = pos;
	std::size_t block_end = std::string_view::npos;
	while (pos < source.size())
	{
		const auto [line, next] = getLine(source, pos);
		++lines;
		if (isDelimiter(line))
		{
			block_end = pos;
			pos = next;
			break;
		}
		pos = next;
	}

	if (block_end == std::string_view::npos) // Unterminated, everything is body
		return fm;

	for (std::size_t cur = block_start; cur < block_end;)
	{
		const auto [line, next] = getLine(source, cur);
		if (!isBlank(line))
			parseMetadataLine(line, fm.metadata);
		cur = next;
	}

	fm.body = source.substr(pos);
	fm.body_line = lines;
	return fm;
}
