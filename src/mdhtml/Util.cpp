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

#include "Util.hpp"

#include <fstream>
#include <iterator>
#include <fmt/format.h>

using namespace std::literals;

bool Colors::enabled = true;
const std::string_view Colors::reset = "\033[0m"sv;
const std::string_view Colors::red = "\033[31m"sv;
const std::string_view Colors::green = "\033[32m"sv;
const std::string_view Colors::yellow = "\033[33m"sv;

Error::Error(const std::string& msg, const std::source_location& loc):
	m_msg{msg}
{
	m_where = fmt::format("{}({}:{}) `{}`", loc.file_name(), loc.line(), loc.column(), loc.function_name());
}

std::string Error::what() const throw()
{
	return m_msg;
}

std::string Error::where() const
{
	return fmt::format("{} {}", m_where, m_msg);
}

static constexpr std::string_view whitespaces = " \t\r\n\f\v"sv;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
	const auto start = s.find_first_not_of(whitespaces);
	if (start == std::string_view::npos)
		return s.substr(s.size());

	return trimRight(s.substr(start));
}

[[nodiscard]] std::string_view trimRight(std::string_view s) noexcept
{
	const auto end = s.find_last_not_of(whitespaces);
	if (end == std::string_view::npos)
		return s.substr(0, 0);

	return s.substr(0, end+1);
}

[[nodiscard]] bool isBlank(std::string_view s) noexcept
{
	return s.find_first_not_of(whitespaces) == std::string_view::npos;
}

std::size_t replaceAll(std::string& s, std::string_view from, std::string_view to)
{
	if (from.empty()) [[unlikely]]
		throw Error("replaceAll() : cannot replace an empty string");

	std::size_t count = 0;
	for (std::size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size()))
	{
		s.replace(pos, from.size(), to);
		++count;
	}

	return count;
}

[[nodiscard]] std::vector<std::string_view> splitLines(std::string_view text)
{
	std::vector<std::string_view> lines;

	std::size_t start = 0;
	while (true)
	{
		const std::size_t end = text.find('\n', start);
		std::string_view line = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end-start);
		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);
		lines.push_back(line);

		if (end == std::string_view::npos)
			break;
		start = end+1;
	}

	return lines;
}

[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view sep)
{
	std::string r;
	bool first = true;
	for (const auto& part : parts)
	{
		if (!first)
			r.append(sep);
		r.append(part);
		first = false;
	}

	return r;
}

[[nodiscard]] std::optional<std::string> readFile(const std::filesystem::path& path)
{
	std::ifstream in(path, std::ios::binary);
	if (!in.good())
		return {};

	std::string content((std::istreambuf_iterator<char>(in)), (std::istreambuf_iterator<char>()));
	if (in.bad()) [[unlikely]]
		return {};

	return content;
}
