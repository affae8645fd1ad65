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
#include <algorithm>
#include <iterator>
#include <utility>
#include <array>
#include <utf8.h>

static constexpr std::array<std::pair<char32_t, char32_t>, 9> ranges = {
	std::make_pair<char32_t, char32_t>(U'a', U'z'),
	std::make_pair<char32_t, char32_t>(U'A', U'Z'),
	std::make_pair<char32_t, char32_t>(0xC0, 0xD6), // Latin-1 letters
	std::make_pair<char32_t, char32_t>(0xD8, 0xF6),
	std::make_pair<char32_t, char32_t>(0x391, 0x3A1), // Greek
	std::make_pair<char32_t, char32_t>(0x410, 0x44F), // Cyrillic
	std::make_pair<char32_t, char32_t>(0x3041, 0x3096), // Hiragana
	std::make_pair<char32_t, char32_t>(0x4E00, 0x9FA5), // CJK Unified Ideographs
	std::make_pair<char32_t, char32_t>(0xAC00, 0xD7A3), // Hangul Syllables
};

std::string randomWord(std::mt19937& mt, std::size_t len)
{
	auto getCodepoint = [&mt]() -> char32_t
	{
		std::uniform_int_distribution<std::size_t> distrib(0uz, ranges.size()-1uz);
		auto&& [lo, hi] = ranges[distrib(mt)];

		std::uniform_int_distribution<std::uint32_t> codepoint(lo, hi);
		return static_cast<char32_t>(codepoint(mt));
	};

	std::string r;
	for (std::size_t i = 0; i < std::max(len, 1uz); ++i)
		utf8::append(getCodepoint(), std::back_inserter(r));

	return r;
}

std::string randomLine(std::mt19937& mt, std::size_t words)
{
	std::uniform_int_distribution<std::size_t> length(1, 10);

	std::string r = randomWord(mt, length(mt));
	for (std::size_t i = 1; i < words; ++i)
		r.append(" ").append(randomWord(mt, length(mt)));

	return r;
}
