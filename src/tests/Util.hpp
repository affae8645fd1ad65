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

#ifndef TESTS_UTIL_HPP
#define TESTS_UTIL_HPP

#include <string>
#include <vector>
#include <random>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>

/**
 * @brief Generates a random word
 * Only letters (from several scripts) are used, so the word never contains markup
 *
 * @param mt Random source
 * @param len Word length (in codepoint, at least 1)
 */
std::string randomWord(std::mt19937& mt, std::size_t len);

/**
 * @brief Generates random lines of words
 *
 * @param mt Random source
 * @param words Number of words in the line (at least 1)
 */
std::string randomLine(std::mt19937& mt, std::size_t words);

namespace
{
	/**
	 * @brief Generates groups of lines
	 * Each value is a list of paragraphs, each paragraph a list of lines
	 */
	class ParagraphsGenerator : public Catch::Generators::IGenerator<std::vector<std::vector<std::string>>>
	{
		std::mt19937 m_mt;
		std::uniform_int_distribution<std::size_t> m_paragraphs;
		std::uniform_int_distribution<std::size_t> m_lines;
		std::uniform_int_distribution<std::size_t> m_words;

		std::vector<std::vector<std::string>> m_current;
		public:
		ParagraphsGenerator(std::size_t lo, std::size_t hi):
			m_mt(std::mt19937(std::random_device{}())),
			m_paragraphs(lo, hi),
			m_lines(1, 4),
			m_words(1, 8)
			{
				next();
			}

		const std::vector<std::vector<std::string>>& get() const override { return m_current; }

		bool next() override
		{
			m_current.resize(m_paragraphs(m_mt));
			for (auto& paragraph : m_current)
			{
				paragraph.resize(m_lines(m_mt));
				for (auto& line : paragraph)
					line = randomLine(m_mt, m_words(m_mt));
			}
			return true;
		}
	};

	Catch::Generators::GeneratorWrapper<std::vector<std::vector<std::string>>> paragraphs(std::size_t lo, std::size_t hi) {
		return Catch::Generators::GeneratorWrapper<std::vector<std::vector<std::string>>>(
				Catch::Detail::make_unique<ParagraphsGenerator>(lo, hi)
				);
	}
}

#endif // TESTS_UTIL_HPP
