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

#ifndef MDHTML_INLINE_HPP
#define MDHTML_INLINE_HPP

#include "Attributes.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Inline substitutions (emphasis, images, links, code spans)
 *
 * Rules are applied in order, each one as a single left to right pass over
 * the output of the previous rule. A rule never re-scans its own output.
 */
class InlineFormatter
{
public:
	/**
	 * @brief Represents a substitution
	 *
	 * Matches `open first close`, or `open first middle second close` when
	 * `middle` is set. Captures are the shortest possible.
	 */
	struct Rule
	{
		/**
		 * @brief Text captured by a rule
		 */
		struct Capture
		{
			std::string_view first;
			std::string_view second;
			std::size_t end; ///< Position after the closing delimiter
		};

		using Callback = std::function<std::string(std::string_view, std::string_view)>;

		std::string name; ///< Rule name (for displaying)
		std::string open; ///< Opening delimiter
		std::string middle; ///< Delimiter between captures, empty for single capture rules
		std::string close; ///< Closing delimiter
		std::size_t min_length; ///< Minimum length of each capture
		Callback callback; ///< Builds html from the captures

		/**
		 * @brief Constructor
		 *
		 * @param name Rule name
		 * @param open Opening delimiter (non empty)
		 * @param middle Separator between the two captures (may be empty)
		 * @param close Closing delimiter (non empty)
		 * @param min_length Minimum length of captures
		 * @param callback Html builder
		 */
		[[nodiscard]] Rule(std::string&& name, std::string&& open, std::string&& middle, std::string&& close,
				std::size_t min_length, Callback&& callback);

		/**
		 * @brief Tries to match at a position
		 *
		 * @param text Text to match
		 * @param pos Position of the opening delimiter
		 * @returns Captures if the rule matches at pos
		 */
		[[nodiscard]] std::optional<Capture> match(std::string_view text, std::size_t pos) const;

		/**
		 * @brief Replaces every match in text
		 *
		 * @param text Text to process
		 * @returns Text with matches replaced
		 */
		[[nodiscard]] std::string apply(std::string_view text) const;
	};

private:
	std::vector<Rule> m_rules;

public:
	/**
	 * @brief Constructor
	 * Initializes rules: bold, italic, image, link, inline code
	 *
	 * @param attrs Attributes to put on generated elements
	 */
	[[nodiscard]] explicit InlineFormatter(const AttributeTable& attrs);

	/**
	 * @brief Formats a line
	 *
	 * @param line Line to format
	 * @returns Html fragment
	 */
	[[nodiscard]] std::string format(std::string_view line) const;

	/**
	 * @brief Gets rules, in application order
	 */
	[[nodiscard]] const std::vector<Rule>& rules() const noexcept { return m_rules; }
};

#endif // MDHTML_INLINE_HPP
