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

#include "Parser.hpp"
#include "FrontMatter.hpp"
#include "Util.hpp"

#include <filesystem>
#include <optional>
#include <fmt/format.h>

using namespace std::literals;

static constexpr std::string_view fence = "```"sv;

/**
 * @brief Header or list item marker found at the start of a line
 */
struct LineMatch
{
	std::size_t size; ///< Header level, or leading whitespace of list items
	bool ordered; ///< Whether list item is `N.`
	std::string_view content; ///< Text after the marker (never empty)
};

[[nodiscard]] static bool isSpace(char c) noexcept
{
	return " \t\r\n\f\v"sv.find(c) != std::string_view::npos;
}

[[nodiscard]] static bool isDigit(char c) noexcept
{
	return c >= '0' && c <= '9';
}

/**
 * @brief Matches `#{1,6} text`
 */
[[nodiscard]] static std::optional<LineMatch> matchHeader(std::string_view line) noexcept
{
	std::size_t level = 0;
	while (level < line.size() && line[level] == '#')
		++level;

	if (level == 0 || level > 6 || level+1 >= line.size() || !isSpace(line[level]))
		return {};

	return LineMatch{level, false, line.substr(level+1)};
}

/**
 * @brief Matches `- text`, `* text` and `N. text`, with any indentation
 */
[[nodiscard]] static std::optional<LineMatch> matchListItem(std::string_view line) noexcept
{
	std::size_t indent = 0;
	while (indent < line.size() && isSpace(line[indent]))
		++indent;

	std::size_t pos = indent;
	bool ordered = false;
	if (pos < line.size() && (line[pos] == '-' || line[pos] == '*'))
		++pos;
	else
	{
		while (pos < line.size() && isDigit(line[pos]))
			++pos;
		if (pos == indent || pos >= line.size() || line[pos] != '.')
			return {};
		++pos;
		ordered = true;
	}

	if (pos+1 >= line.size() || !isSpace(line[pos]))
		return {};

	return LineMatch{indent, ordered, line.substr(pos+1)};
}

[[nodiscard]] Parser::Parser(const AttributeTable& attrs):
	m_attrs{attrs},
	m_inline{m_attrs}
{
}

[[nodiscard]] bool Parser::is_list_item(std::string_view line) const
{
	return matchListItem(line).has_value();
}

void Parser::flush(ParserData& data) const
{
	if (data.pending.empty())
		return;

	Syntax::Block block;
	const Syntax::FragmentType first = data.pending.front().type;
	if (Syntax::isListFragment(first))
	{
		block.type = Syntax::BlockType::LIST;
		for (auto& frag : data.pending)
			block.lines.push_back({frag.type == Syntax::FragmentType::LIST_ITEM ? ITEM_INDENT : BLOCK_INDENT, std::move(frag.html)});
	}
	else
	{
		std::string content;
		for (const auto& frag : data.pending)
		{
			if (!content.empty())
				content.push_back(' ');
			content.append(frag.html);
		}

		// A group starting with a header is left unwrapped
		if (first == Syntax::FragmentType::TEXT)
		{
			block.type = Syntax::BlockType::PARAGRAPH;
			content = fmt::format("<p{}>{}</p>", m_attrs.get(Element::PARAGRAPH), content);
		}
		else
			block.type = Syntax::BlockType::HEADER;

		block.lines.push_back({BLOCK_INDENT, std::move(content)});
	}

	data.blocks.push_back(std::move(block));
	data.pending.clear();
}

void Parser::closeList(ParserData& data) const
{
	if (data.list.empty())
		return;

	data.list.close(data.pending);
	flush(data);
}

void Parser::parseLine(std::string_view line, ParserData& data) const
{
	if (const auto header = matchHeader(line))
	{
		closeList(data);

		data.pending.push_back({Syntax::FragmentType::HEADER,
			fmt::format("<h{0}{1}>{2}</h{0}>", header->size, m_attrs.header(header->size), m_inline.format(header->content))});
		return;
	}

	if (const auto item = matchListItem(line))
	{
		// Paragraph or header in progress
		if (!data.pending.empty() && !Syntax::isListFragment(data.pending.front().type))
			flush(data);

		data.list.item(item->size, item->ordered, m_inline.format(item->content), data.pending);
		return;
	}

	closeList(data);
	data.pending.push_back({Syntax::FragmentType::TEXT, m_inline.format(line)});
}

[[nodiscard]] std::vector<Syntax::Block> Parser::parse_blocks(const File& f, std::string_view body,
		std::size_t first_line, std::vector<std::string>& warnings) const
{
	ParserData data(m_attrs);

	const std::vector<std::string_view> lines = splitLines(body);
	for (std::size_t i = 0; i < lines.size(); ++i)
	{
		const std::string_view line = lines[i];

		//{{{ Code blocks
		if (const std::string_view trimmed = trim(line); trimmed.starts_with(fence))
		{
			if (!data.in_fence)
			{
				closeList(data);
				flush(data);

				data.in_fence = true;
				data.fence_lang = std::string(trim(trimmed.substr(fence.size())));
				data.fence_line = first_line + i;
				data.code.clear();
			}
			else
			{
				const std::string lang_attr = data.fence_lang.empty()
					? ""s
					: fmt::format(" class=\"language-{}\"", data.fence_lang);
				const std::string html = fmt::format("<pre><code{}>{}</code></pre>", lang_attr, join(data.code, "\n"sv));

				// Only the opening tag is indented, anything else belongs to <pre>
				Syntax::Block block{Syntax::BlockType::CODE, {}};
				for (const auto part : splitLines(html))
					block.lines.push_back({block.lines.empty() ? BLOCK_INDENT : 0, std::string(part)});
				data.blocks.push_back(std::move(block));

				data.in_fence = false;
				data.code.clear();
			}
			continue;
		}

		if (data.in_fence)
		{
			data.code.emplace_back(line);
			continue;
		}
		//}}}

		if (isBlank(line))
		{
			// The list goes on after the blank line
			const bool next_is_item = i+1 < lines.size() && is_list_item(lines[i+1]);
			if (!data.list.empty() && next_is_item)
				continue;

			closeList(data);
			flush(data);
			continue;
		}

		parseLine(line, data);
	}

	if (data.in_fence) [[unlikely]]
	{
		warnings.push_back(fmt::format("{}:{}: Unterminated Code Block: fence is never closed, {} line(s) discarded",
			f.name, data.fence_line + 1, data.code.size()));
		data.code.clear();
	}

	closeList(data);
	flush(data);

	return std::move(data.blocks);
}

[[nodiscard]] Document Parser::parse(const File& f) const
{
	FrontMatter fm = extractFrontMatter(f.content);

	Document doc;
	doc.blocks = parse_blocks(f, fm.body, fm.body_line, doc.warnings);
	doc.title = fm.metadata.get_default("title"sv, defaultTitle(f.name));
	doc.metadata = std::move(fm.metadata);

	return doc;
}

[[nodiscard]] std::string Parser::defaultTitle(std::string_view path)
{
	return std::filesystem::path(path).stem().string();
}
