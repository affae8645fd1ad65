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

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "Util.hpp"
#include "mdhtml/Parser.hpp"
#include "mdhtml/Util.hpp"

using namespace std::literals;

/**
 * @brief Gets rendered lines of a block
 */
static std::vector<std::string> render(const Syntax::Block& block)
{
	std::vector<std::string> r;
	for (const auto& line : block.lines)
		r.push_back(std::string(line.indent, ' ') + line.html);
	return r;
}

TEST_CASE("Headers and paragraphs", "[parser]")
{
	const Parser parser;
	const Document doc = parser.parse(File{"notes/post.md", "# Title\n\nHello **world**"sv});

	REQUIRE(doc.title == "post");
	REQUIRE(doc.warnings.empty());
	REQUIRE(doc.blocks.size() == 2);
	REQUIRE(doc.blocks[0].type == Syntax::BlockType::HEADER);
	REQUIRE(doc.blocks[1].type == Syntax::BlockType::PARAGRAPH);
	REQUIRE(doc.body() == "  <h1>Title</h1>\n  <p>Hello <strong>world</strong></p>");
}

TEST_CASE("Paragraph lines are joined", "[parser]")
{
	const Parser parser;
	const Document doc = parser.parse(File{"a.md", "one\ntwo\n\n\nthree"sv});

	REQUIRE(doc.count(Syntax::BlockType::PARAGRAPH) == 2);
	REQUIRE(doc.body() == "  <p>one two</p>\n  <p>three</p>");
}

TEST_CASE("Header levels", "[parser]")
{
	const Parser parser(AttributeTable::tailwind());
	const Document doc = parser.parse(File{"a.md", "### Third\n\n####### Seven\n\n#NoSpace"sv});

	REQUIRE(doc.blocks.size() == 3);
	REQUIRE(doc.blocks[0].lines[0].html == "<h3 class=\"text-2xl text-red-900 mb-5 font-black uppercase\">Third</h3>");
	REQUIRE(doc.blocks[1].type == Syntax::BlockType::PARAGRAPH);
	REQUIRE(doc.blocks[2].type == Syntax::BlockType::PARAGRAPH);
}

TEST_CASE("Long lines", "[parser]")
{
	const Parser parser;
	const std::string text(100'000, 'a');

	SECTION("Header")
	{
		const Document doc = parser.parse(File{"a.md", "# " + text + " **b**"});
		REQUIRE(doc.blocks.size() == 1);
		REQUIRE(doc.blocks[0].lines[0].html == "<h1>" + text + " <strong>b</strong></h1>");
	}

	SECTION("List item")
	{
		const Document doc = parser.parse(File{"a.md", "- " + text + "\n  12. " + text});
		REQUIRE(render(doc.blocks[0]) == std::vector<std::string>{
			"  <ul>",
			"    <li>" + text + "</li>",
			"  <ol>",
			"    <li>" + text + "</li>",
			"  </ol>",
			"  </ul>",
		});
	}

	SECTION("Paragraph")
	{
		const Document doc = parser.parse(File{"a.md", text + "\n" + text});
		REQUIRE(doc.blocks[0].lines[0].html == "<p>" + text + " " + text + "</p>");
	}
}

TEST_CASE("Marker needs text after it", "[parser]")
{
	const Parser parser;
	const Document doc = parser.parse(File{"a.md", "# \n\n-\n\n1.x\n\n-x"sv});

	REQUIRE(doc.count(Syntax::BlockType::HEADER) == 0);
	REQUIRE(doc.count(Syntax::BlockType::LIST) == 0);
	REQUIRE(doc.count(Syntax::BlockType::PARAGRAPH) == 4);
}

TEST_CASE("Lists", "[parser]")
{
	const Parser parser;

	SECTION("Nested list")
	{
		const Document doc = parser.parse(File{"a.md", "- a\n  - b"sv});
		REQUIRE(doc.blocks.size() == 1);
		REQUIRE(doc.blocks[0].type == Syntax::BlockType::LIST);
		REQUIRE(render(doc.blocks[0]) == std::vector<std::string>{
			"  <ul>",
			"    <li>a</li>",
			"  <ul>",
			"    <li>b</li>",
			"  </ul>",
			"  </ul>",
		});
	}

	SECTION("Dedent")
	{
		const Document doc = parser.parse(File{"a.md", "1. one\n    * sub\n2. two"sv});
		REQUIRE(doc.count(Syntax::BlockType::LIST) == 1);
		REQUIRE(render(doc.blocks[0]) == std::vector<std::string>{
			"  <ol>",
			"    <li>one</li>",
			"  <ul>",
			"    <li>sub</li>",
			"  </ul>",
			"    <li>two</li>",
			"  </ol>",
		});
	}

	SECTION("Blank line between items")
	{
		const Document doc = parser.parse(File{"a.md", "- a\n\n- b\n\nafter"sv});
		REQUIRE(doc.blocks.size() == 2);
		REQUIRE(render(doc.blocks[0]) == std::vector<std::string>{"  <ul>", "    <li>a</li>", "    <li>b</li>", "  </ul>"});
		REQUIRE(doc.blocks[1].lines[0].html == "<p>after</p>");
	}

	SECTION("Text closes the list")
	{
		const Document doc = parser.parse(File{"a.md", "intro\n- *a*\ntext"sv});
		REQUIRE(doc.blocks.size() == 3);
		REQUIRE(doc.blocks[0].lines[0].html == "<p>intro</p>");
		REQUIRE(render(doc.blocks[1]) == std::vector<std::string>{"  <ul>", "    <li><em>a</em></li>", "  </ul>"});
		REQUIRE(doc.blocks[2].lines[0].html == "<p>text</p>");
	}

	SECTION("Header closes the list")
	{
		const Document doc = parser.parse(File{"a.md", "- a\n# H"sv});
		REQUIRE(doc.blocks.size() == 2);
		REQUIRE(doc.blocks[0].type == Syntax::BlockType::LIST);
		REQUIRE(doc.blocks[1].type == Syntax::BlockType::HEADER);
	}
}

TEST_CASE("Code blocks", "[parser]")
{
	const Parser parser;

	SECTION("Content is kept verbatim")
	{
		const Document doc = parser.parse(File{"a.md", "```cpp\nint **x**;\n  return x;\n```\ntext"sv});
		REQUIRE(doc.blocks.size() == 2);
		REQUIRE(doc.blocks[0].type == Syntax::BlockType::CODE);
		REQUIRE(doc.blocks[0].render() == "  <pre><code class=\"language-cpp\">int **x**;\n  return x;</code></pre>");
		REQUIRE(doc.blocks[1].type == Syntax::BlockType::PARAGRAPH);
	}

	SECTION("No language")
	{
		const Document doc = parser.parse(File{"a.md", "- item\n```\n# not a header\n```"sv});
		REQUIRE(doc.blocks.size() == 2);
		REQUIRE(doc.blocks[0].type == Syntax::BlockType::LIST);
		REQUIRE(doc.blocks[1].render() == "  <pre><code># not a header</code></pre>");
	}

	SECTION("Unterminated fence")
	{
		const Document doc = parser.parse(File{"post.md", "Intro\n\n```cpp\nint x;\n- y\n\n# z"sv});
		REQUIRE(doc.count(Syntax::BlockType::CODE) == 0);
		REQUIRE(doc.blocks.size() == 1);
		REQUIRE(doc.blocks[0].type == Syntax::BlockType::PARAGRAPH);
		REQUIRE(doc.warnings.size() == 1);
		REQUIRE(doc.warnings[0] == "post.md:3: Unterminated Code Block: fence is never closed, 4 line(s) discarded");
	}

	SECTION("Warning line accounts for front matter")
	{
		const Document doc = parser.parse(File{"post.md", "---\ntitle: T\n---\n```\nx"sv});
		REQUIRE(doc.blocks.empty());
		REQUIRE(doc.warnings.size() == 1);
		REQUIRE(doc.warnings[0].starts_with("post.md:4: "));
	}
}

TEST_CASE("Document title", "[parser]")
{
	const Parser parser;

	const Document titled = parser.parse(File{"dir/file.md", "---\ntitle: Foo\nauthor: Bar\n---\nBody"sv});
	REQUIRE(titled.title == "Foo");
	REQUIRE(*titled.metadata.get("author"sv) == "Bar");
	REQUIRE(titled.body() == "  <p>Body</p>");

	const Document untitled = parser.parse(File{"dir/file.md", "---\nauthor: Bar\n---\nBody"sv});
	REQUIRE(untitled.title == "file");
}

TEST_CASE("Parser keeps no state between documents", "[parser]")
{
	const Parser parser;

	const Document first = parser.parse(File{"a.md", "- a\n  - b\n```\ncode"sv});
	REQUIRE(first.warnings.size() == 1);

	const Document second = parser.parse(File{"b.md", "text"sv});
	REQUIRE(second.warnings.empty());
	REQUIRE(second.body() == "  <p>text</p>");
}

TEST_CASE("One paragraph per group of lines", "[parser]")
{
	const Parser parser;
	const auto groups = GENERATE(take(50, paragraphs(1, 10)));

	std::vector<std::string> text;
	for (const auto& group : groups)
		text.push_back(join(group, "\n"sv));
	const std::string source = join(text, "\n\n"sv);

	const Document doc = parser.parse(File{"random.md", source});
	REQUIRE(doc.blocks.size() == groups.size());
	REQUIRE(doc.count(Syntax::BlockType::PARAGRAPH) == groups.size());
	for (std::size_t i = 0; i < groups.size(); ++i)
		REQUIRE(doc.blocks[i].lines[0].html == "<p>" + join(groups[i], " "sv) + "</p>");
}
