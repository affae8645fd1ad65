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

#include <cxxopts.hpp>
#include <cstdlib>
#include <iostream>

#include "mdhtml/Converter.hpp"
#include "mdhtml/Util.hpp"

static constexpr const char* usage = "Usage: mdhtml <input_file> <output_file> [--template <path>]";

int main(int argc, char* argv[])
{
	cxxopts::Options opts("mdhtml", "Converts markdown documents to html");

	std::string in_file, out_file, template_file, classes, stylesheet;
	opts.add_options()
		("h,help",    "Displays help", cxxopts::value<bool>()->default_value("false"))
		("v,version", "Displays version", cxxopts::value<bool>()->default_value("false"))
		("input", "Input markdown file", cxxopts::value<std::string>(in_file))
		("output", "Output html file", cxxopts::value<std::string>(out_file))
		("t,template", "Template file, must contain {{content}}", cxxopts::value<std::string>(template_file))
		("c,classes", "Attributes preset (plain, tailwind)", cxxopts::value<std::string>(classes)->default_value("plain"))
		("s,stylesheet", "Stylesheet linked by the default page", cxxopts::value<std::string>(stylesheet)->default_value("./styles/style.css"))
		("no-colors", "Disables colors in messages", cxxopts::value<bool>()->default_value("false"));
	opts.parse_positional({"input", "output"});
	opts.positional_help("<input_file> <output_file>");

	decltype(opts.parse(argc, argv)) result;
	try
	{
		result = opts.parse(argc, argv);
	}
	catch (cxxopts::option_not_exists_exception& e)
	{
		std::cerr << e.what() << '\n' << usage << std::endl;
		return EXIT_FAILURE;
	}
	catch (cxxopts::option_syntax_exception& e)
	{
		std::cerr << e.what() << '\n' << usage << std::endl;
		return EXIT_FAILURE;
	}
	catch (cxxopts::missing_argument_exception& e)
	{
		std::cerr << e.what() << '\n' << usage << std::endl;
		return EXIT_FAILURE;
	}

	if (result.count("help"))
	{
		std::cout << opts.help() << std::endl;
		return EXIT_SUCCESS;
	}

	if (result.count("version"))
	{
		std::cout << "mdhtml v0.1\n"
			<< "License: GNU Affero General Public License version 3 (AGPLv3)\n"
			<< "see <https://www.gnu.org/licenses/agpl-3.0.en.html>\n"
			<< "This is free software: you are free to change and redistribute it.\n"
			<< "There is NO WARRANTY, to the extent permitted by law.\n";
		return EXIT_SUCCESS;
	}

	Colors::enabled = !result.count("no-colors");

	if (!result.count("input") || !result.count("output"))
	{
		std::cout << usage << std::endl;
		return EXIT_FAILURE;
	}

	ConvertOptions copts;
	const auto attributes = AttributeTable::preset(classes);
	if (!attributes)
	{
		std::cerr << "Unknown classes preset: '" << classes << "'." << '\n' << usage << std::endl;
		return EXIT_FAILURE;
	}
	copts.compiler.attributes = *attributes;
	copts.compiler.stylesheet = stylesheet;
	if (result.count("template"))
		copts.template_path = template_file;

	if (const auto err = convertFile(in_file, out_file, copts, std::cerr))
	{
		if (Colors::enabled)
			std::cout << Colors::red << "Error: " << Colors::reset << describe(*err) << '\n';
		else
			std::cout << "Error: " << describe(*err) << '\n';
		std::cout << "Failed to convert" << std::endl;
	}
	else if (Colors::enabled)
		std::cout << Colors::green << "Converted!" << Colors::reset << std::endl;
	else
		std::cout << "Converted!" << std::endl;

	return EXIT_SUCCESS;
}
