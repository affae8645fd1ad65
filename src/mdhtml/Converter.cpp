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

#include "Converter.hpp"
#include "HTMLCompiler.hpp"
#include "TemplateCompiler.hpp"
#include "Parser.hpp"
#include "Util.hpp"

#include <fstream>
#include <memory>
#include <fmt/format.h>

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

[[nodiscard]] std::string describe(const ConvertError& err)
{
	return std::visit(overloaded{
		[](const Errors::MissingInput& e) { return fmt::format("Input file not found: {}", e.path); },
		[](const Errors::MissingTemplate& e) { return fmt::format("Template file not found: {}", e.path); },
		[](const Errors::InvalidTemplate& e) { return fmt::format("Error applying template: {}", e.message); },
		[](const Errors::ConversionFailure& e) { return e.message; },
	}, err);
}

[[nodiscard]] static std::unique_ptr<Compiler> makeCompiler(const ConvertOptions& opts)
{
	CompilerOptions copts = opts.compiler;
	if (!opts.template_path)
		return std::make_unique<HTMLCompiler>(std::move(copts));

	auto templ = readFile(*opts.template_path);
	if (!templ) [[unlikely]]
		return nullptr;

	return std::make_unique<TemplateCompiler>(std::move(copts), std::move(*templ));
}

[[nodiscard]] std::optional<ConvertError> convertFile(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const ConvertOptions& opts,
		std::ostream& log)
{
	try
	{
		const auto content = readFile(input);
		if (!content)
			return Errors::MissingInput{input.string()};

		std::unique_ptr<Compiler> compiler;
		try
		{
			compiler = makeCompiler(opts);
		}
		catch (TemplateError& e)
		{
			return Errors::InvalidTemplate{e.what()};
		}
		if (!compiler)
			return Errors::MissingTemplate{opts.template_path->string()};

		const Parser parser(opts.compiler.attributes);
		const Document doc = parser.parse(File{input.string(), *content});
		for (const auto& warning : doc.warnings)
		{
			if (Colors::enabled)
				log << Colors::yellow << "Warning: " << Colors::reset << warning << '\n';
			else
				log << "Warning: " << warning << '\n';
		}

		const std::string html = compiler->compile(doc);

		std::ofstream out(output, std::ios::binary);
		if (!out.good())
			return Errors::ConversionFailure{fmt::format("Unable to open output file '{}'", output.string())};
		out.write(html.data(), static_cast<std::streamsize>(html.size()));
		out.close();
		if (out.fail())
			return Errors::ConversionFailure{fmt::format("Unable to write output file '{}'", output.string())};
	}
	catch (Error& e)
	{
		log << e.where() << '\n';
		return Errors::ConversionFailure{e.what()};
	}
	catch (std::exception& e)
	{
		return Errors::ConversionFailure{e.what()};
	}

	return {};
}
