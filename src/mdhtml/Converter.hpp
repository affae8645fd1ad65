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

#ifndef MDHTML_CONVERTER_HPP
#define MDHTML_CONVERTER_HPP

#include "Compiler.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace Errors
{
	struct MissingInput { std::string path; };
	struct MissingTemplate { std::string path; };
	struct InvalidTemplate { std::string message; };
	struct ConversionFailure { std::string message; };
} // Errors

/**
 * @brief Reason a conversion failed
 */
using ConvertError = std::variant<
	Errors::MissingInput,
	Errors::MissingTemplate,
	Errors::InvalidTemplate,
	Errors::ConversionFailure>;

/**
 * @brief Gets a message for an error
 *
 * @param err Error
 * @returns Human readable message
 */
[[nodiscard]] std::string describe(const ConvertError& err);

/**
 * @brief Options for a conversion
 */
struct ConvertOptions
{
	std::optional<std::filesystem::path> template_path; ///< Template to fill, default page if unset
	CompilerOptions compiler; ///< Options passed to the compiler
};

/**
 * @brief Converts a markdown file to html
 *
 * The output file is only written once the whole document has been compiled.
 *
 * @param input Markdown file
 * @param output Html file to write
 * @param opts Conversion options
 * @param log Stream parsing warnings are written to
 * @returns Nothing on success, the reason of the failure otherwise
 */
[[nodiscard]] std::optional<ConvertError> convertFile(
		const std::filesystem::path& input,
		const std::filesystem::path& output,
		const ConvertOptions& opts,
		std::ostream& log);

#endif // MDHTML_CONVERTER_HPP
