/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <cstdint>

namespace batchrename
{
enum class text_case : std::uint8_t
{
    preserve,
    lower,
    upper,
    title,
};

enum class number_position : std::uint8_t
{
    suffix,
    prefix,
};

struct numbering_options final
{
    bool enabled{false};
    std::int32_t padding{2};
    std::int32_t start{1};
    std::int32_t step{1};
    number_position position{number_position::suffix};
    std::string separator{"_"};
};

/**
 * The composed set of transformation rules used to compute a new name.
 * Applied in order: find/replace, case, prefix/suffix, numbering, extension.
 */
struct scheme final
{
    std::string prefix;
    std::string suffix;
    std::string find;
    std::string replace;
    text_case case_option{text_case::preserve};
    numbering_options numbering;
    // replaces the original base name and drops prefix/suffix,
    // an extension in the template replaces the original one
    std::optional<std::string> name_template{std::nullopt};
};

/**
 * @return error_code::invalid_scheme if the case option is not a known value or
 * the numbering fields are negative, error_code::none otherwise.
 */
[[nodiscard]] std::error_code validate(const scheme& scheme) noexcept;

/**
 * Parse a case option name, accepts "title case" as an alias of "title".
 */
[[nodiscard]] std::expected<text_case, std::error_code>
parse_text_case(const std::string_view name) noexcept;

[[nodiscard]] std::expected<number_position, std::error_code>
parse_number_position(const std::string_view name) noexcept;
} // namespace batchrename
