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

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include <cstdint>

#include <magic_enum/magic_enum.hpp>

#include <ztd/ztd.hxx>

#include "batchrename/error.hxx"
#include "batchrename/scheme.hxx"

#include "logger.hxx"

namespace
{
// a number wider than this can never fit in a filename
constexpr std::int32_t max_padding = 255;
} // namespace

std::error_code
batchrename::validate(const scheme& scheme) noexcept
{
    if (!magic_enum::enum_contains(scheme.case_option))
    {
        logger::warn<logger::domain::scheme>("unrecognized case option: {}",
                                             magic_enum::enum_integer(scheme.case_option));
        return error_code::invalid_scheme;
    }

    const auto& numbering = scheme.numbering;

    if (numbering.padding < 0 || numbering.padding > max_padding)
    {
        logger::warn<logger::domain::scheme>("numbering padding out of range: {}",
                                             numbering.padding);
        return error_code::invalid_scheme;
    }

    if (numbering.start < 0)
    {
        logger::warn<logger::domain::scheme>("numbering start is negative: {}", numbering.start);
        return error_code::invalid_scheme;
    }

    if (numbering.step < 0)
    {
        logger::warn<logger::domain::scheme>("numbering step is negative: {}", numbering.step);
        return error_code::invalid_scheme;
    }

    if (!magic_enum::enum_contains(numbering.position))
    {
        logger::warn<logger::domain::scheme>("unrecognized number position: {}",
                                             magic_enum::enum_integer(numbering.position));
        return error_code::invalid_scheme;
    }

    return error_code::none;
}

std::expected<batchrename::text_case, std::error_code>
batchrename::parse_text_case(const std::string_view name) noexcept
{
    const auto lowered = ztd::lower(ztd::strip(name));
    if (lowered == "title case")
    {
        return text_case::title;
    }

    const auto value = magic_enum::enum_cast<text_case>(lowered);
    if (!value)
    {
        logger::warn<logger::domain::scheme>("unrecognized case option: '{}'", name);
        return std::unexpected(error_code::invalid_scheme);
    }
    return value.value();
}

std::expected<batchrename::number_position, std::error_code>
batchrename::parse_number_position(const std::string_view name) noexcept
{
    const auto value = magic_enum::enum_cast<number_position>(ztd::lower(ztd::strip(name)));
    if (!value)
    {
        logger::warn<logger::domain::scheme>("unrecognized number position: '{}'", name);
        return std::unexpected(error_code::invalid_scheme);
    }
    return value.value();
}
