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

#include <system_error>
#include <type_traits>

namespace batchrename
{
enum class error_code
{
    none,

    // validation
    invalid_scheme,
    name_collision,
    invalid_character,
    existing_file_conflict,

    // apply
    source_missing,
    permission_denied,
    filesystem_other,
    cancelled,
    blocked,
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] inline std::error_code
make_error_code(error_code e) noexcept
{
    return {static_cast<int>(e), batchrename::error_category()};
}

/**
 * Map an OS level error onto the apply time kinds,
 * errors already in batchrename::error_category() are returned unchanged.
 */
[[nodiscard]] std::error_code classify(const std::error_code& ec) noexcept;
} // namespace batchrename

template<> struct std::is_error_code_enum<batchrename::error_code> : std::true_type
{
};
