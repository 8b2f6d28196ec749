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

#include <string_view>

namespace batchrename
{
struct package_t final
{
    std::string_view name = PACKAGE_NAME;
    std::string_view name_fancy = PACKAGE_NAME_FANCY;
    std::string_view version = PACKAGE_VERSION;
};

/**
 * @brief instance for package information
 */
inline constexpr package_t package{};
} // namespace batchrename
