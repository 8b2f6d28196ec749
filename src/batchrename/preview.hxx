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
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <cstddef>

#include "batchrename/batch.hxx"
#include "batchrename/scheme.hxx"

namespace batchrename
{
struct preview_pair final
{
    std::string original_name;
    std::string new_name;
};

/**
 * The first count entries of the batch mapped through generate_name(),
 * min(count, batch.size()) pairs in batch order. No side effects.
 */
[[nodiscard]] std::expected<std::vector<preview_pair>, std::error_code>
preview(const std::span<const file_entry> batch, const scheme& scheme,
        const std::size_t count = 5) noexcept;
} // namespace batchrename
