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

#include <algorithm>
#include <expected>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <cstddef>

#include "batchrename/batch.hxx"
#include "batchrename/name-generator.hxx"
#include "batchrename/preview.hxx"
#include "batchrename/scheme.hxx"

std::expected<std::vector<batchrename::preview_pair>, std::error_code>
batchrename::preview(const std::span<const file_entry> batch, const scheme& scheme,
                     const std::size_t count) noexcept
{
    std::vector<preview_pair> pairs;
    pairs.reserve(std::min(count, batch.size()));

    for (const auto& entry : batch.first(std::min(count, batch.size())))
    {
        const auto new_name = generate_name(entry.path, entry.index, scheme);
        if (!new_name)
        {
            return std::unexpected(new_name.error());
        }

        pairs.push_back({entry.path.filename().string(), new_name.value()});
    }

    return pairs;
}
