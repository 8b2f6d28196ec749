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
#include <filesystem>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include <cstdint>

namespace batchrename
{
enum class index_mode : std::uint8_t
{
    selection, // position among the selected files
    listing,   // position in the parent folder listing
};

struct file_entry final
{
    std::filesystem::path path;
    std::uint64_t index;
};

/**
 * @brief make_batch
 *
 * - Finalize a selection into a batch, assigning every file its index once.
 *   Repeated selections of the same path are dropped.
 *
 * @param[in] selected The selected files, in selection order.
 * @param[in] mode How indices are assigned. index_mode::listing reads the parent
 * folders, folders are numbered one after another in order of first appearance
 * and the batch is returned sorted by index.
 *
 * @return The batch, indices strictly increasing.
 */
[[nodiscard]] std::vector<file_entry>
make_batch(const std::span<const std::filesystem::path> selected,
           const index_mode mode = index_mode::selection) noexcept;

[[nodiscard]] std::expected<index_mode, std::error_code>
parse_index_mode(const std::string_view name) noexcept;
} // namespace batchrename
