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

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace batchrename::utils
{
/**
 * Absolute, lexically normalized form of a path, used to compare paths
 * given relative to different bases. Does not resolve symlinks.
 */
[[nodiscard]] std::string path_key(const std::filesystem::path& path) noexcept;

/**
 * @brief unique_path
 *
 * - Create a unique path given a base path and a filename. If the filename already exists
 *   then the filename will be modified with an integer counter.
 *
 * @param[in] path The path the filename will be in, does not get modified. Must be a directory.
 * @param[in] filename The filename, if an file already exists with this name it will be modified.
 * @param[in] tag String to be appended before the numeric counter if a duplicate files exist.
 *
 * @return A unique path
 */
[[nodiscard]] std::filesystem::path unique_path(const std::filesystem::path& path,
                                                const std::filesystem::path& filename,
                                                const std::string_view tag = "") noexcept;

/**
 * @brief move_by_copy
 *
 * - Move between filesystems by copying then removing the source. Modification
 *   times are carried over. A failed copy removes its partial output.
 *
 * - A directory source that could only be partly removed keeps its copy at
 *   the destination, the error is then error_code::filesystem_other.
 *
 * @return std::error_code of the first failure, empty on success.
 */
[[nodiscard]] std::error_code move_by_copy(const std::filesystem::path& from,
                                           const std::filesystem::path& to) noexcept;
} // namespace batchrename::utils
