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
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <cstddef>
#include <cstdint>

namespace batchrename
{
enum class filesystem_rules : std::uint8_t
{
    posix,
    windows, // FAT, NTFS, exFAT and SMB targets
};

inline constexpr std::size_t max_name_length = 255;  // bytes, NAME_MAX
inline constexpr std::size_t max_path_length = 4095; // bytes, PATH_MAX without the terminator

/**
 * @return why the filename cannot be used under the given rules,
 * std::nullopt if it can.
 */
[[nodiscard]] std::optional<std::string> check_filename(const std::string_view name,
                                                        const filesystem_rules rules) noexcept;

[[nodiscard]] std::optional<std::string>
check_path_length(const std::filesystem::path& path) noexcept;

[[nodiscard]] std::expected<filesystem_rules, std::error_code>
parse_filesystem_rules(const std::string_view name) noexcept;
} // namespace batchrename
