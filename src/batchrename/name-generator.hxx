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
#include <string>
#include <string_view>
#include <system_error>

#include <cstdint>

#include "batchrename/scheme.hxx"

namespace batchrename
{
struct split_basename_extension_data final
{
    std::string basename;
    std::string extension;
    bool is_multipart_extension;
};
/**
 * Split a filename into its basename and extension,
 * unlike using std::filesystem::path::stem/std::filesystem::path::extension
 * this will support multi part extensions such as .tar.gz,.tar.zst,etc..
 * Leading dots do not start an extension, '.bashrc' has none.
 * Does not touch the filesystem.
 */
[[nodiscard]] split_basename_extension_data
split_basename_extension(const std::string_view filename) noexcept;

/**
 * Words are split on runs of whitespace, '_' and '-', separators are kept.
 * Short articles, conjunctions and prepositions stay lower case unless first or last.
 */
[[nodiscard]] std::string title_case(const std::string_view text) noexcept;

/**
 * start + index * step, zero padded to numbering.padding digits, never truncated.
 */
[[nodiscard]] std::string format_number(const std::uint64_t index,
                                        const numbering_options& numbering) noexcept;

/**
 * @brief generate_name
 *
 * - Compute the new filename for a file, pure and deterministic.
 *
 * @param[in] original Path of the file, only the filename is used.
 * @param[in] index Position of the file in the batch.
 * @param[in] scheme The naming scheme.
 *
 * @return The new filename without any directory component,
 * or error_code::invalid_scheme.
 */
[[nodiscard]] std::expected<std::string, std::error_code>
generate_name(const std::filesystem::path& original, const std::uint64_t index,
              const scheme& scheme) noexcept;
} // namespace batchrename
