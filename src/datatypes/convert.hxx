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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

#include "batchrename/apply-engine.hxx"
#include "batchrename/batch.hxx"
#include "batchrename/naming-rules.hxx"
#include "batchrename/preview.hxx"
#include "batchrename/scheme.hxx"
#include "batchrename/validator.hxx"

#include "datatypes/datatypes.hxx"

namespace datatype
{
/**
 * A request with every field parsed into engine types.
 */
struct engine_request final
{
    std::vector<std::filesystem::path> files;
    batchrename::scheme scheme;
    std::optional<std::filesystem::path> destination{std::nullopt};
    batchrename::index_mode index_mode{batchrename::index_mode::selection};
    batchrename::filesystem_rules rules{batchrename::filesystem_rules::posix};
    batchrename::apply_options options;
    std::size_t preview_count{5};
    bool dry_run{false};
};

[[nodiscard]] std::expected<request, std::string> read_request(const std::string_view json) noexcept;
[[nodiscard]] std::expected<engine_request, std::string> to_engine(const request& request) noexcept;

[[nodiscard]] std::vector<response::preview_pair>
to_response(const std::span<const batchrename::preview_pair> preview) noexcept;
[[nodiscard]] response::conflict_report
to_response(const batchrename::conflict_report& report) noexcept;
[[nodiscard]] response::result to_response(const batchrename::apply_result& result) noexcept;
[[nodiscard]] response::apply_summary
to_response(const batchrename::apply_summary& summary) noexcept;

[[nodiscard]] std::expected<std::string, std::string>
write_response(const response::data& data) noexcept;
} // namespace datatype
