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
#include <system_error>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "batchrename/batch.hxx"
#include "batchrename/naming-rules.hxx"
#include "batchrename/scheme.hxx"

namespace batchrename
{
struct plan_item final
{
    std::filesystem::path original_path;
    std::string new_name;
    std::filesystem::path new_path;
    std::uint64_t index;

    bool operator==(const plan_item&) const = default;
};

struct conflict_entry final
{
    std::filesystem::path original_path;
    std::filesystem::path new_path;
    std::string reason;

    bool operator==(const conflict_entry&) const = default;
};

struct duplicate_group final
{
    std::string new_name;
    std::vector<conflict_entry> members;

    bool operator==(const duplicate_group&) const = default;
};

struct conflict_report final
{
    std::vector<duplicate_group> duplicates;
    std::vector<conflict_entry> invalid_chars;
    std::vector<conflict_entry> existing_files;

    [[nodiscard]] bool
    empty() const noexcept
    {
        return duplicates.empty() && invalid_chars.empty() && existing_files.empty();
    }

    bool operator==(const conflict_report&) const = default;
};

class rename_plan;

/**
 * @brief make_plan
 *
 * - Compute the new name and path of every file in the batch and check the
 *   result for duplicate names, unusable names and existing files in the way.
 *   Reads the filesystem, never modifies it.
 *
 * @param[in] batch The finalized batch, see make_batch().
 * @param[in] scheme The naming scheme.
 * @param[in] destination Folder the files are moved into, the files stay in
 * their own folder if not set.
 * @param[in] rules Naming rules of the target filesystem.
 *
 * @return The plan with its conflict report, or error_code::invalid_scheme.
 */
[[nodiscard]] std::expected<rename_plan, std::error_code>
make_plan(const std::span<const file_entry> batch, const scheme& scheme,
          const std::optional<std::filesystem::path>& destination = std::nullopt,
          const filesystem_rules rules = filesystem_rules::posix) noexcept;

/**
 * make_plan() reduced to its conflict report, empty when the plan can be applied.
 */
[[nodiscard]] std::expected<conflict_report, std::error_code>
check(const std::span<const file_entry> batch, const scheme& scheme,
      const std::optional<std::filesystem::path>& destination = std::nullopt,
      const filesystem_rules rules = filesystem_rules::posix) noexcept;

class rename_plan final
{
  public:
    [[nodiscard]] const std::vector<plan_item>&
    items() const noexcept
    {
        return this->items_;
    }

    [[nodiscard]] const std::optional<std::filesystem::path>&
    destination() const noexcept
    {
        return this->destination_;
    }

    [[nodiscard]] const conflict_report&
    report() const noexcept
    {
        return this->report_;
    }

    [[nodiscard]] std::size_t
    size() const noexcept
    {
        return this->items_.size();
    }

    [[nodiscard]] bool
    empty() const noexcept
    {
        return this->items_.empty();
    }

  private:
    rename_plan(std::vector<plan_item>&& items,
                const std::optional<std::filesystem::path>& destination,
                conflict_report&& report) noexcept
        : items_(std::move(items)), destination_(destination), report_(std::move(report))
    {
    }

    friend std::expected<rename_plan, std::error_code>
    make_plan(const std::span<const file_entry> batch, const scheme& scheme,
              const std::optional<std::filesystem::path>& destination,
              const filesystem_rules rules) noexcept;

    std::vector<plan_item> items_;
    std::optional<std::filesystem::path> destination_;
    conflict_report report_;
};
} // namespace batchrename
