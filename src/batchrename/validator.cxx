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

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <ztd/ztd.hxx>

#include "batchrename/batch.hxx"
#include "batchrename/name-generator.hxx"
#include "batchrename/naming-rules.hxx"
#include "batchrename/path-utils.hxx"
#include "batchrename/scheme.hxx"
#include "batchrename/validator.hxx"

#include "logger.hxx"

namespace
{
std::vector<batchrename::duplicate_group>
find_duplicates(const std::span<const batchrename::plan_item> items,
                const batchrename::filesystem_rules rules) noexcept
{
    // windows targets do not distinguish case
    const auto group_key = [rules](const std::string& name)
    { return rules == batchrename::filesystem_rules::windows ? ztd::lower(name) : name; };

    std::vector<batchrename::duplicate_group> groups;
    std::unordered_map<std::string, std::size_t> lookup;
    for (const auto& item : items)
    {
        const auto key = group_key(item.new_name);
        if (!lookup.contains(key))
        {
            lookup.insert({key, groups.size()});
            groups.push_back({.new_name = item.new_name, .members = {}});
        }

        groups[lookup.at(key)].members.push_back({
            .original_path = item.original_path,
            .new_path = item.new_path,
            .reason = std::format("'{}' is the target of more than one file", item.new_name),
        });
    }

    std::erase_if(groups, [](const auto& group) { return group.members.size() < 2; });
    return groups;
}

std::vector<batchrename::conflict_entry>
find_invalid_names(const std::span<const batchrename::plan_item> items,
                   const batchrename::filesystem_rules rules) noexcept
{
    std::vector<batchrename::conflict_entry> invalid;
    for (const auto& item : items)
    {
        auto reason = batchrename::check_filename(item.new_name, rules);
        if (!reason)
        {
            reason = batchrename::check_path_length(item.new_path);
        }

        if (reason)
        {
            invalid.push_back({
                .original_path = item.original_path,
                .new_path = item.new_path,
                .reason = reason.value(),
            });
        }
    }
    return invalid;
}

std::vector<batchrename::conflict_entry>
find_existing_files(const std::span<const batchrename::plan_item> items) noexcept
{
    // files that are part of the batch will be moved out of the way
    std::unordered_set<std::string> sources;
    for (const auto& item : items)
    {
        sources.insert(batchrename::utils::path_key(item.original_path));
    }

    std::vector<batchrename::conflict_entry> existing;
    for (const auto& item : items)
    {
        std::error_code ec;
        // need to see broken symlinks
        const auto status = std::filesystem::symlink_status(item.new_path, ec);
        if (!std::filesystem::exists(status))
        {
            continue;
        }

        if (sources.contains(batchrename::utils::path_key(item.new_path)))
        {
            continue;
        }

        // case only rename on a case insensitive filesystem
        if (std::filesystem::equivalent(item.original_path, item.new_path, ec) && !ec)
        {
            continue;
        }

        existing.push_back({
            .original_path = item.original_path,
            .new_path = item.new_path,
            .reason = std::format("'{}' already exists", item.new_path.string()),
        });
    }
    return existing;
}
} // namespace

std::expected<batchrename::rename_plan, std::error_code>
batchrename::make_plan(const std::span<const file_entry> batch, const scheme& scheme,
                       const std::optional<std::filesystem::path>& destination,
                       const filesystem_rules rules) noexcept
{
    std::vector<plan_item> items;
    items.reserve(batch.size());

    for (const auto& entry : batch)
    {
        const auto new_name = generate_name(entry.path, entry.index, scheme);
        if (!new_name)
        {
            return std::unexpected(new_name.error());
        }

        const auto directory = destination ? destination.value() : entry.path.parent_path();

        items.push_back({
            .original_path = entry.path,
            .new_name = new_name.value(),
            .new_path = directory / new_name.value(),
            .index = entry.index,
        });
    }

    conflict_report report{
        .duplicates = find_duplicates(items, rules),
        .invalid_chars = find_invalid_names(items, rules),
        .existing_files = find_existing_files(items),
    };

    logger::info_if<logger::domain::plan>(!report.empty(),
                                          "conflicts: {} duplicate names, {} invalid names, {} "
                                          "existing files",
                                          report.duplicates.size(),
                                          report.invalid_chars.size(),
                                          report.existing_files.size());
    logger::debug<logger::domain::plan>("planned {} renames", items.size());

    return rename_plan(std::move(items), destination, std::move(report));
}

std::expected<batchrename::conflict_report, std::error_code>
batchrename::check(const std::span<const file_entry> batch, const scheme& scheme,
                   const std::optional<std::filesystem::path>& destination,
                   const filesystem_rules rules) noexcept
{
    const auto plan = make_plan(batch, scheme, destination, rules);
    if (!plan)
    {
        return std::unexpected(plan.error());
    }
    return plan->report();
}
