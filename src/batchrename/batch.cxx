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
#include <filesystem>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <vector>

#include <cstdint>

#include <magic_enum/magic_enum.hpp>

#include <ztd/ztd.hxx>

#include "batchrename/batch.hxx"
#include "batchrename/path-utils.hxx"

#include "logger.hxx"

namespace
{
std::vector<std::filesystem::path>
unique_selection(const std::span<const std::filesystem::path> selected) noexcept
{
    std::vector<std::filesystem::path> files;
    files.reserve(selected.size());

    std::unordered_set<std::string> seen;
    for (const auto& path : selected)
    {
        if (!seen.insert(batchrename::utils::path_key(path)).second)
        {
            logger::warn<logger::domain::plan>("dropping repeated selection: {}", path.string());
            continue;
        }
        files.push_back(path);
    }
    return files;
}

std::vector<std::string>
list_directory(const std::filesystem::path& directory) noexcept
{
    std::vector<std::string> names;

    std::error_code ec;
    auto it = std::filesystem::directory_iterator(directory, ec);
    if (ec)
    {
        logger::warn<logger::domain::plan>("failed to list {}: {}",
                                           directory.string(),
                                           ec.message());
        return names;
    }

    for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec))
    {
        if (ec)
        {
            logger::warn<logger::domain::plan>("failed to list {}: {}",
                                               directory.string(),
                                               ec.message());
            break;
        }
        names.push_back(it->path().filename().string());
    }

    std::ranges::sort(names);
    return names;
}
} // namespace

std::vector<batchrename::file_entry>
batchrename::make_batch(const std::span<const std::filesystem::path> selected,
                        const index_mode mode) noexcept
{
    const auto files = unique_selection(selected);

    std::vector<file_entry> batch;
    batch.reserve(files.size());

    if (mode == index_mode::selection)
    {
        for (const auto [index, path] : std::views::enumerate(files))
        {
            batch.push_back({path, static_cast<std::uint64_t>(index)});
        }
        return batch;
    }

    // parent folders in order of first appearance
    std::vector<std::filesystem::path> directories;
    for (const auto& path : files)
    {
        const auto parent = path.parent_path();
        if (!std::ranges::contains(directories, parent))
        {
            directories.push_back(parent);
        }
    }

    std::uint64_t offset = 0;
    for (const auto& directory : directories)
    {
        const auto listing = list_directory(directory.empty() ? "." : directory);

        // selected files missing from the listing are numbered after it
        std::uint64_t unlisted = 0;
        for (const auto& path : files)
        {
            if (path.parent_path() != directory)
            {
                continue;
            }

            const auto it = std::ranges::lower_bound(listing, path.filename().string());
            if (it != listing.cend() && *it == path.filename().string())
            {
                const auto position = static_cast<std::uint64_t>(it - listing.cbegin());
                batch.push_back({path, offset + position});
            }
            else
            {
                batch.push_back({path, offset + listing.size() + unlisted});
                unlisted += 1;
            }
        }

        offset += listing.size() + unlisted;
    }

    std::ranges::sort(batch, {}, &file_entry::index);

    logger::debug<logger::domain::plan>("batch of {} files over {} folders",
                                        batch.size(),
                                        directories.size());

    return batch;
}

std::expected<batchrename::index_mode, std::error_code>
batchrename::parse_index_mode(const std::string_view name) noexcept
{
    const auto value = magic_enum::enum_cast<index_mode>(ztd::lower(ztd::strip(name)));
    if (!value)
    {
        logger::warn<logger::domain::plan>("unrecognized index mode: '{}'", name);
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return value.value();
}
