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

#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

#include <cstdint>

#include "batchrename/error.hxx"
#include "batchrename/name-generator.hxx"
#include "batchrename/path-utils.hxx"

#include "logger.hxx"

namespace
{
void
copy_write_time(const std::filesystem::path& from, const std::filesystem::path& to) noexcept
{
    std::error_code ec;
    const auto time = std::filesystem::last_write_time(from, ec);
    if (!ec)
    {
        std::filesystem::last_write_time(to, time, ec);
    }
    if (ec)
    {
        logger::warn<logger::domain::apply>("failed to keep modification time of {}: {}",
                                            to.string(),
                                            ec.message());
    }
}

void
copy_write_times(const std::filesystem::path& from, const std::filesystem::path& to) noexcept
{
    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::symlink_status(from, ec)))
    {
        auto it = std::filesystem::recursive_directory_iterator(from, ec);
        for (const auto end = std::filesystem::recursive_directory_iterator(); !ec && it != end;
             it.increment(ec))
        {
            if (it->is_symlink(ec))
            {
                continue;
            }
            copy_write_time(it->path(), to / it->path().lexically_relative(from));
        }
    }
    else if (std::filesystem::is_symlink(std::filesystem::symlink_status(from, ec)))
    {
        return;
    }

    // after the children, creating entries changes a directory time
    copy_write_time(from, to);
}
} // namespace

std::string
batchrename::utils::path_key(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

std::filesystem::path
batchrename::utils::unique_path(const std::filesystem::path& path,
                                const std::filesystem::path& filename,
                                const std::string_view tag) noexcept
{
    const auto parts = split_basename_extension(filename.string());

    std::uint32_t n = 1;
    auto unique_path = path / std::format("{}{}", parts.basename, parts.extension);

    std::error_code ec;
    while (std::filesystem::exists(std::filesystem::symlink_status(unique_path, ec)))
    { // need to see broken symlinks
        unique_path = path / std::format("{}{}{}{}", parts.basename, tag, ++n, parts.extension);
    }

    return unique_path;
}

std::error_code
batchrename::utils::move_by_copy(const std::filesystem::path& from,
                                 const std::filesystem::path& to) noexcept
{
    std::error_code ec;

    std::filesystem::copy(from,
                          to,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::copy_symlinks,
                          ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove_all(to, ignored);
        return ec;
    }

    copy_write_times(from, to);

    const auto status = std::filesystem::symlink_status(from, ec);
    const bool directory = std::filesystem::is_directory(status);

    std::filesystem::remove_all(from, ec);
    if (ec)
    {
        if (directory)
        {
            // part of the source may be gone, the copy is the only complete one
            logger::error<logger::domain::apply>(
                "{} was only partly removed, complete copy kept at {}: {}",
                from.string(),
                to.string(),
                ec.message());
            return error_code::filesystem_other;
        }

        // a single entry is either removed or not
        std::error_code ignored;
        std::filesystem::remove_all(to, ignored);
        return ec;
    }

    return {};
}
