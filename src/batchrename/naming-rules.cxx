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
#include <array>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <magic_enum/magic_enum.hpp>

#include <ztd/ztd.hxx>

#include "batchrename/naming-rules.hxx"

#include "logger.hxx"

namespace
{
constexpr std::string_view windows_forbidden_chars = R"(<>:"/\|?*)";

constexpr std::array<std::string_view, 22> windows_reserved_names{
    "CON",  "PRN",  "AUX",  "NUL",  "COM1", "COM2", "COM3", "COM4",
    "COM5", "COM6", "COM7", "COM8", "COM9", "LPT1", "LPT2", "LPT3",
    "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

std::optional<std::string>
check_posix(const std::string_view name) noexcept
{
    if (name.contains('/'))
    {
        return "contains '/'";
    }
    if (name.contains('\0'))
    {
        return "contains a NUL character";
    }
    return std::nullopt;
}

std::optional<std::string>
check_windows(const std::string_view name) noexcept
{
    for (const char c : name)
    {
        if (static_cast<unsigned char>(c) < 0x20)
        {
            return std::format("contains control character 0x{:02x}",
                               static_cast<unsigned char>(c));
        }
        if (windows_forbidden_chars.contains(c))
        {
            return std::format("contains '{}'", c);
        }
    }

    if (name.ends_with('.') || name.ends_with(' '))
    {
        return "ends with a dot or space";
    }

    // reserved with or without an extension, CON.txt is still CON
    const auto stem = ztd::upper(ztd::strip(name.substr(0, name.find('.'))));
    if (std::ranges::contains(windows_reserved_names, stem))
    {
        return std::format("'{}' is a reserved device name", stem);
    }

    return std::nullopt;
}
} // namespace

std::optional<std::string>
batchrename::check_filename(const std::string_view name, const filesystem_rules rules) noexcept
{
    if (name.empty())
    {
        return "empty name";
    }
    if (name == "." || name == "..")
    {
        return std::format("'{}' is reserved", name);
    }
    if (name.size() > max_name_length)
    {
        return std::format("name is {} bytes, limit is {}", name.size(), max_name_length);
    }

    if (const auto reason = check_posix(name); reason)
    {
        return reason;
    }

    if (rules == filesystem_rules::windows)
    {
        return check_windows(name);
    }

    return std::nullopt;
}

std::optional<std::string>
batchrename::check_path_length(const std::filesystem::path& path) noexcept
{
    const auto length = path.native().size();
    if (length > max_path_length)
    {
        return std::format("path is {} bytes, limit is {}", length, max_path_length);
    }
    return std::nullopt;
}

std::expected<batchrename::filesystem_rules, std::error_code>
batchrename::parse_filesystem_rules(const std::string_view name) noexcept
{
    const auto value = magic_enum::enum_cast<filesystem_rules>(ztd::lower(ztd::strip(name)));
    if (!value)
    {
        logger::warn<logger::domain::plan>("unrecognized filesystem rules: '{}'", name);
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return value.value();
}
