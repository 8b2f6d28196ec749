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

#include <string>
#include <system_error>

#include "batchrename/error.hxx"

const std::error_category&
batchrename::error_category() noexcept
{
    struct category final : std::error_category
    {
        const char*
        name() const noexcept override final
        {
            return "batchrename::error_category()";
        }

        std::string
        message(int c) const override final
        {
            switch (static_cast<batchrename::error_code>(c))
            {
                case batchrename::error_code::none:
                    return "none";
                case batchrename::error_code::invalid_scheme:
                    return "invalid scheme";
                case batchrename::error_code::name_collision:
                    return "name collision";
                case batchrename::error_code::invalid_character:
                    return "invalid character";
                case batchrename::error_code::existing_file_conflict:
                    return "existing file conflict";
                case batchrename::error_code::source_missing:
                    return "source missing";
                case batchrename::error_code::permission_denied:
                    return "permission denied";
                case batchrename::error_code::filesystem_other:
                    return "filesystem error";
                case batchrename::error_code::cancelled:
                    return "cancelled";
                case batchrename::error_code::blocked:
                    return "blocked";
                default:
                    return "unknown error";
            }
        }
    };
    static const category instance{};
    return instance;
}

std::error_code
batchrename::classify(const std::error_code& ec) noexcept
{
    if (!ec)
    {
        return batchrename::error_code::none;
    }

    if (ec.category() == batchrename::error_category())
    {
        return ec;
    }

    if (ec == std::errc::no_such_file_or_directory)
    {
        return batchrename::error_code::source_missing;
    }

    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system)
    {
        return batchrename::error_code::permission_denied;
    }

    if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty)
    {
        return batchrename::error_code::existing_file_conflict;
    }

    if (ec == std::errc::filename_too_long)
    {
        return batchrename::error_code::invalid_character;
    }

    return batchrename::error_code::filesystem_other;
}
