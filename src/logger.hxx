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
#include <format>
#include <string>
#include <unordered_map>
#include <utility>

#include <cstdint>

#include <magic_enum/magic_enum.hpp>

#include <spdlog/spdlog.h>

namespace logger
{
enum class domain : std::uint8_t
{
    basic,
    dev,
    scheme,
    plan,
    apply,
    cli,
};

void initialize() noexcept;

/**
 * @param[in] options domain name -> level name, domains not listed use the default level
 * @param[in] logfile optional file sink shared by every domain
 */
void initialize(const std::unordered_map<std::string, std::string>& options,
                const std::filesystem::path& logfile = "") noexcept;

namespace detail
{
template<domain d>
void
log(const spdlog::level::level_enum level, std::string&& msg) noexcept
{
    const auto logger = spdlog::get(magic_enum::enum_name(d).data());
    if (logger)
    {
        logger->log(level, msg);
    }
}
} // namespace detail

template<domain d = domain::basic, typename... Args>
void
trace(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    detail::log<d>(spdlog::level::trace, std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
trace_if(bool cond, std::format_string<Args...> fmt, Args&&... args) noexcept
{
    if (cond)
    {
        trace<d>(fmt, std::forward<Args>(args)...);
    }
}

template<domain d = domain::basic, typename... Args>
void
debug(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    detail::log<d>(spdlog::level::debug, std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
debug_if(bool cond, std::format_string<Args...> fmt, Args&&... args) noexcept
{
    if (cond)
    {
        debug<d>(fmt, std::forward<Args>(args)...);
    }
}

template<domain d = domain::basic, typename... Args>
void
info(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    detail::log<d>(spdlog::level::info, std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
info_if(bool cond, std::format_string<Args...> fmt, Args&&... args) noexcept
{
    if (cond)
    {
        info<d>(fmt, std::forward<Args>(args)...);
    }
}

template<domain d = domain::basic, typename... Args>
void
warn(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    detail::log<d>(spdlog::level::warn, std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
warn_if(bool cond, std::format_string<Args...> fmt, Args&&... args) noexcept
{
    if (cond)
    {
        warn<d>(fmt, std::forward<Args>(args)...);
    }
}

template<domain d = domain::basic, typename... Args>
void
error(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    detail::log<d>(spdlog::level::err, std::format(fmt, std::forward<Args>(args)...));
}

template<domain d = domain::basic, typename... Args>
void
error_if(bool cond, std::format_string<Args...> fmt, Args&&... args) noexcept
{
    if (cond)
    {
        error<d>(fmt, std::forward<Args>(args)...);
    }
}

template<domain d = domain::basic, typename... Args>
void
critical(std::format_string<Args...> fmt, Args&&... args) noexcept
{
    detail::log<d>(spdlog::level::critical, std::format(fmt, std::forward<Args>(args)...));
}
} // namespace logger
