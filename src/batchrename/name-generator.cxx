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
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <cctype>
#include <cstdint>

#include <ztd/ztd.hxx>

#include "batchrename/error.hxx"
#include "batchrename/name-generator.hxx"
#include "batchrename/scheme.hxx"

batchrename::split_basename_extension_data
batchrename::split_basename_extension(const std::string_view filename) noexcept
{
    // Find the last dot in the filename
    const auto dot_pos = filename.find_last_of('.');

    // Check if the dot is not at the beginning or end of the filename
    if (dot_pos != std::string_view::npos && dot_pos != 0 && dot_pos != filename.length() - 1)
    {
        const auto split = ztd::rpartition(filename, ".");

        // Check if the extension is a compressed tar archive
        if (split[0].ends_with(".tar") && split[0].size() > 4)
        {
            // Find the second last dot in the filename
            const auto split_second = ztd::rpartition(split[0], ".");

            return {split_second[0], std::format(".{}.{}", split_second[2], split[2]), true};
        }
        else
        {
            // Return the basename and the extension
            return {split[0], std::format(".{}", split[2]), false};
        }
    }

    // No valid extension found, return the whole filename as the basename
    return {std::string(filename), "", false};
}

namespace
{
constexpr std::array<std::string_view, 20> title_small_words{
    "a", "an", "the", "and", "but", "or", "for", "nor", "as", "at",
    "by", "from", "in", "into", "near", "of", "on", "onto", "to", "with",
};

bool
is_word_separator(const char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::string
capitalize(const std::string_view word) noexcept
{
    auto result = ztd::lower(word);
    if (result.empty())
    {
        return result;
    }

    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));

    // O'Connor, D'Angelo
    if (result.size() > 2 && result[1] == '\'')
    {
        result[2] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[2])));
    }

    return result;
}
} // namespace

std::string
batchrename::title_case(const std::string_view text) noexcept
{
    if (text.empty())
    {
        return {};
    }

    // alternating word, separator, word, ... always starting and ending with a word
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    bool in_separator = false;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const bool separator = is_word_separator(text[i]);
        if (separator != in_separator)
        {
            parts.push_back(text.substr(start, i - start));
            start = i;
            in_separator = separator;
        }
    }
    parts.push_back(text.substr(start));
    if (in_separator)
    {
        parts.emplace_back();
    }

    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        const auto part = parts[i];
        if (i % 2 != 0 || part.empty())
        {
            result.append(part);
            continue;
        }

        const auto lowered = ztd::lower(part);
        const bool edge = i == 0 || i == parts.size() - 1;
        if (!edge && std::ranges::contains(title_small_words, lowered))
        {
            result.append(lowered);
        }
        else
        {
            result.append(capitalize(part));
        }
    }

    return result;
}

std::string
batchrename::format_number(const std::uint64_t index, const numbering_options& numbering) noexcept
{
    const auto value = static_cast<std::uint64_t>(numbering.start) +
                       (index * static_cast<std::uint64_t>(numbering.step));

    return ztd::zfill(std::to_string(value), static_cast<std::size_t>(numbering.padding));
}

std::expected<std::string, std::error_code>
batchrename::generate_name(const std::filesystem::path& original, const std::uint64_t index,
                           const scheme& scheme) noexcept
{
    if (const auto ec = batchrename::validate(scheme); ec)
    {
        return std::unexpected(ec);
    }

    auto [basename, extension, _] = split_basename_extension(original.filename().string());

    if (scheme.name_template)
    {
        const auto replacement = split_basename_extension(scheme.name_template.value());
        basename = replacement.basename;
        if (!replacement.extension.empty())
        {
            extension = replacement.extension;
        }
    }

    if (!scheme.find.empty())
    {
        basename = ztd::replace(basename, scheme.find, scheme.replace);
    }

    switch (scheme.case_option)
    {
        case text_case::preserve:
            break;
        case text_case::lower:
            basename = ztd::lower(basename);
            break;
        case text_case::upper:
            basename = ztd::upper(basename);
            break;
        case text_case::title:
            basename = title_case(basename);
            break;
    }

    // a template is the whole base name
    if (!scheme.name_template)
    {
        basename = std::format("{}{}{}", scheme.prefix, basename, scheme.suffix);
    }

    if (scheme.numbering.enabled)
    {
        const auto number = format_number(index, scheme.numbering);
        if (scheme.numbering.position == number_position::prefix)
        {
            basename = std::format("{}{}{}", number, scheme.numbering.separator, basename);
        }
        else
        {
            basename = std::format("{}{}{}", basename, scheme.numbering.separator, number);
        }
    }

    return std::format("{}{}", basename, extension);
}
