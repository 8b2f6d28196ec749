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
#include <string_view>
#include <system_error>
#include <vector>

#include <glaze/glaze.hpp>

#include <magic_enum/magic_enum.hpp>

#include "batchrename/apply-engine.hxx"
#include "batchrename/batch.hxx"
#include "batchrename/error.hxx"
#include "batchrename/naming-rules.hxx"
#include "batchrename/preview.hxx"
#include "batchrename/scheme.hxx"
#include "batchrename/validator.hxx"

#include "datatypes/convert.hxx"
#include "datatypes/datatypes.hxx"

#include "logger.hxx"

namespace
{
std::string
kind_name(const std::error_code& ec) noexcept
{
    if (ec.category() == batchrename::error_category())
    {
        return std::string(magic_enum::enum_name(static_cast<batchrename::error_code>(ec.value())));
    }
    return ec.message();
}

datatype::response::conflict
to_conflict(const batchrename::conflict_entry& entry) noexcept
{
    return {
        .original_path = entry.original_path.string(),
        .new_path = entry.new_path.string(),
        .reason = entry.reason,
    };
}
} // namespace

std::expected<datatype::request, std::string>
datatype::read_request(const std::string_view json) noexcept
{
    const std::string buffer(json);
    const auto request = glz::read_json<datatype::request>(buffer);
    if (!request)
    {
        const auto error = glz::format_error(request.error(), buffer);
        logger::error<logger::domain::cli>("Failed to decode json: {}", error);
        return std::unexpected(std::format("Invalid request: {}", error));
    }
    return request.value();
}

std::expected<datatype::engine_request, std::string>
datatype::to_engine(const request& request) noexcept
{
    if (request.files.empty())
    {
        return std::unexpected("No files given");
    }
    if (request.jobs == 0)
    {
        return std::unexpected("Jobs must be at least 1");
    }

    const auto case_option = batchrename::parse_text_case(request.scheme.case_option);
    if (!case_option)
    {
        return std::unexpected(std::format("Invalid case: {}", request.scheme.case_option));
    }

    const auto position = batchrename::parse_number_position(request.scheme.numbering.position);
    if (!position)
    {
        return std::unexpected(
            std::format("Invalid number position: {}", request.scheme.numbering.position));
    }

    const auto index_mode = batchrename::parse_index_mode(request.index_mode);
    if (!index_mode)
    {
        return std::unexpected(std::format("Invalid index mode: {}", request.index_mode));
    }

    const auto rules = batchrename::parse_filesystem_rules(request.rules);
    if (!rules)
    {
        return std::unexpected(std::format("Invalid filesystem rules: {}", request.rules));
    }

    engine_request parsed{
        .files = {},
        .scheme =
            {
                .prefix = request.scheme.prefix,
                .suffix = request.scheme.suffix,
                .find = request.scheme.find,
                .replace = request.scheme.replace,
                .case_option = case_option.value(),
                .numbering =
                    {
                        .enabled = request.scheme.numbering.enabled,
                        .padding = request.scheme.numbering.padding,
                        .start = request.scheme.numbering.start,
                        .step = request.scheme.numbering.step,
                        .position = position.value(),
                        .separator = request.scheme.numbering.separator,
                    },
                .name_template = request.scheme.name_template,
            },
        .destination = std::nullopt,
        .index_mode = index_mode.value(),
        .rules = rules.value(),
        .options = {.override_conflicts = request.force, .jobs = request.jobs},
        .preview_count = request.preview_count,
        .dry_run = request.dry_run,
    };

    for (const auto& file : request.files)
    {
        parsed.files.emplace_back(file);
    }

    if (request.destination)
    {
        parsed.destination = request.destination.value();
    }

    if (const auto ec = batchrename::validate(parsed.scheme); ec)
    {
        return std::unexpected(std::format("Invalid naming scheme: {}", ec.message()));
    }

    return parsed;
}

std::vector<datatype::response::preview_pair>
datatype::to_response(const std::span<const batchrename::preview_pair> preview) noexcept
{
    std::vector<response::preview_pair> pairs;
    pairs.reserve(preview.size());
    for (const auto& pair : preview)
    {
        pairs.push_back({.original_name = pair.original_name, .new_name = pair.new_name});
    }
    return pairs;
}

datatype::response::conflict_report
datatype::to_response(const batchrename::conflict_report& report) noexcept
{
    response::conflict_report converted;
    for (const auto& group : report.duplicates)
    {
        response::duplicate duplicate{.new_name = group.new_name, .members = {}};
        for (const auto& member : group.members)
        {
            duplicate.members.push_back(to_conflict(member));
        }
        converted.duplicates.push_back(std::move(duplicate));
    }
    for (const auto& entry : report.invalid_chars)
    {
        converted.invalid_chars.push_back(to_conflict(entry));
    }
    for (const auto& entry : report.existing_files)
    {
        converted.existing_files.push_back(to_conflict(entry));
    }
    return converted;
}

datatype::response::result
datatype::to_response(const batchrename::apply_result& result) noexcept
{
    response::result converted{
        .original_path = result.original_path.string(),
        .new_path = result.new_path.string(),
        .index = result.index,
        .success = result.success(),
        .error_kind = std::nullopt,
        .error_message = std::nullopt,
    };
    if (!result.success())
    {
        converted.error_kind = kind_name(result.outcome.error().kind);
        converted.error_message = result.outcome.error().message;
    }
    return converted;
}

datatype::response::apply_summary
datatype::to_response(const batchrename::apply_summary& summary) noexcept
{
    response::apply_summary converted{
        .total = summary.total,
        .succeeded = summary.succeeded,
        .failed = summary.failed,
        .status = std::string(magic_enum::enum_name(summary.status())),
        .message = summary.message(),
        .errors = {},
    };
    for (const auto& [kind, count] : summary.errors)
    {
        converted.errors.insert({std::string(magic_enum::enum_name(kind)), count});
    }
    return converted;
}

std::expected<std::string, std::string>
datatype::write_response(const response::data& data) noexcept
{
    const auto buffer = glz::write<glz::opts{.prettify = true}>(data);
    if (!buffer)
    {
        logger::error<logger::domain::cli>("Failed to create json: {}", glz::format_error(buffer));
        return std::unexpected(glz::format_error(buffer));
    }
    return buffer.value();
}
