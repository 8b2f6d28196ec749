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

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace datatype
{
struct numbering_options
{
    bool enabled{false};
    std::int32_t padding{2};
    std::int32_t start{1};
    std::int32_t step{1};
    std::string position{"suffix"};
    std::string separator{"_"};
};

struct naming_scheme
{
    std::string prefix;
    std::string suffix;
    std::string find;
    std::string replace;
    std::string case_option{"preserve"};
    numbering_options numbering;
    std::optional<std::string> name_template;
};

struct request
{
    std::vector<std::string> files;
    naming_scheme scheme;
    std::optional<std::string> destination;
    std::string index_mode{"selection"};
    std::string rules{"posix"};
    bool force{false};
    std::uint32_t jobs{1};
    std::size_t preview_count{5};
    bool dry_run{false};
};

namespace response
{
struct preview_pair
{
    std::string original_name;
    std::string new_name;
};

struct conflict
{
    std::string original_path;
    std::string new_path;
    std::string reason;
};

struct duplicate
{
    std::string new_name;
    std::vector<conflict> members;
};

struct conflict_report
{
    std::vector<duplicate> duplicates;
    std::vector<conflict> invalid_chars;
    std::vector<conflict> existing_files;
};

struct result
{
    std::string original_path;
    std::string new_path;
    std::uint64_t index;
    bool success;
    std::optional<std::string> error_kind;
    std::optional<std::string> error_message;
};

struct apply_summary
{
    std::size_t total;
    std::size_t succeeded;
    std::size_t failed;
    std::string status;
    std::string message;
    std::map<std::string, std::size_t> errors;
};

struct data
{
    std::vector<preview_pair> preview;
    conflict_report report;
    std::vector<result> results;
    std::optional<apply_summary> summary;
    std::optional<std::string> error;
};
} // namespace response
} // namespace datatype
