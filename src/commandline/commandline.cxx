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
#include <format>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <cstdint>
#include <cstdlib>

#include <magic_enum/magic_enum.hpp>

#include <CLI/CLI.hpp>

#include "batchrename/batch.hxx"
#include "batchrename/naming-rules.hxx"
#include "batchrename/scheme.hxx"

#include "commandline/commandline.hxx"

#include "datatypes/convert.hxx"
#include "datatypes/datatypes.hxx"

#include "logger.hxx"
#include "package.hxx"

struct opts_data final
{
    datatype::request request;
    std::string name_template;

    std::string json;
    bool json_output{false};

    std::vector<std::string> raw_log_levels;
    std::unordered_map<std::string, std::string> log_levels;
    std::filesystem::path logfile;

    bool version{false};
};

static void
run_commandline(const std::shared_ptr<opts_data>& opt) noexcept
{
    if (opt->version)
    {
        std::println("{} {}", batchrename::package.name_fancy, batchrename::package.version);
        std::exit(EXIT_SUCCESS);
    }

    logger::initialize(opt->log_levels, opt->logfile);
}

template<typename Parser>
static auto
enum_check(Parser parser, const std::string_view what) noexcept
{
    return [parser, what](const std::string& value)
    {
        if (!parser(value))
        {
            return std::format("Invalid {}: {}", what, value);
        }
        return std::string();
    };
}

static void
setup_commandline(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    auto& request = opt->request;
    auto& scheme = request.scheme;

    app.add_option("--prefix", scheme.prefix, "Text added before the name");
    app.add_option("--suffix", scheme.suffix, "Text added after the name, before the extension");
    app.add_option("--find", scheme.find, "Text to find in the name");
    app.add_option("--replace", scheme.replace, "Replacement for every --find match");

    app.add_option("--case", scheme.case_option, "Case of the name [preserve|lower|upper|title]")
        ->expected(1)
        ->check(enum_check(batchrename::parse_text_case, "case"));

    app.add_option("--name", opt->name_template, "New base name for every file")->expected(1);

    app.add_flag("-n,--number", scheme.numbering.enabled, "Add a sequence number");
    app.add_option("--padding", scheme.numbering.padding, "Minimum digits of the number")
        ->expected(1)
        ->check(CLI::Range(0, 255));
    app.add_option("--start", scheme.numbering.start, "First number")
        ->expected(1)
        ->check(CLI::NonNegativeNumber);
    app.add_option("--step", scheme.numbering.step, "Increment between numbers")
        ->expected(1)
        ->check(CLI::NonNegativeNumber);
    app.add_option("--number-position",
                   scheme.numbering.position,
                   "Where the number goes [suffix|prefix]")
        ->expected(1)
        ->check(enum_check(batchrename::parse_number_position, "number position"));
    app.add_option("--separator", scheme.numbering.separator, "Text between number and name")
        ->expected(1);

    app.add_option("-d,--destination", request.destination, "Move renamed files into this folder")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (std::filesystem::exists(input) && !std::filesystem::is_directory(input))
                {
                    return std::format("Destination must be a directory: {}", input.string());
                }
                return std::string();
            });

    app.add_option("--index-mode",
                   request.index_mode,
                   "Numbering order [selection|listing]")
        ->expected(1)
        ->check(enum_check(batchrename::parse_index_mode, "index mode"));
    app.add_option("--rules", request.rules, "Naming rules of the target [posix|windows]")
        ->expected(1)
        ->check(enum_check(batchrename::parse_filesystem_rules, "filesystem rules"));

    app.add_option("--preview", request.preview_count, "Number of files in the preview sample")
        ->expected(1);
    app.add_flag("--dry-run", request.dry_run, "Show the plan without renaming anything");
    app.add_flag("--force",
                 request.force,
                 "Rename even when names are invalid or files are in the way");
    app.add_option("-j,--jobs", request.jobs, "Number of worker threads")
        ->expected(1)
        ->check(CLI::Range(1, 64));

    app.add_option("--json", opt->json, "Full request as json, replaces the other options")
        ->expected(1);
    app.add_flag("--json-output", opt->json_output, "Print the result as json");

    app.add_option("--loglevel", opt->raw_log_levels, "Set the loglevel. Format: domain=level")
        ->check(
            [&opt](const auto& value)
            {
                constexpr auto log_levels = magic_enum::enum_names<spdlog::level::level_enum>();
                constexpr auto valid_domains = magic_enum::enum_names<logger::domain>();

                const auto pos = value.find('=');
                if (pos == std::string::npos)
                {
                    return std::string("Must be in format domain=level");
                }

                const auto domain = value.substr(0, pos);
                if (!std::ranges::contains(valid_domains, domain))
                {
                    return std::format("Invalid domain: {}", domain);
                }

                const auto level = value.substr(pos + 1);
                if (!std::ranges::contains(log_levels, level))
                {
                    return std::format("Invalid log level: {}", level);
                }

                opt->log_levels.insert({domain, level});

                return std::string();
            });

    app.add_option("--logfile", opt->logfile, "absolute path to the logfile")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    return std::string();
                }
                return std::format("Logfile path must be absolute: {}", input.string());
            });

    app.add_flag("-v,--version", opt->version, "Show version information");

    // Everything else
    app.add_option("files", request.files, "FILE...")->expected(0, -1);

    app.callback([opt]() { run_commandline(opt); });
}

std::expected<commandline::opts, std::string>
commandline::run(int argc, char* argv[]) noexcept
{
    CLI::App app{batchrename::package.name_fancy.data(),
                 "Rename a batch of files with a naming scheme"};

    auto opt = std::make_shared<opts_data>();
    setup_commandline(app, opt);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp& e)
    {
        std::exit(app.exit(e));
    }
    catch (const CLI::ParseError& e)
    {
        return std::unexpected{e.what()};
    }

    if (!opt->name_template.empty())
    {
        opt->request.scheme.name_template = opt->name_template;
    }

    if (!opt->json.empty())
    {
        const auto request = datatype::read_request(opt->json);
        if (!request)
        {
            return std::unexpected{request.error()};
        }
        opt->request = request.value();
    }

    return commandline::opts{.request = opt->request, .json_output = opt->json_output};
}
