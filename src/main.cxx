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

#include <atomic>
#include <chrono>
#include <format>
#include <print>
#include <stop_token>
#include <string>
#include <thread>

#include <csignal>
#include <cstdio>
#include <cstdlib>

#include "batchrename/apply-engine.hxx"
#include "batchrename/batch.hxx"
#include "batchrename/preview.hxx"
#include "batchrename/validator.hxx"

#include "commandline/commandline.hxx"

#include "datatypes/convert.hxx"
#include "datatypes/datatypes.hxx"

#include "logger.hxx"

static std::atomic<bool> interrupted{false};

static void
print_response(const datatype::response::data& response, const bool json_output) noexcept
{
    if (json_output)
    {
        const auto buffer = datatype::write_response(response);
        if (buffer)
        {
            std::println("{}", buffer.value());
        }
        return;
    }

    if (response.error)
    {
        std::println(stderr, "{}", response.error.value());
    }

    if (!response.preview.empty())
    {
        std::println("Preview:");
        for (const auto& pair : response.preview)
        {
            std::println("  {} -> {}", pair.original_name, pair.new_name);
        }
    }

    const auto& report = response.report;
    for (const auto& duplicate : report.duplicates)
    {
        std::println("Duplicate name '{}':", duplicate.new_name);
        for (const auto& member : duplicate.members)
        {
            std::println("  {}", member.original_path);
        }
    }
    for (const auto& conflict : report.invalid_chars)
    {
        std::println("Invalid name: {}: {}", conflict.new_path, conflict.reason);
    }
    for (const auto& conflict : report.existing_files)
    {
        std::println("Existing file: {}: {}", conflict.original_path, conflict.reason);
    }

    if (response.summary)
    {
        std::println("{}", response.summary->message);
    }
}

static int
rename_files(const datatype::engine_request& request, const bool json_output) noexcept
{
    datatype::response::data response;

    const auto batch = batchrename::make_batch(request.files, request.index_mode);

    const auto preview = batchrename::preview(batch, request.scheme, request.preview_count);
    if (!preview)
    {
        response.error = std::format("Invalid naming scheme: {}", preview.error().message());
        print_response(response, json_output);
        return EXIT_FAILURE;
    }
    response.preview = datatype::to_response(preview.value());

    const auto plan =
        batchrename::make_plan(batch, request.scheme, request.destination, request.rules);
    if (!plan)
    {
        response.error = std::format("Invalid naming scheme: {}", plan.error().message());
        print_response(response, json_output);
        return EXIT_FAILURE;
    }
    response.report = datatype::to_response(plan->report());

    if (!json_output)
    {
        // text output is printed as the run goes
        print_response(response, json_output);
        response.preview.clear();
        response.report = {};
    }

    if (request.dry_run)
    {
        if (json_output)
        {
            print_response(response, json_output);
        }
        return plan->report().empty() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    batchrename::apply_engine engine(request.options);

    if (const auto ec = engine.gate(plan.value()); ec)
    {
        response.error = std::format("Refusing to rename: {}", ec.message());
        print_response(response, json_output);
        return EXIT_FAILURE;
    }

    if (!json_output)
    {
        engine.signal_result().connect(
            [](const batchrename::apply_result& result)
            {
                if (result.success())
                {
                    std::println("{} -> {}",
                                 result.original_path.string(),
                                 result.new_path.string());
                }
                else
                {
                    std::println(stderr,
                                 "{}: {}",
                                 result.original_path.string(),
                                 result.outcome.error().message);
                }
            });
    }

    std::signal(SIGINT, [](int) { interrupted = true; });

    if (const auto ec = engine.start(plan.value()); ec)
    {
        response.error = std::format("Failed to start: {}", ec.message());
        print_response(response, json_output);
        return EXIT_FAILURE;
    }

    std::jthread watcher(
        [&engine](const std::stop_token& stoken)
        {
            while (!stoken.stop_requested())
            {
                if (interrupted)
                {
                    logger::warn<logger::domain::cli>("interrupted, cancelling");
                    engine.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

    const auto summary = engine.wait();
    watcher.request_stop();

    if (!summary)
    {
        response.error = "Rename did not finish";
        print_response(response, json_output);
        return EXIT_FAILURE;
    }

    if (json_output)
    {
        for (const auto& result : batchrename::sorted_by_index(summary->results))
        {
            response.results.push_back(datatype::to_response(result));
        }
    }
    response.summary = datatype::to_response(summary.value());

    print_response(response, json_output);

    return summary->status() == batchrename::apply_status::success ? EXIT_SUCCESS : EXIT_FAILURE;
}

int
main(int argc, char* argv[])
{
    const auto opts = commandline::run(argc, argv);
    if (!opts)
    {
        std::println(stderr, "{}", opts.error());
        return EXIT_FAILURE;
    }

    const auto request = datatype::to_engine(opts->request);
    if (!request)
    {
        std::println(stderr, "{}", request.error());
        return EXIT_FAILURE;
    }

    return rename_files(request.value(), opts->json_output);
}
