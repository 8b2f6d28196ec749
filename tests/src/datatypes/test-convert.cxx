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

#include <chrono>
#include <filesystem>
#include <string>

#include <doctest/doctest.h>

#include "batchrename/apply-engine.hxx"
#include "batchrename/batch.hxx"
#include "batchrename/error.hxx"
#include "batchrename/naming-rules.hxx"
#include "batchrename/scheme.hxx"

#include "datatypes/convert.hxx"
#include "datatypes/datatypes.hxx"

TEST_SUITE("datatype::convert" * doctest::description(""))
{
    TEST_CASE("datatype::read_request")
    {
        SUBCASE("full request")
        {
            const std::string json = R"({
                "files": ["/tmp/a.jpg", "/tmp/b.jpg"],
                "scheme": {
                    "prefix": "trip_",
                    "case_option": "title case",
                    "numbering": {"enabled": true, "padding": 3, "position": "prefix"}
                },
                "destination": "/tmp/out",
                "index_mode": "listing",
                "rules": "windows",
                "force": true,
                "jobs": 2,
                "dry_run": true
            })";

            const auto request = datatype::read_request(json);
            REQUIRE(request.has_value());
            CHECK_EQ(request->files.size(), 2uz);
            CHECK_EQ(request->scheme.prefix, "trip_");
            CHECK_EQ(request->scheme.numbering.padding, 3);
            CHECK_EQ(request->scheme.numbering.start, 1);
            CHECK_EQ(request->scheme.numbering.separator, "_");
            CHECK_EQ(request->preview_count, 5uz);

            const auto parsed = datatype::to_engine(request.value());
            REQUIRE(parsed.has_value());
            CHECK_EQ(parsed->files[1], std::filesystem::path("/tmp/b.jpg"));
            CHECK_EQ(parsed->scheme.case_option, batchrename::text_case::title);
            CHECK_EQ(parsed->scheme.numbering.enabled, true);
            CHECK_EQ(parsed->scheme.numbering.position, batchrename::number_position::prefix);
            CHECK_EQ(parsed->destination.value(), std::filesystem::path("/tmp/out"));
            CHECK_EQ(parsed->index_mode, batchrename::index_mode::listing);
            CHECK_EQ(parsed->rules, batchrename::filesystem_rules::windows);
            CHECK_EQ(parsed->options.override_conflicts, true);
            CHECK_EQ(parsed->options.jobs, 2u);
            CHECK_EQ(parsed->dry_run, true);
        }

        SUBCASE("defaults")
        {
            const auto request = datatype::read_request(R"({"files": ["x.txt"]})");
            REQUIRE(request.has_value());

            const auto parsed = datatype::to_engine(request.value());
            REQUIRE(parsed.has_value());
            CHECK_EQ(parsed->scheme.case_option, batchrename::text_case::preserve);
            CHECK_EQ(parsed->scheme.numbering.enabled, false);
            CHECK_FALSE(parsed->scheme.name_template.has_value());
            CHECK_FALSE(parsed->destination.has_value());
            CHECK_EQ(parsed->index_mode, batchrename::index_mode::selection);
            CHECK_EQ(parsed->rules, batchrename::filesystem_rules::posix);
            CHECK_EQ(parsed->options.jobs, 1u);
        }

        SUBCASE("malformed")
        {
            CHECK_FALSE(datatype::read_request(R"({"files": [)").has_value());
            CHECK_FALSE(datatype::read_request(R"({"unknown_key": 1})").has_value());
        }
    }

    TEST_CASE("datatype::to_engine")
    {
        datatype::request request{.files = {"a.txt"}};

        SUBCASE("no files")
        {
            request.files.clear();
            CHECK_FALSE(datatype::to_engine(request).has_value());
        }

        SUBCASE("invalid case")
        {
            request.scheme.case_option = "sentence";
            const auto parsed = datatype::to_engine(request);
            REQUIRE_FALSE(parsed.has_value());
            CHECK_EQ(parsed.error(), "Invalid case: sentence");
        }

        SUBCASE("invalid number position")
        {
            request.scheme.numbering.position = "middle";
            CHECK_FALSE(datatype::to_engine(request).has_value());
        }

        SUBCASE("invalid index mode")
        {
            request.index_mode = "random";
            CHECK_FALSE(datatype::to_engine(request).has_value());
        }

        SUBCASE("invalid rules")
        {
            request.rules = "dos";
            CHECK_FALSE(datatype::to_engine(request).has_value());
        }

        SUBCASE("negative numbering")
        {
            request.scheme.numbering.step = -1;
            CHECK_FALSE(datatype::to_engine(request).has_value());
        }

        SUBCASE("zero jobs")
        {
            request.jobs = 0;
            CHECK_FALSE(datatype::to_engine(request).has_value());
        }
    }

    TEST_CASE("datatype::to_response")
    {
        batchrename::apply_summary summary;
        summary.total = 2;
        summary.succeeded = 1;
        summary.failed = 1;
        summary.errors[batchrename::error_code::permission_denied] = 1;
        summary.results.push_back({
            .original_path = "/tmp/a.txt",
            .new_path = "/tmp/b.txt",
            .index = 0,
            .outcome = {},
        });
        summary.results.push_back({
            .original_path = "/tmp/c.txt",
            .new_path = "/tmp/d.txt",
            .index = 1,
            .outcome = std::unexpected(batchrename::apply_error{
                .kind = batchrename::error_code::permission_denied,
                .message = "Permission denied",
                .timestamp = std::chrono::system_clock::now(),
            }),
        });

        const auto converted = datatype::to_response(summary);
        CHECK_EQ(converted.status, "partial");
        CHECK_EQ(converted.message, "Renamed 1 files successfully, 1 failed");
        CHECK_EQ(converted.errors.at("permission_denied"), 1uz);

        const auto success = datatype::to_response(summary.results[0]);
        CHECK_EQ(success.success, true);
        CHECK_FALSE(success.error_kind.has_value());

        const auto failure = datatype::to_response(summary.results[1]);
        CHECK_EQ(failure.success, false);
        CHECK_EQ(failure.index, 1);
        CHECK_EQ(failure.error_kind.value(), "permission_denied");
        CHECK_EQ(failure.error_message.value(), "Permission denied");

        datatype::response::data data;
        data.results.push_back(failure);
        data.summary = converted;

        const auto json = datatype::write_response(data);
        REQUIRE(json.has_value());
        CHECK(json->contains(R"("status": "partial")"));
        CHECK(json->contains(R"("error_kind": "permission_denied")"));
    }
}
