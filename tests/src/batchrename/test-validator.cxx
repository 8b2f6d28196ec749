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
#include <vector>

#include <doctest/doctest.h>

#include "batchrename/batch.hxx"
#include "batchrename/error.hxx"
#include "batchrename/naming-rules.hxx"
#include "batchrename/scheme.hxx"
#include "batchrename/validator.hxx"

#include "scratch.hxx"

TEST_SUITE("batchrename::validator" * doctest::description(""))
{
    TEST_CASE("batchrename::make_plan")
    {
        const auto test_path = test::scratch_directory("validator");

        const std::vector<std::filesystem::path> files = {
            test_path / "one.txt",
            test_path / "two.txt",
            test_path / "three.txt",
        };
        for (const auto& file : files)
        {
            test::write_file(file, file.filename().string());
        }
        const auto batch = batchrename::make_batch(files);

        SUBCASE("clean plan")
        {
            const batchrename::scheme scheme{.prefix = "new_"};

            const auto plan = batchrename::make_plan(batch, scheme);
            REQUIRE(plan.has_value());
            CHECK(plan->report().empty());
            CHECK_FALSE(plan->destination().has_value());
            REQUIRE_EQ(plan->size(), 3uz);

            const auto& items = plan->items();
            CHECK_EQ(items[0].original_path, test_path / "one.txt");
            CHECK_EQ(items[0].new_name, "new_one.txt");
            CHECK_EQ(items[0].new_path, test_path / "new_one.txt");
            CHECK_EQ(items[0].index, 0);
            CHECK_EQ(items[2].new_path, test_path / "new_three.txt");
            CHECK_EQ(items[2].index, 2);
        }

        SUBCASE("destination")
        {
            const auto destination = test_path / "out";
            const auto plan = batchrename::make_plan(batch, {}, destination);
            REQUIRE(plan.has_value());
            CHECK(plan->report().empty());
            CHECK_EQ(plan->destination().value(), destination);
            CHECK_EQ(plan->items()[1].new_path, destination / "two.txt");

            // planning never creates anything
            CHECK_FALSE(std::filesystem::exists(destination));
        }

        SUBCASE("duplicates")
        {
            const batchrename::scheme scheme{.name_template = "same"};

            const auto plan = batchrename::make_plan(batch, scheme);
            REQUIRE(plan.has_value());

            const auto& report = plan->report();
            REQUIRE_EQ(report.duplicates.size(), 1uz);
            CHECK_EQ(report.duplicates[0].new_name, "same.txt");
            REQUIRE_EQ(report.duplicates[0].members.size(), 3uz);
            CHECK_EQ(report.duplicates[0].members[0].original_path, test_path / "one.txt");
            CHECK_EQ(report.duplicates[0].members[1].original_path, test_path / "two.txt");
            CHECK_EQ(report.duplicates[0].members[2].original_path, test_path / "three.txt");
        }

        SUBCASE("duplicates ignore case on windows targets")
        {
            const std::vector<std::filesystem::path> mixed = {
                test_path / "one.txt",
                test_path / "ONE2.txt",
            };
            test::write_file(mixed[1], "x");
            const batchrename::scheme scheme{.find = "2", .replace = ""};

            const auto posix = batchrename::check(batchrename::make_batch(mixed), scheme);
            REQUIRE(posix.has_value());
            CHECK(posix->duplicates.empty());

            const auto windows = batchrename::check(batchrename::make_batch(mixed),
                                                    scheme,
                                                    std::nullopt,
                                                    batchrename::filesystem_rules::windows);
            REQUIRE(windows.has_value());
            REQUIRE_EQ(windows->duplicates.size(), 1uz);
            CHECK_EQ(windows->duplicates[0].members.size(), 2uz);
        }

        SUBCASE("invalid characters")
        {
            const batchrename::scheme scheme{.prefix = "a:"};

            const auto posix = batchrename::check(batch, scheme);
            REQUIRE(posix.has_value());
            CHECK(posix->invalid_chars.empty());

            const auto windows = batchrename::check(batch,
                                                    scheme,
                                                    std::nullopt,
                                                    batchrename::filesystem_rules::windows);
            REQUIRE(windows.has_value());
            REQUIRE_EQ(windows->invalid_chars.size(), 3uz);
            CHECK_EQ(windows->invalid_chars[0].original_path, test_path / "one.txt");
            CHECK_EQ(windows->invalid_chars[0].new_path, test_path / "a:one.txt");
            CHECK_EQ(windows->invalid_chars[0].reason, "contains ':'");
        }

        SUBCASE("slash is invalid everywhere")
        {
            const batchrename::scheme scheme{.suffix = "/x"};

            const auto report = batchrename::check(batch, scheme);
            REQUIRE(report.has_value());
            CHECK_EQ(report->invalid_chars.size(), 3uz);
        }

        SUBCASE("existing files")
        {
            test::write_file(test_path / "new_two.txt", "in the way");
            const batchrename::scheme scheme{.prefix = "new_"};

            const auto report = batchrename::check(batch, scheme);
            REQUIRE(report.has_value());
            REQUIRE_EQ(report->existing_files.size(), 1uz);
            CHECK_EQ(report->existing_files[0].original_path, test_path / "two.txt");
            CHECK_EQ(report->existing_files[0].new_path, test_path / "new_two.txt");
            CHECK(report->duplicates.empty());
            CHECK(report->invalid_chars.empty());
        }

        SUBCASE("existing directory")
        {
            std::filesystem::create_directories(test_path / "new_one.txt");
            const batchrename::scheme scheme{.prefix = "new_"};

            const auto report = batchrename::check(batch, scheme);
            REQUIRE(report.has_value());
            CHECK_EQ(report->existing_files.size(), 1uz);
        }

        SUBCASE("batch sources are not in the way")
        {
            // 1.txt -> 2.txt and 2.txt -> 1.txt
            test::write_file(test_path / "1.txt", "1");
            test::write_file(test_path / "2.txt", "2");
            const std::vector<std::filesystem::path> swap = {
                test_path / "2.txt",
                test_path / "1.txt",
            };
            const batchrename::scheme scheme{
                .numbering = {.enabled = true, .padding = 0, .separator = ""},
                .name_template = ""};

            const auto plan = batchrename::make_plan(batchrename::make_batch(swap), scheme);
            REQUIRE(plan.has_value());
            CHECK(plan->report().empty());
            CHECK_EQ(plan->items()[0].new_path, test_path / "1.txt");
            CHECK_EQ(plan->items()[1].new_path, test_path / "2.txt");
        }

        SUBCASE("unchanged names are not in the way")
        {
            const auto report = batchrename::check(batch, {});
            REQUIRE(report.has_value());
            CHECK(report->empty());
        }

        SUBCASE("idempotent")
        {
            test::write_file(test_path / "new_one.txt", "in the way");
            const batchrename::scheme scheme{.prefix = "new_"};

            const auto entries = test::count_entries(test_path);
            const auto first = batchrename::check(batch, scheme);
            const auto second = batchrename::check(batch, scheme);
            REQUIRE(first.has_value());
            REQUIRE(second.has_value());
            CHECK_EQ(first.value() == second.value(), true);
            CHECK_EQ(test::count_entries(test_path), entries);
        }

        SUBCASE("invalid scheme")
        {
            const batchrename::scheme scheme{.case_option =
                                                 static_cast<batchrename::text_case>(9)};

            const auto plan = batchrename::make_plan(batch, scheme);
            REQUIRE_FALSE(plan.has_value());
            CHECK_EQ(plan.error() == batchrename::error_code::invalid_scheme, true);

            const auto report = batchrename::check(batch, scheme);
            REQUIRE_FALSE(report.has_value());
        }

        std::filesystem::remove_all(test_path);
    }
}
