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

#include <cstdint>

#include <doctest/doctest.h>

#include "batchrename/batch.hxx"

#include "scratch.hxx"

TEST_SUITE("batchrename::batch" * doctest::description(""))
{
    TEST_CASE("selection order")
    {
        const std::vector<std::filesystem::path> selected = {
            "/tmp/photos/c.jpg",
            "/tmp/photos/a.jpg",
            "/tmp/photos/b.jpg",
        };

        const auto batch = batchrename::make_batch(selected);
        REQUIRE_EQ(batch.size(), 3uz);

        CHECK_EQ(batch[0].path, selected[0]);
        CHECK_EQ(batch[0].index, 0);
        CHECK_EQ(batch[1].path, selected[1]);
        CHECK_EQ(batch[1].index, 1);
        CHECK_EQ(batch[2].path, selected[2]);
        CHECK_EQ(batch[2].index, 2);
    }

    TEST_CASE("repeated selections are dropped")
    {
        const std::vector<std::filesystem::path> selected = {
            "/tmp/photos/a.jpg",
            "/tmp/photos/b.jpg",
            "/tmp/photos/./a.jpg",
            "/tmp/photos/b.jpg",
            "/tmp/photos/c.jpg",
        };

        const auto batch = batchrename::make_batch(selected);
        REQUIRE_EQ(batch.size(), 3uz);

        CHECK_EQ(batch[0].path, "/tmp/photos/a.jpg");
        CHECK_EQ(batch[1].path, "/tmp/photos/b.jpg");
        CHECK_EQ(batch[2].path, "/tmp/photos/c.jpg");
        CHECK_EQ(batch[2].index, 2);
    }

    TEST_CASE("empty selection")
    {
        CHECK(batchrename::make_batch({}).empty());
        CHECK(batchrename::make_batch({}, batchrename::index_mode::listing).empty());
    }

    TEST_CASE("listing order")
    {
        const auto test_path = test::scratch_directory("batch-listing");
        for (const auto* name : {"b.txt", "d.txt", "a.txt", "c.txt"})
        {
            test::write_file(test_path / name, name);
        }

        SUBCASE("single folder")
        {
            const std::vector<std::filesystem::path> selected = {
                test_path / "d.txt",
                test_path / "b.txt",
            };

            const auto batch =
                batchrename::make_batch(selected, batchrename::index_mode::listing);
            REQUIRE_EQ(batch.size(), 2uz);

            // a b c d
            CHECK_EQ(batch[0].path, test_path / "b.txt");
            CHECK_EQ(batch[0].index, 1);
            CHECK_EQ(batch[1].path, test_path / "d.txt");
            CHECK_EQ(batch[1].index, 3);
        }

        SUBCASE("unlisted files go last")
        {
            const std::vector<std::filesystem::path> selected = {
                test_path / "zz-missing.txt",
                test_path / "a.txt",
            };

            const auto batch =
                batchrename::make_batch(selected, batchrename::index_mode::listing);
            REQUIRE_EQ(batch.size(), 2uz);

            CHECK_EQ(batch[0].path, test_path / "a.txt");
            CHECK_EQ(batch[0].index, 0);
            CHECK_EQ(batch[1].path, test_path / "zz-missing.txt");
            CHECK_EQ(batch[1].index, 4);
        }

        SUBCASE("folders in order of first appearance")
        {
            const auto other = test_path / "other";
            std::filesystem::create_directories(other);
            test::write_file(other / "x.txt", "x");
            test::write_file(other / "y.txt", "y");

            const std::vector<std::filesystem::path> selected = {
                other / "y.txt",
                test_path / "a.txt",
                other / "x.txt",
            };

            const auto batch =
                batchrename::make_batch(selected, batchrename::index_mode::listing);
            REQUIRE_EQ(batch.size(), 3uz);

            // other: x y, then test_path: a b c d other
            CHECK_EQ(batch[0].path, other / "x.txt");
            CHECK_EQ(batch[0].index, 0);
            CHECK_EQ(batch[1].path, other / "y.txt");
            CHECK_EQ(batch[1].index, 1);
            CHECK_EQ(batch[2].path, test_path / "a.txt");
            CHECK_EQ(batch[2].index, 2);
        }

        std::filesystem::remove_all(test_path);
    }

    TEST_CASE("batchrename::parse_index_mode")
    {
        CHECK_EQ(batchrename::parse_index_mode("selection").value(),
                 batchrename::index_mode::selection);
        CHECK_EQ(batchrename::parse_index_mode("LISTING").value(),
                 batchrename::index_mode::listing);
        CHECK_FALSE(batchrename::parse_index_mode("random").has_value());
    }
}
