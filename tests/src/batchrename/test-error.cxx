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

#include <system_error>

#include <doctest/doctest.h>

#include "batchrename/error.hxx"

TEST_SUITE("batchrename::error_code" * doctest::description(""))
{
    TEST_CASE("batchrename::error_code")
    {
        SUBCASE("batchrename::error_code::none")
        {
            const auto ec = batchrename::make_error_code(batchrename::error_code::none);

            CHECK_EQ(ec.category().name(), std::string("batchrename::error_category()"));

            CHECK_EQ(bool(ec), false);
            CHECK_EQ(ec.message(), "none");
            CHECK_EQ(ec == batchrename::error_code::none, true);
        }

        SUBCASE("batchrename::error_code::invalid_scheme")
        {
            const auto ec = batchrename::make_error_code(batchrename::error_code::invalid_scheme);

            CHECK_EQ(ec.category().name(), std::string("batchrename::error_category()"));

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "invalid scheme");
            CHECK_EQ(ec == batchrename::error_code::invalid_scheme, true);
        }

        SUBCASE("batchrename::error_code::name_collision")
        {
            const auto ec = batchrename::make_error_code(batchrename::error_code::name_collision);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "name collision");
            CHECK_EQ(ec == batchrename::error_code::name_collision, true);
        }

        SUBCASE("batchrename::error_code::invalid_character")
        {
            const auto ec =
                batchrename::make_error_code(batchrename::error_code::invalid_character);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "invalid character");
        }

        SUBCASE("batchrename::error_code::existing_file_conflict")
        {
            const auto ec =
                batchrename::make_error_code(batchrename::error_code::existing_file_conflict);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "existing file conflict");
        }

        SUBCASE("batchrename::error_code::source_missing")
        {
            const auto ec = batchrename::make_error_code(batchrename::error_code::source_missing);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "source missing");
        }

        SUBCASE("batchrename::error_code::permission_denied")
        {
            const auto ec =
                batchrename::make_error_code(batchrename::error_code::permission_denied);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "permission denied");
        }

        SUBCASE("batchrename::error_code::filesystem_other")
        {
            const auto ec =
                batchrename::make_error_code(batchrename::error_code::filesystem_other);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "filesystem error");
        }

        SUBCASE("batchrename::error_code::cancelled")
        {
            const auto ec = batchrename::make_error_code(batchrename::error_code::cancelled);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "cancelled");
        }

        SUBCASE("batchrename::error_code::blocked")
        {
            const auto ec = batchrename::make_error_code(batchrename::error_code::blocked);

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "blocked");
        }
    }

    TEST_CASE("batchrename::classify")
    {
        CHECK_EQ(batchrename::classify({}), batchrename::error_code::none);

        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::no_such_file_or_directory)),
                 batchrename::error_code::source_missing);

        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::permission_denied)),
                 batchrename::error_code::permission_denied);
        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::operation_not_permitted)),
                 batchrename::error_code::permission_denied);
        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::read_only_file_system)),
                 batchrename::error_code::permission_denied);

        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::file_exists)),
                 batchrename::error_code::existing_file_conflict);
        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::directory_not_empty)),
                 batchrename::error_code::existing_file_conflict);

        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::filename_too_long)),
                 batchrename::error_code::invalid_character);

        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::io_error)),
                 batchrename::error_code::filesystem_other);
        CHECK_EQ(batchrename::classify(std::make_error_code(std::errc::not_a_directory)),
                 batchrename::error_code::filesystem_other);

        // already classified
        CHECK_EQ(batchrename::classify(batchrename::error_code::blocked),
                 batchrename::error_code::blocked);
    }
}
