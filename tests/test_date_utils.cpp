// Unit tests for ISO date arithmetic

#include <catch2/catch_test_macros.hpp>

#include "data/date_utils.hpp"

#include <stdexcept>

using namespace allocsim;

TEST_CASE("ISO date validation", "[DateUtils]") {
    REQUIRE(date_utils::is_iso_date("2020-02-29"));
    REQUIRE(date_utils::is_iso_date("2023-12-31"));
    REQUIRE_FALSE(date_utils::is_iso_date("2021-02-29"));
    REQUIRE_FALSE(date_utils::is_iso_date("2020-13-01"));
    REQUIRE_FALSE(date_utils::is_iso_date("2020-1-01"));
    REQUIRE_FALSE(date_utils::is_iso_date("01/02/2020"));
    REQUIRE_FALSE(date_utils::is_iso_date(""));

    REQUIRE_THROWS_AS(date_utils::parse_iso("2020-02-30"), std::invalid_argument);
}

TEST_CASE("Date normalization", "[DateUtils]") {
    SECTION("ISO passes through") {
        REQUIRE(date_utils::normalize_date("2020-03-15") == "2020-03-15");
    }

    SECTION("Day-first slash dates") {
        REQUIRE(date_utils::normalize_date("15/03/2020") == "2020-03-15");
        REQUIRE(date_utils::normalize_date("5/3/2020") == "2020-03-05");
    }

    SECTION("Ambiguous slash dates read day-first") {
        REQUIRE(date_utils::normalize_date("01/02/2020") == "2020-02-01");
    }

    SECTION("Month-first fallback") {
        REQUIRE(date_utils::normalize_date("03/15/2020") == "2020-03-15");
    }

    SECTION("Rejects garbage") {
        REQUIRE_THROWS_AS(date_utils::normalize_date("2020/03/15"), std::invalid_argument);
        REQUIRE_THROWS_AS(date_utils::normalize_date("31/31/2020"), std::invalid_argument);
        REQUIRE_THROWS_AS(date_utils::normalize_date("yesterday"), std::invalid_argument);
    }
}

TEST_CASE("Day counting", "[DateUtils]") {
    REQUIRE(date_utils::to_days("1970-01-01") == 0);
    REQUIRE(date_utils::from_days(0) == "1970-01-01");
    REQUIRE(date_utils::days_between("2020-01-01", "2021-01-01") == 366);
    REQUIRE(date_utils::days_between("2021-01-01", "2020-01-01") == -366);
    REQUIRE(date_utils::add_days("2020-02-28", 1) == "2020-02-29");
    REQUIRE(date_utils::add_days("2020-12-31", 1) == "2021-01-01");
    REQUIRE(date_utils::add_days("2020-03-01", -1) == "2020-02-29");
}

TEST_CASE("Calendar periods", "[DateUtils]") {
    // 2020-01-01 was a Wednesday
    REQUIRE(date_utils::day_of_week("2020-01-01") == 2);
    REQUIRE(date_utils::day_of_week("2020-01-06") == 0);
    REQUIRE(date_utils::day_of_week("2020-01-05") == 6);

    REQUIRE(date_utils::week_start("2020-01-01") == "2019-12-30");
    REQUIRE(date_utils::week_start("2020-01-06") == "2020-01-06");
    REQUIRE(date_utils::month_start("2020-02-17") == "2020-02-01");
    REQUIRE(date_utils::quarter_start("2020-08-17") == "2020-07-01");
    REQUIRE(date_utils::year_start("2020-08-17") == "2020-01-01");

    REQUIRE(date_utils::quarter_of("2020-03-31") == 1);
    REQUIRE(date_utils::quarter_of("2020-04-01") == 2);
    REQUIRE(date_utils::quarter_of("2020-12-31") == 4);
    REQUIRE(date_utils::extract_year("2020-12-31") == 2020);
    REQUIRE(date_utils::extract_month("2020-12-31") == 12);
}
