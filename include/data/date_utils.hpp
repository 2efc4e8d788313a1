/**
 * @file date_utils.hpp
 * @brief Calendar arithmetic on ISO-8601 date strings (YYYY-MM-DD).
 *
 * All dates in allocsim are carried as ISO strings so that lexicographic
 * order equals chronological order. These helpers convert to and from a
 * day count relative to 1970-01-01 using the proleptic Gregorian calendar,
 * which avoids any dependence on the process time zone.
 */

#ifndef ALLOCSIM_DATA_DATE_UTILS_HPP
#define ALLOCSIM_DATA_DATE_UTILS_HPP

#include <string>

namespace allocsim
{
    namespace date_utils
    {

        /**
         * @struct CivilDate
         * @brief Broken-down calendar date.
         */
        struct CivilDate
        {
            int year = 1970;
            int month = 1; ///< 1-12
            int day = 1;   ///< 1-31
        };

        /**
         * @brief Check a string is a well-formed, existing YYYY-MM-DD date.
         */
        bool is_iso_date(const std::string &date);

        /**
         * @brief Parse YYYY-MM-DD.
         * @throws std::invalid_argument If the string is not a valid ISO date.
         */
        CivilDate parse_iso(const std::string &date);

        std::string format_iso(const CivilDate &date);

        /**
         * @brief Normalize a user supplied date to YYYY-MM-DD.
         *
         * Accepts YYYY-MM-DD, DD/MM/YYYY and MM/DD/YYYY. Slash dates are tried
         * day-first and fall back to month-first when the day-first reading
         * is not a real date.
         *
         * @throws std::invalid_argument If no accepted format matches.
         */
        std::string normalize_date(const std::string &input);

        /**
         * @brief Days since 1970-01-01 (negative before the epoch).
         */
        long long to_days(const std::string &date);
        std::string from_days(long long days);

        /**
         * @brief Calendar days from @p from to @p to (negative if to < from).
         */
        long long days_between(const std::string &from, const std::string &to);

        std::string add_days(const std::string &date, int days);

        /**
         * @brief Day of week, 0 = Monday ... 6 = Sunday.
         */
        int day_of_week(const std::string &date);

        int extract_year(const std::string &date);
        int extract_month(const std::string &date);
        int quarter_of(const std::string &date); ///< 1-4

        // Start of the calendar period containing the date.
        std::string week_start(const std::string &date);
        std::string month_start(const std::string &date);
        std::string quarter_start(const std::string &date);
        std::string year_start(const std::string &date);

    } // namespace date_utils
} // namespace allocsim

#endif // ALLOCSIM_DATA_DATE_UTILS_HPP
