/**
 * @file date_utils.cpp
 * @brief Implementation of ISO date helpers.
 */

#include "data/date_utils.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace allocsim
{
    namespace date_utils
    {

        namespace
        {

            bool is_leap(int y)
            {
                return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            }

            int days_in_month(int y, int m)
            {
                static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (m == 2 && is_leap(y))
                {
                    return 29;
                }
                return DAYS[m - 1];
            }

            bool is_valid(int y, int m, int d)
            {
                if (y < 1 || y > 9999 || m < 1 || m > 12 || d < 1)
                {
                    return false;
                }
                return d <= days_in_month(y, m);
            }

            bool all_digits(const std::string &s)
            {
                if (s.empty())
                {
                    return false;
                }
                for (char c : s)
                {
                    if (!std::isdigit(static_cast<unsigned char>(c)))
                    {
                        return false;
                    }
                }
                return true;
            }

            // Howard Hinnant's days_from_civil / civil_from_days.
            long long days_from_civil(int y, int m, int d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const long long yoe = y - era * 400;
                const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + doe - 719468;
            }

            CivilDate civil_from_days(long long z)
            {
                z += 719468;
                const long long era = (z >= 0 ? z : z - 146096) / 146097;
                const long long doe = z - era * 146097;
                const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
                const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
                const long long mp = (5 * doy + 2) / 153;
                CivilDate out;
                out.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
                out.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
                out.year = static_cast<int>(yoe + era * 400 + (out.month <= 2 ? 1 : 0));
                return out;
            }

        } // anonymous namespace

        bool is_iso_date(const std::string &date)
        {
            if (date.size() != 10 || date[4] != '-' || date[7] != '-')
            {
                return false;
            }
            std::string y = date.substr(0, 4);
            std::string m = date.substr(5, 2);
            std::string d = date.substr(8, 2);
            if (!all_digits(y) || !all_digits(m) || !all_digits(d))
            {
                return false;
            }
            return is_valid(std::stoi(y), std::stoi(m), std::stoi(d));
        }

        CivilDate parse_iso(const std::string &date)
        {
            if (!is_iso_date(date))
            {
                throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): '" + date + "'");
            }
            CivilDate out;
            out.year = std::stoi(date.substr(0, 4));
            out.month = std::stoi(date.substr(5, 2));
            out.day = std::stoi(date.substr(8, 2));
            return out;
        }

        std::string format_iso(const CivilDate &date)
        {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
            return std::string(buffer);
        }

        std::string normalize_date(const std::string &input)
        {
            if (is_iso_date(input))
            {
                return input;
            }

            size_t first = input.find('/');
            size_t second = first == std::string::npos ? std::string::npos : input.find('/', first + 1);
            if (second != std::string::npos && input.find('/', second + 1) == std::string::npos)
            {
                std::string a = input.substr(0, first);
                std::string b = input.substr(first + 1, second - first - 1);
                std::string y = input.substr(second + 1);
                if (all_digits(a) && all_digits(b) && all_digits(y) &&
                    a.size() <= 2 && b.size() <= 2 && y.size() == 4)
                {
                    int ia = std::stoi(a);
                    int ib = std::stoi(b);
                    int iy = std::stoi(y);
                    // DD/MM/YYYY first, then MM/DD/YYYY
                    if (is_valid(iy, ib, ia))
                    {
                        return format_iso(CivilDate{iy, ib, ia});
                    }
                    if (is_valid(iy, ia, ib))
                    {
                        return format_iso(CivilDate{iy, ia, ib});
                    }
                }
            }

            throw std::invalid_argument(
                "Unrecognized date '" + input + "' (expected YYYY-MM-DD, DD/MM/YYYY or MM/DD/YYYY)");
        }

        long long to_days(const std::string &date)
        {
            CivilDate c = parse_iso(date);
            return days_from_civil(c.year, c.month, c.day);
        }

        std::string from_days(long long days)
        {
            return format_iso(civil_from_days(days));
        }

        long long days_between(const std::string &from, const std::string &to)
        {
            return to_days(to) - to_days(from);
        }

        std::string add_days(const std::string &date, int days)
        {
            return from_days(to_days(date) + days);
        }

        int day_of_week(const std::string &date)
        {
            // 1970-01-01 was a Thursday (3 with Monday = 0)
            long long z = to_days(date);
            return static_cast<int>(((z % 7) + 7 + 3) % 7);
        }

        int extract_year(const std::string &date)
        {
            return parse_iso(date).year;
        }

        int extract_month(const std::string &date)
        {
            return parse_iso(date).month;
        }

        int quarter_of(const std::string &date)
        {
            return (extract_month(date) - 1) / 3 + 1;
        }

        std::string week_start(const std::string &date)
        {
            return add_days(date, -day_of_week(date));
        }

        std::string month_start(const std::string &date)
        {
            CivilDate c = parse_iso(date);
            c.day = 1;
            return format_iso(c);
        }

        std::string quarter_start(const std::string &date)
        {
            CivilDate c = parse_iso(date);
            c.month = ((c.month - 1) / 3) * 3 + 1;
            c.day = 1;
            return format_iso(c);
        }

        std::string year_start(const std::string &date)
        {
            CivilDate c = parse_iso(date);
            c.month = 1;
            c.day = 1;
            return format_iso(c);
        }

    } // namespace date_utils
} // namespace allocsim
