/**
 * @file period_returns.hpp
 * @brief Calendar-period aggregation of daily portfolio returns.
 *
 * Daily returns are grouped by calendar period (day, Monday-start week,
 * month, quarter, year) and compounded within each group. Periods with no
 * return observation are not emitted.
 */

#ifndef ALLOCSIM_ANALYTICS_PERIOD_RETURNS_HPP
#define ALLOCSIM_ANALYTICS_PERIOD_RETURNS_HPP

#include <optional>
#include <string>
#include <vector>

namespace allocsim
{
    namespace analytics
    {

        /**
         * @enum PeriodGranularity
         * @brief Calendar bucket used to aggregate daily returns.
         */
        enum class PeriodGranularity
        {
            DAILY,
            WEEKLY,
            MONTHLY,
            QUARTERLY,
            YEARLY
        };

        /** @brief Lowercase name ("daily", "weekly", ...). */
        std::string to_string(PeriodGranularity granularity);

        /** @brief All granularities from finest to coarsest. */
        const std::vector<PeriodGranularity> &all_granularities();

        /**
         * @struct PeriodReturn
         * @brief Compounded return of one calendar period.
         */
        struct PeriodReturn
        {
            std::string period;       ///< Label: YYYY-MM-DD, YYYY-MM, YYYY-Qn or YYYY
            std::string period_start; ///< First calendar day of the period
            double period_return = 0.0;
        };

        /**
         * @brief Label of the period containing a date.
         *
         * Daily and weekly labels are dates (weekly uses the Monday of the
         * week); monthly is "YYYY-MM", quarterly "YYYY-Qn", yearly "YYYY".
         */
        std::string period_label(const std::string &date, PeriodGranularity granularity);

        /** @brief First calendar day of the period containing a date. */
        std::string period_start(const std::string &date, PeriodGranularity granularity);

        /**
         * @brief Compound daily returns into calendar periods.
         * @param dates Observation date of each return, ascending.
         * @param daily_returns Simple returns aligned with dates.
         * @return Periods in chronological order.
         * @throws std::invalid_argument If the sizes differ.
         */
        std::vector<PeriodReturn> compute_period_returns(const std::vector<std::string> &dates,
                                                         const std::vector<double> &daily_returns,
                                                         PeriodGranularity granularity);

        /** @brief Highest-return period; the earliest wins a tie. */
        std::optional<PeriodReturn> best_period(const std::vector<PeriodReturn> &periods);

        /** @brief Lowest-return period; the earliest wins a tie. */
        std::optional<PeriodReturn> worst_period(const std::vector<PeriodReturn> &periods);

    } // namespace analytics
} // namespace allocsim

#endif // ALLOCSIM_ANALYTICS_PERIOD_RETURNS_HPP
