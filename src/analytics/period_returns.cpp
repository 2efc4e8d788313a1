/**
 * @file period_returns.cpp
 * @brief Implementation of calendar-period return aggregation.
 */

#include "analytics/period_returns.hpp"
#include "data/date_utils.hpp"

#include <stdexcept>

namespace allocsim
{
    namespace analytics
    {

        std::string to_string(PeriodGranularity granularity)
        {
            switch (granularity)
            {
            case PeriodGranularity::DAILY:
                return "daily";
            case PeriodGranularity::WEEKLY:
                return "weekly";
            case PeriodGranularity::MONTHLY:
                return "monthly";
            case PeriodGranularity::QUARTERLY:
                return "quarterly";
            case PeriodGranularity::YEARLY:
                return "yearly";
            }
            return "unknown";
        }

        const std::vector<PeriodGranularity> &all_granularities()
        {
            static const std::vector<PeriodGranularity> granularities = {
                PeriodGranularity::DAILY,
                PeriodGranularity::WEEKLY,
                PeriodGranularity::MONTHLY,
                PeriodGranularity::QUARTERLY,
                PeriodGranularity::YEARLY};
            return granularities;
        }

        std::string period_label(const std::string &date, PeriodGranularity granularity)
        {
            switch (granularity)
            {
            case PeriodGranularity::DAILY:
                return date;
            case PeriodGranularity::WEEKLY:
                return date_utils::week_start(date);
            case PeriodGranularity::MONTHLY:
                return date.substr(0, 7);
            case PeriodGranularity::QUARTERLY:
                return date.substr(0, 4) + "-Q" + std::to_string(date_utils::quarter_of(date));
            case PeriodGranularity::YEARLY:
                return date.substr(0, 4);
            }
            throw std::invalid_argument("Unknown period granularity");
        }

        std::string period_start(const std::string &date, PeriodGranularity granularity)
        {
            switch (granularity)
            {
            case PeriodGranularity::DAILY:
                return date;
            case PeriodGranularity::WEEKLY:
                return date_utils::week_start(date);
            case PeriodGranularity::MONTHLY:
                return date_utils::month_start(date);
            case PeriodGranularity::QUARTERLY:
                return date_utils::quarter_start(date);
            case PeriodGranularity::YEARLY:
                return date_utils::year_start(date);
            }
            throw std::invalid_argument("Unknown period granularity");
        }

        std::vector<PeriodReturn> compute_period_returns(const std::vector<std::string> &dates,
                                                         const std::vector<double> &daily_returns,
                                                         PeriodGranularity granularity)
        {
            if (dates.size() != daily_returns.size())
            {
                throw std::invalid_argument(
                    "Dates size (" + std::to_string(dates.size()) + ") must match returns size (" + std::to_string(daily_returns.size()) + ")");
            }

            std::vector<PeriodReturn> periods;
            double growth = 1.0;

            for (size_t i = 0; i < dates.size(); ++i)
            {
                std::string label = period_label(dates[i], granularity);
                if (periods.empty() || periods.back().period != label)
                {
                    if (!periods.empty())
                    {
                        periods.back().period_return = growth - 1.0;
                    }
                    PeriodReturn period;
                    period.period = label;
                    period.period_start = period_start(dates[i], granularity);
                    periods.push_back(period);
                    growth = 1.0;
                }
                growth *= 1.0 + daily_returns[i];
            }

            if (!periods.empty())
            {
                periods.back().period_return = growth - 1.0;
            }
            return periods;
        }

        std::optional<PeriodReturn> best_period(const std::vector<PeriodReturn> &periods)
        {
            if (periods.empty())
            {
                return std::nullopt;
            }
            size_t best = 0;
            for (size_t i = 1; i < periods.size(); ++i)
            {
                if (periods[i].period_return > periods[best].period_return)
                {
                    best = i;
                }
            }
            return periods[best];
        }

        std::optional<PeriodReturn> worst_period(const std::vector<PeriodReturn> &periods)
        {
            if (periods.empty())
            {
                return std::nullopt;
            }
            size_t worst = 0;
            for (size_t i = 1; i < periods.size(); ++i)
            {
                if (periods[i].period_return < periods[worst].period_return)
                {
                    worst = i;
                }
            }
            return periods[worst];
        }

    } // namespace analytics
} // namespace allocsim
