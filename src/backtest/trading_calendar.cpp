#include "backtest/trading_calendar.hpp"
#include "backtest/errors.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace allocsim {
namespace backtest {

TradingCalendar::TradingCalendar(Frequency rebalance_frequency, Frequency contribution_frequency)
    : rebalance_frequency_(rebalance_frequency), contribution_frequency_(contribution_frequency) {}

std::vector<CalendarDay> TradingCalendar::build(const std::string& start_date,
                                                const std::string& end_date,
                                                const std::vector<std::string>& trading_dates) const {
    if (!date_utils::is_iso_date(start_date) || !date_utils::is_iso_date(end_date)) {
        throw ConfigurationError("Calendar bounds must be YYYY-MM-DD, got: " + start_date + " .. " + end_date);
    }
    if (!(start_date < end_date)) {
        throw ConfigurationError("start_date (" + start_date + ") must be before end_date (" + end_date + ")");
    }

    std::vector<std::string> in_range;
    for (const auto& d : trading_dates) {
        if (d >= start_date && d <= end_date) in_range.push_back(d);
    }
    std::sort(in_range.begin(), in_range.end());
    in_range.erase(std::unique(in_range.begin(), in_range.end()), in_range.end());

    if (in_range.empty()) {
        throw ConfigurationError("No trading days between " + start_date + " and " + end_date);
    }

    std::vector<CalendarDay> days;
    days.reserve(in_range.size());
    for (const auto& d : in_range) {
        CalendarDay day;
        day.date = d;
        days.push_back(day);
    }
    days.front().is_funding_day = true;

    flag_boundaries(days, rebalance_frequency_, &CalendarDay::is_rebalance_day);
    flag_boundaries(days, contribution_frequency_, &CalendarDay::is_contribution_day);
    return days;
}

void TradingCalendar::flag_boundaries(std::vector<CalendarDay>& days,
                                      Frequency frequency,
                                      bool CalendarDay::*flag) {
    if (frequency == Frequency::NEVER || days.size() < 2) return;

    std::string next = next_boundary(days.front().date, frequency);
    for (size_t i = 1; i < days.size(); ++i) {
        if (days[i].date >= next) {
            days[i].*flag = true;
            // boundaries crossed during a gap collapse into this one day
            next = next_boundary(days[i].date, frequency);
        }
    }
}

std::vector<std::string> TradingCalendar::trading_dates(const MarketData& data,
                                                        const std::string& start_date,
                                                        const std::string& end_date) {
    const auto& dates = data.get_dates();
    const auto& tickers = data.get_tickers();
    std::vector<size_t> quotes(tickers.size(), 0);
    std::vector<std::string> out;

    for (size_t i = 0; i < dates.size(); ++i) {
        if (dates[i] < start_date || dates[i] > end_date) continue;
        bool any = false;
        for (size_t j = 0; j < tickers.size(); ++j) {
            if (data.has_price(i, j)) {
                ++quotes[j];
                any = true;
            }
        }
        if (any) {
            out.push_back(dates[i]);
            continue;
        }
        // a payout on an unquoted day cannot be valued or reinvested
        for (size_t j = 0; j < tickers.size(); ++j) {
            if (data.dividend(i, j) > 0.0) {
                throw MissingPriceDataError("Dividend for " + tickers[j] + " on " + dates[i] +
                                            " has no price on that day");
            }
        }
    }

    if (out.empty()) {
        throw ConfigurationError("No trading days between " + start_date + " and " + end_date);
    }
    for (size_t j = 0; j < tickers.size(); ++j) {
        if (quotes[j] == 0) {
            throw ConfigurationError("No price data for " + tickers[j] + " between " +
                                     start_date + " and " + end_date);
        }
    }
    return out;
}

std::string TradingCalendar::next_boundary(const std::string& date, Frequency frequency) {
    date_utils::CivilDate c = date_utils::parse_iso(date);
    switch (frequency) {
        case Frequency::DAILY:
            return date_utils::add_days(date, 1);
        case Frequency::WEEKLY:
            return date_utils::add_days(date, 7 - date_utils::day_of_week(date));
        case Frequency::MONTHLY:
            c.day = 1;
            if (++c.month > 12) { c.month = 1; ++c.year; }
            return date_utils::format_iso(c);
        case Frequency::QUARTERLY:
            c.day = 1;
            c.month = ((c.month - 1) / 3) * 3 + 4;
            if (c.month > 12) { c.month -= 12; ++c.year; }
            return date_utils::format_iso(c);
        case Frequency::YEARLY:
            return date_utils::format_iso(date_utils::CivilDate{c.year + 1, 1, 1});
        case Frequency::NEVER:
            break;
    }
    throw std::invalid_argument("next_boundary is undefined for frequency 'never'");
}

} // namespace backtest
} // namespace allocsim
