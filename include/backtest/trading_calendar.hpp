#pragma once

#include <string>
#include <vector>
#include "backtest/backtest_config.hpp"
#include "data/market_data.hpp"

namespace allocsim {
namespace backtest {

struct CalendarDay {
    std::string date;
    bool is_funding_day = false;
    bool is_rebalance_day = false;
    bool is_contribution_day = false;
};

// Builds the ordered trading-day sequence of a run and flags the days on
// which a calendar period boundary (Monday, 1st of month, quarter start,
// Jan 1) has been crossed. The first trading day funds the portfolio and
// carries no other flag.
class TradingCalendar {
public:
    TradingCalendar(Frequency rebalance_frequency, Frequency contribution_frequency);
    ~TradingCalendar() = default;

    // Throws ConfigurationError if start >= end or no trading day falls in range.
    std::vector<CalendarDay> build(const std::string& start_date,
                                   const std::string& end_date,
                                   const std::vector<std::string>& trading_dates) const;

    // Dates in [start, end] on which at least one column of data is quoted.
    // Throws ConfigurationError if any column has no quote in range, and
    // MissingPriceDataError for a dividend on a date with no quote at all.
    static std::vector<std::string> trading_dates(const MarketData& data,
                                                  const std::string& start_date,
                                                  const std::string& end_date);

    // First period boundary strictly after date. Not defined for NEVER.
    static std::string next_boundary(const std::string& date, Frequency frequency);

    Frequency rebalance_frequency() const { return rebalance_frequency_; }
    Frequency contribution_frequency() const { return contribution_frequency_; }

private:
    Frequency rebalance_frequency_;
    Frequency contribution_frequency_;

    static void flag_boundaries(std::vector<CalendarDay>& days,
                                Frequency frequency,
                                bool CalendarDay::*flag);
};

} // namespace backtest
} // namespace allocsim
