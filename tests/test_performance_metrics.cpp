/**
 * @file test_performance_metrics.cpp
 * @brief Unit tests for PerformanceMetrics and period return aggregation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/performance_metrics.hpp"
#include "analytics/period_returns.hpp"
#include "backtest/backtest_result.hpp"
#include "backtest/errors.hpp"
#include <cmath>

using namespace allocsim;
using namespace allocsim::analytics;
using Catch::Matchers::WithinAbs;
using backtest::EquityCurvePoint;

namespace {

EquityCurvePoint point(const std::string& date, double value,
                       double contribution = 0.0, double cumulative = 0.0) {
    EquityCurvePoint p;
    p.date = date;
    p.total_value = value;
    p.contribution = contribution;
    p.cumulative_contributions = cumulative;
    return p;
}

// No contributions after the funding day
std::vector<EquityCurvePoint> curve(const std::vector<std::string>& dates,
                                    const std::vector<double>& values) {
    std::vector<EquityCurvePoint> out;
    for (size_t i = 0; i < dates.size(); ++i) {
        out.push_back(point(dates[i], values[i], i == 0 ? values[0] : 0.0, values[0]));
    }
    return out;
}

} // namespace

TEST_CASE("Metrics of a flat curve", "[PerformanceMetrics]") {
    PerformanceMetrics m(curve({"2020-01-01", "2020-01-02"}, {10000.0, 10000.0}), 10000.0);

    REQUIRE(m.final_value() == 10000.0);
    REQUIRE(m.cumulative_return() == 0.0);
    REQUIRE(m.cumulative_gain() == 0.0);
    REQUIRE(m.cagr() == 0.0);
    REQUIRE(m.annualized_volatility() == 0.0);
    REQUIRE(m.sharpe_ratio() == 0.0);
    REQUIRE(m.max_drawdown() == 0.0);
    REQUIRE(m.daily_returns().size() == 1);
}

TEST_CASE("Return metrics", "[PerformanceMetrics]") {
    SECTION("Doubling gives a cumulative return of 1") {
        PerformanceMetrics m(curve({"2020-01-01", "2020-06-01", "2020-12-31"}, {100.0, 150.0, 200.0}), 100.0);
        REQUIRE_THAT(m.cumulative_return(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(m.cumulative_gain(), WithinAbs(100.0, 1e-12));
    }

    SECTION("CAGR over calendar days") {
        PerformanceMetrics m(curve({"2020-01-01", "2021-01-01"}, {1000.0, 1100.0}), 1000.0);
        REQUIRE(m.calendar_days() == 366);
        REQUIRE_THAT(m.cagr(), WithinAbs(std::pow(1.1, 365.25 / 366.0) - 1.0, 1e-12));
    }

    SECTION("Single point") {
        PerformanceMetrics m(curve({"2020-01-01"}, {1000.0}), 1000.0);
        REQUIRE(m.calendar_days() == 0);
        REQUIRE(m.cagr() == 0.0);
        REQUIRE(m.daily_returns().empty());
        REQUIRE(m.annualized_volatility() == 0.0);
    }
}

TEST_CASE("Contributions are not performance", "[PerformanceMetrics]") {
    std::vector<EquityCurvePoint> c = {
        point("2020-01-01", 1000.0, 1000.0, 1000.0),
        point("2020-01-02", 1100.0, 100.0, 1100.0),
        point("2020-01-03", 1210.0, 0.0, 1100.0),
    };
    PerformanceMetrics m(c, 1000.0);

    REQUIRE(m.daily_returns().size() == 2);
    REQUIRE_THAT(m.daily_returns()[0], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(m.daily_returns()[1], WithinAbs(0.1, 1e-12));
    REQUIRE(m.return_dates().front() == "2020-01-02");
    REQUIRE(m.total_contributions() == 1100.0);
    REQUIRE_THAT(m.cumulative_gain(), WithinAbs(110.0, 1e-9));
    REQUIRE_THAT(m.cumulative_return(), WithinAbs(0.21, 1e-12));
}

TEST_CASE("Risk metrics", "[PerformanceMetrics]") {
    // returns +10%, -10%, +10%
    auto c = curve({"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-06"}, {100.0, 110.0, 99.0, 108.9});
    PerformanceMetrics m(c, 100.0, 0.01);

    double mean = 0.1 / 3.0;
    double var = ((0.1 - mean) * (0.1 - mean) * 2 + (-0.1 - mean) * (-0.1 - mean)) / 2.0;
    double vol = std::sqrt(var) * std::sqrt(252.0);
    REQUIRE_THAT(m.annualized_volatility(), WithinAbs(vol, 1e-9));
    REQUIRE_THAT(m.sharpe_ratio(), WithinAbs((m.cagr() - 0.01) / vol, 1e-9));

    SECTION("Annualization factor") {
        PerformanceMetrics weekly(c, 100.0, 0.0, 52);
        REQUIRE_THAT(weekly.annualized_volatility(), WithinAbs(std::sqrt(var) * std::sqrt(52.0), 1e-9));
    }
}

TEST_CASE("Maximum drawdown", "[PerformanceMetrics]") {
    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-06", "2020-01-07", "2020-01-08"};

    SECTION("Recovered") {
        PerformanceMetrics m(curve(dates, {100.0, 120.0, 90.0, 110.0, 130.0, 125.0}), 100.0);
        const auto& info = m.max_drawdown_info();
        REQUIRE_THAT(m.max_drawdown(), WithinAbs(-0.25, 1e-12));
        REQUIRE(info.peak_date == "2020-01-02");
        REQUIRE(info.trough_date == "2020-01-03");
        REQUIRE(info.recovery_date == "2020-01-07");
        REQUIRE(m.drawdown_series().size() == 6);
        for (double dd : m.drawdown_series()) {
            REQUIRE(dd <= 0.0);
        }
    }

    SECTION("Unrecovered") {
        PerformanceMetrics m(curve(dates, {100.0, 120.0, 90.0, 80.0, 100.0, 110.0}), 100.0);
        REQUIRE_THAT(m.max_drawdown(), WithinAbs(-40.0 / 120.0, 1e-12));
        REQUIRE(m.max_drawdown_info().trough_date == "2020-01-06");
        REQUIRE(m.max_drawdown_info().recovery_index == -1);
        REQUIRE(m.max_drawdown_info().recovery_date.empty());
    }

    SECTION("Monotonic curve") {
        PerformanceMetrics m(curve(dates, {100.0, 101.0, 102.0, 103.0, 104.0, 105.0}), 100.0);
        REQUIRE(m.max_drawdown() == 0.0);
    }
}

TEST_CASE("Period labels", "[PeriodReturns]") {
    // 2020-03-15 was a Sunday
    REQUIRE(period_label("2020-03-15", PeriodGranularity::DAILY) == "2020-03-15");
    REQUIRE(period_label("2020-03-15", PeriodGranularity::WEEKLY) == "2020-03-09");
    REQUIRE(period_label("2020-03-15", PeriodGranularity::MONTHLY) == "2020-03");
    REQUIRE(period_label("2020-03-15", PeriodGranularity::QUARTERLY) == "2020-Q1");
    REQUIRE(period_label("2020-11-15", PeriodGranularity::QUARTERLY) == "2020-Q4");
    REQUIRE(period_label("2020-03-15", PeriodGranularity::YEARLY) == "2020");

    REQUIRE(period_start("2020-03-15", PeriodGranularity::MONTHLY) == "2020-03-01");
    REQUIRE(period_start("2020-11-15", PeriodGranularity::QUARTERLY) == "2020-10-01");
    REQUIRE(to_string(PeriodGranularity::QUARTERLY) == "quarterly");
    REQUIRE(all_granularities().size() == 5);
}

TEST_CASE("Period aggregation", "[PeriodReturns]") {
    std::vector<std::string> dates = {"2020-01-30", "2020-01-31", "2020-02-03", "2020-04-01"};
    std::vector<double> returns = {0.10, 0.10, -0.05, 0.02};

    auto monthly = compute_period_returns(dates, returns, PeriodGranularity::MONTHLY);
    REQUIRE(monthly.size() == 3); // March has no observation
    REQUIRE(monthly[0].period == "2020-01");
    REQUIRE(monthly[0].period_start == "2020-01-01");
    REQUIRE_THAT(monthly[0].period_return, WithinAbs(0.21, 1e-12));
    REQUIRE(monthly[1].period == "2020-02");
    REQUIRE(monthly[2].period == "2020-04");

    auto quarterly = compute_period_returns(dates, returns, PeriodGranularity::QUARTERLY);
    REQUIRE(quarterly.size() == 2);
    REQUIRE_THAT(quarterly[0].period_return, WithinAbs(1.21 * 0.95 - 1.0, 1e-12));

    REQUIRE(best_period(monthly)->period == "2020-01");
    REQUIRE(worst_period(monthly)->period == "2020-02");
    REQUIRE_FALSE(best_period({}).has_value());

    SECTION("Ties keep the earliest period") {
        auto tied = compute_period_returns({"2020-01-15", "2020-02-14", "2020-03-16"}, {0.05, 0.05, -0.01},
                                           PeriodGranularity::MONTHLY);
        REQUIRE(best_period(tied)->period == "2020-01");
    }

    SECTION("Size mismatch") {
        REQUIRE_THROWS_AS(compute_period_returns(dates, {0.1}, PeriodGranularity::DAILY), std::invalid_argument);
    }
}

TEST_CASE("Monthly win/loss and histogram", "[PerformanceMetrics]") {
    // month-end values: +12%, -6%, 0%, +3%, -12%
    std::vector<std::string> dates = {"2020-01-02", "2020-02-03", "2020-03-02", "2020-04-01", "2020-05-01", "2020-06-01"};
    std::vector<double> values = {1000.0};
    for (double r : {0.12, -0.06, 0.0, 0.03, -0.12}) values.push_back(values.back() * (1.0 + r));
    PerformanceMetrics m(curve(dates, values), 1000.0);

    auto wl = m.monthly_win_loss();
    REQUIRE(wl.win == 2);
    REQUIRE(wl.loss == 3);
    REQUIRE_THAT(wl.rate, WithinAbs(0.4, 1e-12));

    auto hist = m.monthly_histogram();
    REQUIRE(hist.size() == 6);
    REQUIRE(hist[0].bucket == "< -10%");
    REQUIRE(hist[0].count == 1);
    REQUIRE(hist[1].count == 1);
    REQUIRE(hist[2].count == 0);
    REQUIRE(hist[3].count == 2); // 0% falls in the bucket it opens
    REQUIRE(hist[4].count == 0);
    REQUIRE(hist[5].bucket == "10%+");
    REQUIRE(hist[5].count == 1);

    auto best = m.best_period(PeriodGranularity::MONTHLY);
    REQUIRE(best->period == "2020-02");
    REQUIRE_THAT(best->period_return, WithinAbs(0.12, 1e-12));
}

TEST_CASE("Metrics are deterministic", "[PerformanceMetrics]") {
    auto c = curve({"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-06"}, {100.0, 103.0, 98.0, 104.0});
    PerformanceMetrics a(c, 100.0, 0.02);
    PerformanceMetrics b(c, 100.0, 0.02);

    REQUIRE(a.to_json() == b.to_json());
    REQUIRE(a.to_json().contains("sharpe"));
    REQUIRE(a.to_json().size() == 7);
    REQUIRE(a.summary() == b.summary());
    REQUIRE(a.summary().find("Max Drawdown") != std::string::npos);
}

TEST_CASE("Metrics errors", "[PerformanceMetrics]") {
    std::vector<EquityCurvePoint> empty;
    REQUIRE_THROWS_AS(PerformanceMetrics(empty, 100.0), backtest::ComputationError);

    auto c = curve({"2020-01-01", "2020-01-02"}, {100.0, 101.0});
    REQUIRE_THROWS_AS(PerformanceMetrics(c, 0.0), backtest::ComputationError);
    REQUIRE_THROWS_AS(PerformanceMetrics(c, 100.0, 0.0, 0), std::invalid_argument);

    auto wiped = curve({"2020-01-01", "2020-01-02", "2020-01-03"}, {100.0, 0.0, 10.0});
    REQUIRE_THROWS_AS(PerformanceMetrics(wiped, 100.0), backtest::ComputationError);
}
