/**
 * @file test_drawdown_analysis.cpp
 * @brief Unit tests for DrawdownAnalysis
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/drawdown_analysis.hpp"
#include "backtest/errors.hpp"

using namespace allocsim;
using namespace allocsim::analytics;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<std::string> day_labels(size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back("2020-01-" + std::string(i + 1 < 10 ? "0" : "") + std::to_string(i + 1));
    }
    return out;
}

} // namespace

TEST_CASE("Drawdown events", "[DrawdownAnalysis]") {
    //                          0      1      2     3      4      5      6      7
    std::vector<double> values = {100.0, 110.0, 99.0, 104.5, 115.0, 92.0, 103.5, 110.0};
    auto dates = day_labels(values.size());
    DrawdownAnalysis analysis(values, dates);

    REQUIRE(analysis.event_count() == 2);
    REQUIRE(analysis.has_drawdown());

    const auto& first = analysis.all_events()[0];
    REQUIRE(first.peak_index == 1);
    REQUIRE(first.trough_index == 2);
    REQUIRE(first.recovery_index == 4);
    REQUIRE(first.recovery_date == "2020-01-05");
    REQUIRE_THAT(first.depth, WithinAbs(-0.1, 1e-12));
    REQUIRE(first.decline_days == 1);
    REQUIRE(first.recovery_days == 2);
    REQUIRE(first.total_days == 3);

    const auto& second = analysis.all_events()[1];
    REQUIRE(second.peak_index == 4);
    REQUIRE(second.trough_index == 5);
    REQUIRE(second.recovery_index == -1);
    REQUIRE(second.recovery_date.empty());
    REQUIRE_THAT(second.depth, WithinAbs(-0.2, 1e-12));

    SECTION("Deepest first") {
        auto top = analysis.top_drawdowns(5);
        REQUIRE(top.size() == 2);
        REQUIRE(top[0].peak_index == 4);
        REQUIRE(analysis.worst_drawdown().peak_index == 4);
        REQUIRE(analysis.top_drawdowns(1).size() == 1);
        REQUIRE_THROWS_AS(analysis.top_drawdowns(0), std::invalid_argument);
    }

    SECTION("Summary") {
        auto s = analysis.summary();
        REQUIRE(s.total_events == 2);
        REQUIRE(s.unrecovered_count == 1);
        REQUIRE_THAT(s.max_depth, WithinAbs(-0.2, 1e-12));
        REQUIRE_THAT(s.average_depth, WithinAbs(-0.15, 1e-12));
        REQUIRE_THAT(s.average_recovery_days, WithinAbs(2.0, 1e-12));
        // 3 days in the first event, 3 days since the open peak
        REQUIRE_THAT(s.time_in_drawdown_pct, WithinAbs(6.0 / 7.0, 1e-12));
    }

    SECTION("Underwater curve") {
        const auto& uw = analysis.underwater_curve();
        REQUIRE(uw.size() == values.size());
        REQUIRE(uw[0] == 0.0);
        REQUIRE(uw[4] == 0.0);
        REQUIRE_THAT(uw[5], WithinAbs(-0.2, 1e-12));
        for (double d : uw) {
            REQUIRE(d <= 0.0);
        }
    }

    SECTION("Report") {
        auto text = analysis.report(1);
        REQUIRE(text.find("Drawdown Analysis") != std::string::npos);
        REQUIRE(text.find("2020-01-05") != std::string::npos); // peak of the worst event
    }
}

TEST_CASE("Series without a drawdown", "[DrawdownAnalysis]") {
    std::vector<double> values = {100.0, 100.0, 101.0, 105.0};
    DrawdownAnalysis analysis(values, day_labels(values.size()));

    REQUIRE_FALSE(analysis.has_drawdown());
    REQUIRE(analysis.event_count() == 0);
    REQUIRE(analysis.top_drawdowns(3).empty());
    REQUIRE_THROWS_AS(analysis.worst_drawdown(), std::runtime_error);
    REQUIRE(analysis.summary().time_in_drawdown_pct == 0.0);
    REQUIRE(analysis.summary().average_recovery_days == -1.0);
}

TEST_CASE("Drawdown analysis errors", "[DrawdownAnalysis]") {
    REQUIRE_THROWS_AS(DrawdownAnalysis({}, {}), backtest::ComputationError);
    REQUIRE_THROWS_AS(DrawdownAnalysis({100.0, 90.0}, {"2020-01-01"}), std::invalid_argument);
    REQUIRE_THROWS_AS(DrawdownAnalysis({0.0, 0.0}, {"2020-01-01", "2020-01-02"}), backtest::ComputationError);
}
