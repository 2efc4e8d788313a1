#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <filesystem>
#include <fstream>
#include "report/result_assembler.hpp"
#include "data/date_utils.hpp"

using namespace allocsim;
using namespace allocsim::backtest;
using namespace allocsim::report;

namespace {

MarketData two_asset_data() {
    std::vector<std::string> dates;
    for (std::string d = "2020-01-01"; d <= "2020-03-31"; d = date_utils::add_days(d, 1)) {
        if (date_utils::day_of_week(d) < 5) dates.push_back(d);
    }
    Eigen::MatrixXd prices(static_cast<Eigen::Index>(dates.size()), 2);
    for (Eigen::Index i = 0; i < prices.rows(); ++i) {
        prices(i, 0) = 100.0;
        // dips in February, back above the start by March
        prices(i, 1) = dates[static_cast<size_t>(i)] < "2020-02-01" ? 50.0
                     : dates[static_cast<size_t>(i)] < "2020-03-01" ? 40.0 : 60.0;
    }
    return MarketData(prices, dates, {"BND", "VTI"});
}

BacktestParams params() {
    BacktestConfig cfg;
    cfg.start_date = "2020-01-01";
    cfg.end_date = "2020-03-31";
    cfg.initial_investment = 10000.0;
    cfg.target_weights = {{"BND", 0.5}, {"VTI", 0.5}};
    return BacktestParams::from_config(cfg);
}

} // namespace

TEST_CASE("Report JSON shape", "[ResultAssembler]") {
    auto p = params();
    auto result = BacktestEngine(p).run(two_asset_data());
    auto report = ResultAssembler(p).assemble(result);
    auto j = report.to_json();

    for (const char* key : {"metrics", "max_drawdown", "best_periods", "worst_periods",
                            "monthly_win_lose_analysis", "chart_data", "trades",
                            "dividends", "final_holdings", "config"}) {
        REQUIRE(j.contains(key));
    }

    SECTION("Max drawdown block") {
        const auto& dd = j["max_drawdown"];
        // 5000 in BND, 100 shares of VTI fall from 50 to 40
        REQUIRE(dd["max_drawdown"].get<double>() == Catch::Approx(-0.1));
        REQUIRE(dd["peak_date"] == "2020-01-01");
        REQUIRE(dd["trough_date"] == "2020-02-03");
        REQUIRE(dd["recovery_date"] == "2020-03-02");
        REQUIRE(dd["drawdowns"].size() == 1);
    }

    SECTION("Chart data follows the equity curve") {
        const auto& chart = j["chart_data"];
        REQUIRE(chart["portfolio_growth"].size() == result.equity_curve.size());
        REQUIRE(chart["portfolio_growth"][0]["value"].get<double>() == Catch::Approx(10000.0));
        REQUIRE(chart["portfolio_growth"][0]["contributions"].get<double>() == Catch::Approx(10000.0));
        REQUIRE(chart["portfolio_balance"][0]["holdings"].size() == 2);
        REQUIRE(chart["portfolio_balance"][0]["holdings"][1]["ticker"] == "VTI");
        REQUIRE(chart["returns"].contains("monthly"));
        REQUIRE(chart["monthly_returns_histogram"].is_array());
    }

    SECTION("Holdings and config") {
        REQUIRE(j["final_holdings"].size() == 2);
        REQUIRE(j["final_holdings"][0]["ticker"] == "BND");
        REQUIRE(j["final_holdings"][1]["market_value"].get<double>() == Catch::Approx(6000.0));
        REQUIRE(j["config"]["mode"] == "basic");
        REQUIRE(j["config"]["base_currency"] == "USD");
        REQUIRE(j["config"]["target_weights"]["VTI"].get<double>() == Catch::Approx(0.5));
        REQUIRE(j["trades"]["total_trades"] == 2);
        REQUIRE(j["dividends"]["payouts"] == 0);
    }
}

TEST_CASE("Dividend summary", "[ResultAssembler]") {
    std::vector<DividendRecord> records(3);
    // reinvested fractionally
    records[0].cash_amount = 20.0; records[0].price = 10.0;
    records[0].shares_reinvested = 2.0; records[0].reinvested = true;
    // whole shares: 25 received, 2 shares at 10, 5 left in cash
    records[1].cash_amount = 25.0; records[1].price = 10.0;
    records[1].shares_reinvested = 2.0; records[1].reinvested = true;
    // paid to cash
    records[2].cash_amount = 7.5;

    auto s = ResultAssembler::summarize_dividends(records);
    REQUIRE(s.payouts == 3);
    REQUIRE(s.total_received == Catch::Approx(52.5));
    REQUIRE(s.reinvested == Catch::Approx(40.0));
    REQUIRE(s.to_cash == Catch::Approx(12.5));

    REQUIRE(ResultAssembler::summarize_dividends({}).payouts == 0);
}

TEST_CASE("Report file output", "[ResultAssembler]") {
    auto p = params();
    auto report = ResultAssembler(p).assemble(BacktestEngine(p).run(two_asset_data()));

    const std::string out = "build/tmp/report_test/report.json";
    std::filesystem::remove_all(std::filesystem::path(out).parent_path());

    REQUIRE_NOTHROW(report.save_json(out));
    std::ifstream f(out);
    REQUIRE(f.is_open());
    auto loaded = nlohmann::json::parse(f);
    REQUIRE(loaded["config"] == report.to_json()["config"]);
    REQUIRE(loaded["final_holdings"].size() == 2);
}
