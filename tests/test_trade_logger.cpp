#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "backtest/trade_logger.hpp"
#include <Eigen/Dense>
#include <fstream>
#include <filesystem>

using namespace allocsim::backtest;

TEST_CASE("TradeLogger logging", "[TradeLogger]") {
    TradeLogger logger;

    // single trade
    TradeRecord r;
    r.trade_id = -1;
    r.date = "2020-01-01";
    r.ticker = "AAA";
    r.reason = TradeReason::FUNDING;
    r.shares = 5.0;
    r.price = 10.0;
    r.notional = r.shares * r.price;
    r.commission = 0.5;
    r.slippage = 0.2;
    r.total_cost = r.commission + r.slippage;
    r.pre_trade_weight = 0.0;
    r.post_trade_weight = 0.05;

    logger.log_trade(r);
    REQUIRE(logger.num_trades() == 1);
    REQUIRE(logger.trades().front().trade_id == 0);

    // allocation batch: the zero-share ticker is skipped
    std::vector<std::string> tickers = {"A","B","C"};
    Eigen::VectorXd shares(3);
    shares << 10.0, 0.0, -5.0;
    Eigen::VectorXd prices(3);
    prices << 1.0, 2.0, 3.0;
    std::vector<TradeCost> costs(3);
    costs[0].commission = 0.1;
    costs[2].commission = 0.2; costs[2].slippage = 0.1;
    Eigen::VectorXd pre_w(3); pre_w << 0.1, 0.2, 0.3;
    Eigen::VectorXd post_w(3); post_w << 0.2, 0.2, 0.1;

    logger.log_allocation("2020-01-02", TradeReason::REBALANCE, tickers, shares, prices, costs, pre_w, post_w);
    REQUIRE(logger.num_trades() == 3);
    auto all = logger.trades();
    REQUIRE(all[0].trade_id == 0);
    REQUIRE(all[1].trade_id == 1);
    REQUIRE(all[2].trade_id == 2);
    REQUIRE(all[2].ticker == "C");
    REQUIRE(all[2].reason == TradeReason::REBALANCE);
    REQUIRE(all[2].notional == Catch::Approx(-15.0));
    REQUIRE(all[2].total_cost == Catch::Approx(0.3));

    SECTION("Error: mismatched sizes") {
        std::vector<TradeCost> short_costs(2);
        REQUIRE_THROWS_AS(logger.log_allocation("2020-01-03", TradeReason::CONTRIBUTION, tickers, shares,
                                                prices, short_costs, pre_w, post_w),
                          std::invalid_argument);
    }

    SECTION("Clear resets ids") {
        logger.clear();
        REQUIRE(logger.num_trades() == 0);
        logger.log_trade(r);
        REQUIRE(logger.trades().front().trade_id == 0);
    }
}

TEST_CASE("TradeLogger queries", "[TradeLogger]") {
    TradeLogger logger;
    TradeRecord r1{0, "2020-01-01", "AAA", TradeReason::FUNDING, 5.0, 10.0, 50.0, 0.5, 0.2, 0.7, 0.0, 0.05};
    TradeRecord r2{1, "2020-01-02", "BBB", TradeReason::REBALANCE, -2.0, 20.0, -40.0, 0.2, 0.0, 0.2, 0.1, 0.0};
    logger.log_trade(r1);
    logger.log_trade(r2);

    auto d1 = logger.trades_for_date("2020-01-01");
    REQUIRE(d1.size() == 1);
    REQUIRE(d1.front().ticker == "AAA");

    auto tbb = logger.trades_for_ticker("BBB");
    REQUIRE(tbb.size() == 1);
    REQUIRE(tbb.front().date == "2020-01-02");

    auto none = logger.trades_for_date("1999-01-01");
    REQUIRE(none.empty());
}

TEST_CASE("TradeLogger summary", "[TradeLogger]") {
    TradeLogger logger;
    TradeRecord r1{0, "2020-01-01", "AAA", TradeReason::FUNDING, 5.0, 10.0, 50.0, 0.5, 0.2, 0.7, 0.0, 0.05};
    TradeRecord r2{1, "2020-01-02", "BBB", TradeReason::REBALANCE, -2.0, 20.0, -40.0, 0.2, 0.0, 0.2, 0.1, 0.0};
    logger.log_trade(r1);
    logger.log_trade(r2);

    std::vector<std::string> tickers = {"A","B"};
    Eigen::VectorXd shares(2); shares << 1.0, -1.0;
    Eigen::VectorXd prices(2); prices << 1.0, 2.0;
    std::vector<TradeCost> costs(2);
    Eigen::VectorXd pre_w(2); pre_w << 0.1, 0.2;
    Eigen::VectorXd post_w(2); post_w << 0.2, 0.1;
    logger.log_allocation("2020-01-03", TradeReason::REBALANCE, tickers, shares, prices, costs, pre_w, post_w);

    // contributions trade but do not count as rebalances
    Eigen::VectorXd buy(2); buy << 3.0, 0.0;
    logger.log_allocation("2020-02-03", TradeReason::CONTRIBUTION, tickers, buy, prices, costs, post_w, post_w);

    auto s = logger.get_summary();
    REQUIRE(s.total_trades == logger.num_trades());
    REQUIRE(s.buy_trades == 3);
    REQUIRE(s.sell_trades == 2);
    REQUIRE(s.total_notional == Catch::Approx(50.0 + 40.0 + 1.0 + 2.0 + 3.0));
    REQUIRE(s.total_costs == Catch::Approx(r1.total_cost + r2.total_cost));
    REQUIRE(s.avg_cost_per_trade == Catch::Approx(s.total_costs / 5.0));
    REQUIRE(s.rebalance_count == 1);

    // (|0.2-0.1| + |0.1-0.2|)/2 = 0.1
    REQUIRE(s.turnover == Catch::Approx(0.1));
}

TEST_CASE("TradeLogger export", "[TradeLogger]") {
    TradeLogger logger;
    TradeRecord r{0, "2020-01-01", "AAA", TradeReason::DIVIDEND_REINVESTMENT, 5.0, 10.0, 50.0, 0.0, 0.0, 0.0, 0.0, 0.05};
    logger.log_trade(r);

    const std::string out = "build/tmp/trades_test/trades.csv";
    std::filesystem::remove_all(std::filesystem::path(out).parent_path());

    REQUIRE_NOTHROW(logger.export_to_csv(out));
    REQUIRE(std::filesystem::exists(out));

    std::ifstream f(out);
    REQUIRE(f.is_open());
    std::string header;
    std::getline(f, header);
    REQUIRE(header == "trade_id,date,ticker,reason,shares,price,notional,commission,slippage,total_cost,pre_trade_weight,post_trade_weight");

    std::string row;
    std::getline(f, row);
    REQUIRE(row.find("dividend_reinvestment") != std::string::npos);
}
