/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and MarketData classes
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/price_provider.hpp"
#include "backtest/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <fstream>
#include <limits>
#include <memory>

using namespace allocsim;
using Catch::Matchers::WithinAbs;

namespace {

std::string write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
    return path;
}

const double NaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

TEST_CASE("MarketData construction", "[MarketData]") {
    Eigen::MatrixXd prices(3, 2);
    prices << 100.0, 150.0,
              101.0, NaN,
              102.0, 152.0;
    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03"};
    std::vector<std::string> tickers = {"AAPL", "MSFT"};

    SECTION("Prices only") {
        MarketData data(prices, dates, tickers);
        REQUIRE(data.num_dates() == 3);
        REQUIRE(data.num_assets() == 2);
        REQUIRE(data.get_dates() == dates);
        REQUIRE(data.get_tickers() == tickers);
        REQUIRE(data.get_dividends().isZero());
        REQUIRE(data.has_price(0, 1));
        REQUIRE_FALSE(data.has_price(1, 1));
        REQUIRE(data.count_quotes(1) == 2);
        REQUIRE(data.count_missing() == 1);
        REQUIRE(data.get_price("AAPL", "2020-01-02") == 101.0);
    }

    SECTION("Dividends") {
        Eigen::MatrixXd dividends = Eigen::MatrixXd::Zero(3, 2);
        dividends(2, 0) = 0.5;
        MarketData data(prices, dividends, dates, tickers);
        REQUIRE(data.dividend(2, 0) == 0.5);
        REQUIRE(data.get_dividend("AAPL", "2020-01-03") == 0.5);
    }

    SECTION("Error: unordered dates") {
        std::vector<std::string> bad = {"2020-01-02", "2020-01-01", "2020-01-03"};
        REQUIRE_THROWS_AS(MarketData(prices, bad, tickers), std::invalid_argument);
    }

    SECTION("Error: non-positive price") {
        Eigen::MatrixXd bad = prices;
        bad(0, 0) = 0.0;
        REQUIRE_THROWS_AS(MarketData(bad, dates, tickers), std::invalid_argument);
    }

    SECTION("Error: negative dividend") {
        Eigen::MatrixXd dividends = Eigen::MatrixXd::Zero(3, 2);
        dividends(0, 0) = -1.0;
        REQUIRE_THROWS_AS(MarketData(prices, dividends, dates, tickers), std::invalid_argument);
    }

    SECTION("Error: duplicate ticker") {
        std::vector<std::string> dup = {"AAPL", "AAPL"};
        REQUIRE_THROWS_AS(MarketData(prices, dates, dup), std::invalid_argument);
    }
}

TEST_CASE("Data filtering", "[MarketData]") {
    Eigen::MatrixXd prices(5, 2);
    prices << 100.0, 200.0,
              110.0, 210.0,
              105.0, 220.0,
              115.0, 215.0,
              120.0, 225.0;
    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-06", "2020-01-07"};
    std::vector<std::string> tickers = {"AAPL", "MSFT"};
    MarketData data(prices, dates, tickers);
    data.set_currency("MSFT", "EUR");

    SECTION("Filter by date") {
        auto filtered = data.filter_by_date("2020-01-02", "2020-01-06");
        REQUIRE(filtered.num_dates() == 3);
        REQUIRE(filtered.get_dates().front() == "2020-01-02");
        REQUIRE(filtered.get_dates().back() == "2020-01-06");
        REQUIRE(filtered.currency("MSFT") == "EUR");
    }

    SECTION("Select assets keeps currency") {
        auto selected = data.select_assets({"MSFT"});
        REQUIRE(selected.num_assets() == 1);
        REQUIRE(selected.get_tickers()[0] == "MSFT");
        REQUIRE(selected.currency("MSFT") == "EUR");
        REQUIRE(selected.price(4, 0) == 225.0);
    }
}

TEST_CASE("Load long-format CSV", "[DataLoader]") {
    std::string path = write_file("/tmp/allocsim_prices_long.csv",
        "date,ticker,adj_close,dividend,currency\n"
        "2020-01-02,AAA,10.0,0,USD\n"
        "2020-01-02,BBB,200.5,,GBX\n"
        "03/01/2020,AAA,10.5,0.25,USD\n"
        "2020-01-03,BBB,,,GBX\n"
        "not-a-date,AAA,11.0,0,USD\n"
        "2020-01-06,AAA,11.0,0,USD\n"
        "2020-01-06,BBB,201.0,1.5,GBX\n");

    auto data = DataLoader::load_csv(path);

    REQUIRE(data.num_assets() == 2);
    REQUIRE(data.num_dates() == 3);
    REQUIRE(data.get_dates()[1] == "2020-01-03");
    REQUIRE(data.get_price("AAA", "2020-01-03") == 10.5);
    REQUIRE(data.get_dividend("AAA", "2020-01-03") == 0.25);
    REQUIRE(std::isnan(data.get_price("BBB", "2020-01-03")));
    REQUIRE(data.get_dividend("BBB", "2020-01-06") == 1.5);
    REQUIRE(data.currency("AAA") == "USD");
    REQUIRE(data.currency("BBB") == "GBX");

    SECTION("Ticker filter") {
        auto only = DataLoader::load_csv_long(path, {"BBB"});
        REQUIRE(only.num_assets() == 1);
        REQUIRE(only.get_tickers()[0] == "BBB");
    }
}

TEST_CASE("Load CSV errors", "[DataLoader]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_csv("/tmp/allocsim_does_not_exist.csv"), std::runtime_error);
    }

    SECTION("Missing required column") {
        std::string path = write_file("/tmp/allocsim_bad_header.csv",
            "date,ticker,volume\n2020-01-02,AAA,100\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv_long(path), std::runtime_error);
    }

    SECTION("Conflicting currencies") {
        std::string path = write_file("/tmp/allocsim_two_ccy.csv",
            "date,ticker,adj_close,dividend,currency\n"
            "2020-01-02,AAA,10,0,USD\n"
            "2020-01-03,AAA,10,0,EUR\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv_long(path), std::runtime_error);
    }
}

TEST_CASE("Load wide-format CSV", "[DataLoader]") {
    std::string path = write_file("/tmp/allocsim_prices_wide.csv",
        "date,AAA,BBB\n"
        "2020-01-02,10.0,20.0\n"
        "2020-01-03,,21.0\n");

    auto data = DataLoader::load_csv(path);
    REQUIRE(data.num_assets() == 2);
    REQUIRE(data.num_dates() == 2);
    REQUIRE_FALSE(data.has_price(1, 0));
    REQUIRE(data.get_price("BBB", "2020-01-03") == 21.0);
}

TEST_CASE("Load FX CSV", "[DataLoader]") {
    std::string path = write_file("/tmp/allocsim_fx.csv",
        "date,from,to,rate\n"
        "2020-01-02,USD,GBP,0.75\n"
        "2020-01-06,USD,GBP,0.80\n");

    auto rates = DataLoader::load_fx_csv(path);
    REQUIRE(rates.size() == 2);
    REQUIRE_THAT(rates.rate("USD", "GBP", "2020-01-03"), WithinAbs(0.75, 1e-12));
    REQUIRE_THAT(rates.rate("USD", "GBP", "2020-01-07"), WithinAbs(0.80, 1e-12));

    SECTION("Invalid rate") {
        std::string bad = write_file("/tmp/allocsim_fx_bad.csv",
            "date,from,to,rate\n2020-01-02,USD,GBP,-1\n");
        REQUIRE_THROWS_AS(DataLoader::load_fx_csv(bad), std::runtime_error);
    }
}

TEST_CASE("Load JSON", "[DataLoader]") {
    SECTION("Malformed JSON") {
        std::string path = write_file("/tmp/allocsim_bad.json", "{ \"start_date\": ");
        REQUIRE_THROWS_AS(DataLoader::load_json(path), std::runtime_error);
    }

    SECTION("Backtest config") {
        std::string path = write_file("/tmp/allocsim_config.json",
            R"({"start_date": "2020-01-01", "end_date": "2020-12-31",
                "initial_investment": 1000, "target_weights": {"AAA": 1.0}})");
        auto cfg = DataLoader::load_backtest_config(path);
        REQUIRE(cfg.start_date == "2020-01-01");
        REQUIRE(cfg.initial_investment == 1000.0);
        REQUIRE(cfg.target_weights.size() == 1);
    }
}

TEST_CASE("Synthetic data generation", "[DataLoader]") {
    std::vector<std::string> tickers = {"A", "B", "C"};
    auto data = DataLoader::generate_synthetic_data(tickers, 260, "2020-01-01", 0.01, 0.0003, 0.04, 7);

    REQUIRE(data.num_dates() == 260);
    REQUIRE(data.num_assets() == 3);
    REQUIRE(data.get_prices()(0, 0) == 100.0);
    REQUIRE((data.get_prices().array() > 0.0).all());
    REQUIRE(data.get_dividends().sum() > 0.0);

    // weekdays only
    for (const auto& d : data.get_dates()) {
        REQUIRE(d != "2020-01-04");
        REQUIRE(d != "2020-01-05");
    }

    SECTION("Same seed, same data") {
        auto again = DataLoader::generate_synthetic_data(tickers, 260, "2020-01-01", 0.01, 0.0003, 0.04, 7);
        REQUIRE(again.get_prices() == data.get_prices());
    }

    SECTION("Long CSV round trip keeps dividends") {
        DataLoader::save_csv_long(data, "/tmp/allocsim_synth.csv");
        auto loaded = DataLoader::load_csv("/tmp/allocsim_synth.csv");
        REQUIRE(loaded.num_dates() == data.num_dates());
        REQUIRE_THAT(loaded.get_dividends().sum(), WithinAbs(data.get_dividends().sum(), 1e-4));
    }
}

TEST_CASE("In-memory price provider", "[PriceProvider]") {
    auto data = std::make_shared<const MarketData>(
        DataLoader::generate_synthetic_data({"A", "B"}, 30, "2020-01-01"));
    InMemoryPriceProvider provider(data);

    auto slice = provider.query({"B"}, "2020-01-06", "2020-01-10");
    REQUIRE(slice.num_assets() == 1);
    REQUIRE(slice.num_dates() == 5);

    REQUIRE_THROWS_AS(provider.query({"Z"}, "2020-01-01", "2020-02-01"), backtest::MissingPriceDataError);
}
