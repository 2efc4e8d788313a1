// Unit tests for TransactionCostModel

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "backtest/transaction_cost_model.hpp"

using namespace allocsim::backtest;
using Catch::Matchers::WithinAbs;

TEST_CASE("TransactionCostModel construction", "[TransactionCostModel]") {
    SECTION("Default config charges nothing") {
        TransactionCostModel m;
        REQUIRE(m.get_name() == "TransactionCostModel");
        REQUIRE(m.config().is_zero());
        REQUIRE(m.proportional_rate() == 0.0);
    }

    SECTION("Custom config") {
        TransactionCostConfig cfg;
        cfg.commission_rate = 0.001;
        cfg.slippage_bps = 5.0;
        TransactionCostModel m(cfg);
        REQUIRE(m.config().commission_rate == 0.001);
        REQUIRE_FALSE(m.config().is_zero());
        REQUIRE_THAT(m.proportional_rate(), WithinAbs(0.0015, 1e-15));
    }

    SECTION("From JSON") {
        auto cfg = TransactionCostConfig::from_json({{"commission_rate", 0.002}, {"slippage_bps", 3.0}});
        REQUIRE(cfg.commission_rate == 0.002);
        REQUIRE(cfg.slippage_bps == 3.0);
        REQUIRE(TransactionCostConfig::from_json(nlohmann::json()).is_zero());
    }

    SECTION("Error: negative commission rate") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.commission_rate = -0.1;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), std::invalid_argument);
    }

    SECTION("Error: negative slippage") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.slippage_bps = -1.0;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), std::invalid_argument);
    }

    SECTION("Error: combined rate of 100%") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.commission_rate = 0.5;
        cfg.slippage_bps = 5000.0;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), std::invalid_argument);
    }
}

TEST_CASE("Commission calculation", "[TransactionCostModel]") {
    TransactionCostConfig cfg = TransactionCostConfig::default_config();
    cfg.commission_rate = 0.001; // 10 bps
    TransactionCostModel m(cfg);

    TradeOrder buy{"ABC", 100.0, 100.0}; // $10,000
    TradeCost c = m.calculate_cost(buy);
    REQUIRE_THAT(c.commission, WithinAbs(10000.0 * 0.001, 1e-12));
    REQUIRE(c.slippage == 0.0);

    TradeOrder zero{"ABC", 0.0, 100.0};
    REQUIRE_THAT(m.calculate_cost(zero).commission, WithinAbs(0.0, 1e-12));

    TradeOrder sell{"ABC", -100.0, 100.0};
    REQUIRE_THAT(m.calculate_cost(sell).commission, WithinAbs(c.commission, 1e-12));

    TradeOrder bad{"ABC", 10.0, 0.0};
    REQUIRE_THROWS_AS(m.calculate_cost(bad), std::invalid_argument);
}

TEST_CASE("Slippage calculation", "[TransactionCostModel]") {
    TransactionCostConfig cfg = TransactionCostConfig::default_config();
    cfg.slippage_bps = 5.0; // 5 bps
    TransactionCostModel m(cfg);

    TradeOrder order{"XYZ", 50.0, 200.0}; // $10,000
    TradeCost c = m.calculate_cost(order);
    REQUIRE_THAT(c.slippage, WithinAbs(10000.0 * 0.0005, 1e-12));
    REQUIRE_THAT(c.total(), WithinAbs(5.0, 1e-12));
}
