#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <Eigen/Dense>
#include "backtest/transaction_cost_model.hpp"

namespace allocsim {
namespace backtest {

enum class BacktestMode {
    BASIC,
    REALISTIC
};

// Shared by rebalancing and recurring contributions. NEVER disables either.
enum class Frequency {
    NEVER,
    DAILY,
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    YEARLY
};

// What to do when a ticker has no quote on a day other tickers trade.
enum class GapFillPolicy {
    FAIL,
    CARRY_FORWARD
};

enum class BaseCurrency {
    GBP,
    USD,
    EUR
};

BacktestMode parse_mode(const std::string& s);
Frequency parse_frequency(const std::string& s);
GapFillPolicy parse_gap_fill(const std::string& s);
BaseCurrency parse_base_currency(const std::string& s);

std::string to_string(BacktestMode mode);
std::string to_string(Frequency freq);
std::string to_string(GapFillPolicy policy);
std::string to_string(BaseCurrency ccy);

constexpr double kWeightSumTolerance = 1e-4;

struct StrategyConfig {
    bool fractional_shares = true;
    bool reinvest_dividends = true;
    Frequency rebalance_frequency = Frequency::NEVER;
    GapFillPolicy gap_fill = GapFillPolicy::FAIL;

    static StrategyConfig from_json(const nlohmann::json& j);
};

struct RecurringContribution {
    double amount = 0.0;
    Frequency frequency = Frequency::NEVER;

    bool enabled() const { return frequency != Frequency::NEVER; }

    static RecurringContribution from_json(const nlohmann::json& j);
};

// Raw run request as supplied by the caller. Nothing is validated here.
struct BacktestConfig {
    std::string start_date;
    std::string end_date;
    BaseCurrency base_currency = BaseCurrency::USD;
    double initial_investment = 0.0;
    std::vector<std::pair<std::string, double>> target_weights;
    std::optional<RecurringContribution> recurring_investment;
    StrategyConfig strategy;
    BacktestMode mode = BacktestMode::BASIC;
    double risk_free_rate = 0.0;
    TransactionCostConfig transaction_costs;
    bool verbose = false;

    // Throws ConfigurationError on malformed fields or unknown enum values.
    static BacktestConfig from_json(const nlohmann::json& j);
};

// Validated, fully materialized run parameters. Mode-dependent defaults are
// applied here once so the engine never branches on mode.
struct BacktestParams {
    std::string start_date;   // ISO
    std::string end_date;     // ISO
    BaseCurrency base_currency = BaseCurrency::USD;
    double initial_investment = 0.0;
    std::vector<std::string> tickers;
    Eigen::VectorXd target_weights;
    BacktestMode mode = BacktestMode::BASIC;
    StrategyConfig strategy;
    RecurringContribution contribution;
    double risk_free_rate = 0.0;
    TransactionCostConfig transaction_costs;
    bool verbose = false;

    // Throws ConfigurationError.
    static BacktestParams from_config(const BacktestConfig& config);
};

} // namespace backtest
} // namespace allocsim
