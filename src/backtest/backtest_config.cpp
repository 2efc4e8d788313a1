#include "backtest/backtest_config.hpp"
#include "backtest/errors.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace allocsim {
namespace backtest {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

BacktestMode parse_mode(const std::string& s) {
    auto v = to_lower(s);
    if (v == "basic") return BacktestMode::BASIC;
    if (v == "realistic") return BacktestMode::REALISTIC;
    throw ConfigurationError("Invalid backtest mode: " + s);
}

Frequency parse_frequency(const std::string& s) {
    auto v = to_lower(s);
    if (v == "never" || v == "none") return Frequency::NEVER;
    if (v == "daily" || v == "d") return Frequency::DAILY;
    if (v == "weekly" || v == "w") return Frequency::WEEKLY;
    if (v == "monthly" || v == "m") return Frequency::MONTHLY;
    if (v == "quarterly" || v == "q") return Frequency::QUARTERLY;
    if (v == "yearly" || v == "annually" || v == "annual" || v == "y") return Frequency::YEARLY;
    throw ConfigurationError("Invalid frequency: " + s);
}

GapFillPolicy parse_gap_fill(const std::string& s) {
    auto v = to_lower(s);
    if (v == "fail") return GapFillPolicy::FAIL;
    if (v == "carry_forward" || v == "ffill") return GapFillPolicy::CARRY_FORWARD;
    throw ConfigurationError("Invalid gap fill policy: " + s);
}

BaseCurrency parse_base_currency(const std::string& s) {
    auto v = to_lower(s);
    if (v == "gbp") return BaseCurrency::GBP;
    if (v == "usd") return BaseCurrency::USD;
    if (v == "eur") return BaseCurrency::EUR;
    throw ConfigurationError("Invalid base currency: " + s);
}

std::string to_string(BacktestMode mode) {
    return mode == BacktestMode::BASIC ? "basic" : "realistic";
}

std::string to_string(Frequency freq) {
    switch (freq) {
        case Frequency::NEVER: return "never";
        case Frequency::DAILY: return "daily";
        case Frequency::WEEKLY: return "weekly";
        case Frequency::MONTHLY: return "monthly";
        case Frequency::QUARTERLY: return "quarterly";
        case Frequency::YEARLY: return "yearly";
    }
    return "never";
}

std::string to_string(GapFillPolicy policy) {
    return policy == GapFillPolicy::FAIL ? "fail" : "carry_forward";
}

std::string to_string(BaseCurrency ccy) {
    switch (ccy) {
        case BaseCurrency::GBP: return "GBP";
        case BaseCurrency::USD: return "USD";
        case BaseCurrency::EUR: return "EUR";
    }
    return "USD";
}

StrategyConfig StrategyConfig::from_json(const nlohmann::json& j) {
    StrategyConfig cfg;
    cfg.fractional_shares = j.value("fractional_shares", cfg.fractional_shares);
    cfg.reinvest_dividends = j.value("reinvest_dividends", cfg.reinvest_dividends);
    if (j.contains("rebalance_frequency")) {
        cfg.rebalance_frequency = parse_frequency(j.at("rebalance_frequency").get<std::string>());
    }
    if (j.contains("gap_fill")) {
        cfg.gap_fill = parse_gap_fill(j.at("gap_fill").get<std::string>());
    }
    return cfg;
}

RecurringContribution RecurringContribution::from_json(const nlohmann::json& j) {
    RecurringContribution rc;
    rc.amount = j.value("amount", 0.0);
    if (j.contains("frequency")) {
        rc.frequency = parse_frequency(j.at("frequency").get<std::string>());
    }
    return rc;
}

BacktestConfig BacktestConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Backtest configuration must be a JSON object");
    }

    BacktestConfig cfg;
    try {
        cfg.start_date = j.value("start_date", "");
        cfg.end_date = j.value("end_date", "");
        if (j.contains("base_currency")) {
            cfg.base_currency = parse_base_currency(j.at("base_currency").get<std::string>());
        }
        cfg.initial_investment = j.value("initial_investment", 0.0);

        if (j.contains("target_weights")) {
            const auto& weights = j.at("target_weights");
            if (!weights.is_object()) {
                throw ConfigurationError("'target_weights' must map ticker to fraction");
            }
            for (auto it = weights.begin(); it != weights.end(); ++it) {
                cfg.target_weights.emplace_back(it.key(), it.value().get<double>());
            }
        }

        if (j.contains("recurring_investment") && !j.at("recurring_investment").is_null()) {
            cfg.recurring_investment = RecurringContribution::from_json(j.at("recurring_investment"));
        }
        if (j.contains("strategy")) {
            cfg.strategy = StrategyConfig::from_json(j.at("strategy"));
        }
        if (j.contains("mode")) {
            cfg.mode = parse_mode(j.at("mode").get<std::string>());
        }
        cfg.risk_free_rate = j.value("risk_free_rate", 0.0);
        if (j.contains("transaction_costs")) {
            cfg.transaction_costs = TransactionCostConfig::from_json(j.at("transaction_costs"));
        }
        cfg.verbose = j.value("verbose", false);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed backtest configuration: " + std::string(e.what()));
    }
    return cfg;
}

static std::string normalize_or_throw(const std::string& value, const std::string& field) {
    if (value.empty()) {
        throw ConfigurationError("Missing required field '" + field + "'");
    }
    try {
        return date_utils::normalize_date(value);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("Invalid '" + field + "': " + e.what());
    }
}

BacktestParams BacktestParams::from_config(const BacktestConfig& config) {
    BacktestParams p;

    p.start_date = normalize_or_throw(config.start_date, "start_date");
    p.end_date = normalize_or_throw(config.end_date, "end_date");
    if (!(p.start_date < p.end_date)) {
        throw ConfigurationError("start_date (" + p.start_date + ") must be before end_date (" + p.end_date + ")");
    }

    if (!(config.initial_investment > 0.0) || !std::isfinite(config.initial_investment)) {
        std::ostringstream ss; ss << config.initial_investment;
        throw ConfigurationError("Expected positive value for parameter 'initial_investment', got: " + ss.str());
    }
    p.initial_investment = config.initial_investment;

    if (config.target_weights.empty()) {
        throw ConfigurationError("target_weights must name at least one ticker");
    }
    std::set<std::string> seen;
    double sum = 0.0;
    p.target_weights = Eigen::VectorXd(static_cast<Eigen::Index>(config.target_weights.size()));
    for (size_t i = 0; i < config.target_weights.size(); ++i) {
        const auto& ticker = config.target_weights[i].first;
        double w = config.target_weights[i].second;
        if (ticker.empty()) {
            throw ConfigurationError("target_weights contains an empty ticker");
        }
        if (!seen.insert(ticker).second) {
            throw ConfigurationError("Duplicate ticker in target_weights: " + ticker);
        }
        if (!(w >= 0.0) || !std::isfinite(w)) {
            std::ostringstream ss; ss << w;
            throw ConfigurationError("Expected non-negative weight for " + ticker + ", got: " + ss.str());
        }
        p.tickers.push_back(ticker);
        p.target_weights[static_cast<Eigen::Index>(i)] = w;
        sum += w;
    }
    if (std::abs(sum - 1.0) > kWeightSumTolerance) {
        std::ostringstream ss; ss << sum;
        throw ConfigurationError("target_weights must sum to 1, got: " + ss.str());
    }

    if (config.recurring_investment && config.recurring_investment->enabled()) {
        const auto& rc = *config.recurring_investment;
        if (!(rc.amount > 0.0) || !std::isfinite(rc.amount)) {
            std::ostringstream ss; ss << rc.amount;
            throw ConfigurationError("Expected positive value for recurring investment 'amount', got: " + ss.str());
        }
        p.contribution = rc;
    }

    if (!std::isfinite(config.risk_free_rate)) {
        throw ConfigurationError("risk_free_rate must be finite");
    }

    const auto& tc = config.transaction_costs;
    if (!(tc.commission_rate >= 0.0) || !(tc.slippage_bps >= 0.0) ||
        !std::isfinite(tc.commission_rate) || !std::isfinite(tc.slippage_bps) ||
        tc.commission_rate + tc.slippage_bps / 10000.0 >= 1.0) {
        throw ConfigurationError("transaction_costs must be non-negative with a combined rate below 1");
    }

    p.base_currency = config.base_currency;
    p.mode = config.mode;
    p.strategy = config.strategy;
    p.transaction_costs = tc;
    p.risk_free_rate = config.risk_free_rate;
    p.verbose = config.verbose;

    if (p.mode == BacktestMode::BASIC) {
        p.strategy.fractional_shares = true;
        p.strategy.reinvest_dividends = true;
        p.transaction_costs = TransactionCostConfig::default_config();
    }

    return p;
}

} // namespace backtest
} // namespace allocsim
