// transaction_cost_model.hpp
#pragma once

#include <cmath>
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace allocsim {
namespace backtest {

struct TradeOrder {
    std::string ticker;
    double shares{0.0};   // signed: positive buys, negative sells
    double price{0.0};
    double notional() const { return std::abs(shares * price); }
};

struct TradeCost {
    double commission{0.0};
    double slippage{0.0};
    double total() const { return commission + slippage; }
};

// Proportional execution costs applied by the REALISTIC resolver.
// Defaults charge nothing.
struct TransactionCostConfig {
    double commission_rate{0.0};   // fraction of traded notional
    double slippage_bps{0.0};      // basis points of traded notional

    bool is_zero() const { return commission_rate == 0.0 && slippage_bps == 0.0; }

    static TransactionCostConfig from_json(const nlohmann::json& j);
    static TransactionCostConfig default_config();
};

class TransactionCostModel {
public:
    explicit TransactionCostModel(const TransactionCostConfig& config);
    TransactionCostModel();
    ~TransactionCostModel() = default;

    TradeCost calculate_cost(const TradeOrder& order) const;

    // Cost charged per unit of traded notional.
    double proportional_rate() const;

    const TransactionCostConfig& config() const { return config_; }

    double commission_cost(double notional) const;
    double slippage_cost(double notional) const;

private:
    TransactionCostConfig config_;
    void validate_config() const;
};

} // namespace backtest
} // namespace allocsim
