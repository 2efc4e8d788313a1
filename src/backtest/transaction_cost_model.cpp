#include "backtest/transaction_cost_model.hpp"

#include <sstream>

namespace allocsim {
namespace backtest {

TransactionCostConfig TransactionCostConfig::default_config() {
    return TransactionCostConfig{};
}

TransactionCostConfig TransactionCostConfig::from_json(const nlohmann::json& j) {
    TransactionCostConfig cfg = default_config();
    if (j.is_object()) {
        cfg.commission_rate = j.value("commission_rate", cfg.commission_rate);
        cfg.slippage_bps = j.value("slippage_bps", cfg.slippage_bps);
    }
    return cfg;
}

TransactionCostModel::TransactionCostModel(const TransactionCostConfig& config)
    : config_(config) {
    validate_config();
}

TransactionCostModel::TransactionCostModel()
    : config_(TransactionCostConfig::default_config()) {
}

void TransactionCostModel::validate_config() const {
    if (!(config_.commission_rate >= 0.0) || !std::isfinite(config_.commission_rate)) {
        std::ostringstream ss; ss << config_.commission_rate;
        throw std::invalid_argument("Expected non-negative value for parameter 'commission_rate', got: " + ss.str());
    }
    if (!(config_.slippage_bps >= 0.0) || !std::isfinite(config_.slippage_bps)) {
        std::ostringstream ss; ss << config_.slippage_bps;
        throw std::invalid_argument("Expected non-negative value for parameter 'slippage_bps', got: " + ss.str());
    }
    if (proportional_rate() >= 1.0) {
        std::ostringstream ss; ss << proportional_rate();
        throw std::invalid_argument("Combined cost rate must be below 1, got: " + ss.str());
    }
}

TradeCost TransactionCostModel::calculate_cost(const TradeOrder& order) const {
    if (order.price <= 0.0) {
        std::ostringstream ss; ss << order.price;
        throw std::invalid_argument("Expected positive value for parameter 'price', got: " + ss.str());
    }
    double notional = order.notional();
    return TradeCost{commission_cost(notional), slippage_cost(notional)};
}

double TransactionCostModel::proportional_rate() const {
    return config_.commission_rate + config_.slippage_bps / 10000.0;
}

double TransactionCostModel::commission_cost(double notional) const {
    return std::abs(notional) * config_.commission_rate;
}

double TransactionCostModel::slippage_cost(double notional) const {
    return std::abs(notional) * (config_.slippage_bps / 10000.0);
}

} // namespace backtest
} // namespace allocsim
