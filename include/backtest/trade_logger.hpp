#pragma once

#include <string>
#include <vector>
#include <Eigen/Dense>
#include "backtest/transaction_cost_model.hpp"

namespace allocsim {
namespace backtest {

enum class TradeReason {
    FUNDING,
    REBALANCE,
    CONTRIBUTION,
    DIVIDEND_REINVESTMENT
};

std::string to_string(TradeReason reason);

struct TradeRecord {
    int trade_id = 0;
    std::string date;
    std::string ticker;
    TradeReason reason = TradeReason::REBALANCE;
    double shares = 0.0;     // signed
    double price = 0.0;
    double notional = 0.0;   // signed, shares * price
    double commission = 0.0;
    double slippage = 0.0;
    double total_cost = 0.0;
    double pre_trade_weight = 0.0;
    double post_trade_weight = 0.0;
};

struct TradeSummary {
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    double total_notional = 0.0;
    double total_costs = 0.0;
    double avg_cost_per_trade = 0.0;
    int rebalance_count = 0;
    double turnover = 0.0;
};

class TradeLogger {
public:
    TradeLogger() = default;
    ~TradeLogger() = default;

    void log_trade(const TradeRecord& record);

    // Records one allocation event. Tickers without a share change are skipped.
    void log_allocation(const std::string& date,
                        TradeReason reason,
                        const std::vector<std::string>& tickers,
                        const Eigen::VectorXd& shares_traded,
                        const Eigen::VectorXd& prices,
                        const std::vector<TradeCost>& costs,
                        const Eigen::VectorXd& pre_weights,
                        const Eigen::VectorXd& post_weights);

    const std::vector<TradeRecord>& trades() const { return trades_; }
    std::vector<TradeRecord> trades_for_date(const std::string& date) const;
    std::vector<TradeRecord> trades_for_ticker(const std::string& ticker) const;
    TradeSummary get_summary() const;
    int num_trades() const { return static_cast<int>(trades_.size()); }

    void export_to_csv(const std::string& filepath) const;

    void clear() { trades_.clear(); next_trade_id_ = 0; rebalance_count_ = 0; turnover_ = 0.0; }

private:
    std::vector<TradeRecord> trades_;
    int next_trade_id_ = 0;
    int rebalance_count_ = 0;
    double turnover_ = 0.0;
};

} // namespace backtest
} // namespace allocsim
