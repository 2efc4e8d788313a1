#pragma once

#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "backtest/backtest_config.hpp"
#include "backtest/transaction_cost_model.hpp"

namespace allocsim {
namespace backtest {

enum class ResolveScope {
    FULL,       // trade total investable value (cash + holdings) to target
    CASH_ONLY   // deploy only the available cash by target weight, no sells
};

struct RebalancePlan {
    Eigen::VectorXd target_shares;
    Eigen::VectorXd share_deltas;       // target_shares - current shares
    std::vector<TradeCost> trade_costs; // per ticker
    double total_investable = 0.0;      // FULL: cash + holdings, CASH_ONLY: cash
    double leftover_cash = 0.0;         // cash after the plan is applied
    double costs = 0.0;

    bool has_trades() const;
};

// Computes the share deltas that move a portfolio to its target weights.
// Every plan conserves value:
//   FULL:      sum(target * price) + leftover + costs == total_investable
//   CASH_ONLY: sum(delta * price)  + leftover + costs == total_investable
class TransactionResolver {
public:
    virtual ~TransactionResolver() = default;

    // prices must be positive wherever shares or weights are non-zero.
    virtual RebalancePlan resolve(double cash,
                                  const Eigen::VectorXd& shares,
                                  const Eigen::VectorXd& prices,
                                  const Eigen::VectorXd& weights,
                                  ResolveScope scope) const = 0;

    virtual std::string get_name() const = 0;
};

// Frictionless allocation. Whole-share mode floors every target and leaves
// the unallocated remainder in cash.
class TargetWeightResolver : public TransactionResolver {
public:
    explicit TargetWeightResolver(bool fractional_shares);

    RebalancePlan resolve(double cash,
                          const Eigen::VectorXd& shares,
                          const Eigen::VectorXd& prices,
                          const Eigen::VectorXd& weights,
                          ResolveScope scope) const override;

    std::string get_name() const override { return "TargetWeightResolver"; }

    bool fractional_shares() const { return fractional_shares_; }

    // Allocate a given budget instead of the full investable value.
    RebalancePlan resolve_budget(double budget,
                                 double cash,
                                 const Eigen::VectorXd& shares,
                                 const Eigen::VectorXd& prices,
                                 const Eigen::VectorXd& weights,
                                 ResolveScope scope) const;

    static double investable_value(double cash,
                                   const Eigen::VectorXd& shares,
                                   const Eigen::VectorXd& prices,
                                   ResolveScope scope);

private:
    bool fractional_shares_;
};

// Allocation net of proportional execution costs. The budget is shrunk by
// the costs of the trades it implies until the two agree, so costs are paid
// from the rebalanced value and cash never goes negative.
class CostAwareResolver : public TransactionResolver {
public:
    CostAwareResolver(bool fractional_shares, const TransactionCostConfig& costs);

    RebalancePlan resolve(double cash,
                          const Eigen::VectorXd& shares,
                          const Eigen::VectorXd& prices,
                          const Eigen::VectorXd& weights,
                          ResolveScope scope) const override;

    std::string get_name() const override { return "CostAwareResolver"; }

    const TransactionCostModel& cost_model() const { return cost_model_; }

private:
    TargetWeightResolver base_;
    TransactionCostModel cost_model_;

    void price_trades(RebalancePlan& plan, double cash, const Eigen::VectorXd& prices) const;
};

std::unique_ptr<TransactionResolver> make_transaction_resolver(const BacktestParams& params);

} // namespace backtest
} // namespace allocsim
