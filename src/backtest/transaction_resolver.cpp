#include "backtest/transaction_resolver.hpp"
#include "backtest/errors.hpp"
#include "backtest/portfolio.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace allocsim {
namespace backtest {

namespace {

// Orders smaller than this notional are not worth executing.
const double kMinOrderNotional = 0.01;
const double kMinFractionalDelta = 1e-12;
const int kMaxCostIterations = 50;
const double kCostConvergence = 1e-10;

void check_sizes(const Eigen::VectorXd& shares,
                 const Eigen::VectorXd& prices,
                 const Eigen::VectorXd& weights) {
    if (shares.size() != prices.size() || shares.size() != weights.size()) {
        throw std::invalid_argument("Expected equal sizes for shares, prices and weights");
    }
}

double trade_value(const Eigen::VectorXd& deltas, const Eigen::VectorXd& prices) {
    double sum = 0.0;
    for (Eigen::Index i = 0; i < deltas.size(); ++i) {
        if (deltas[i] != 0.0) sum += deltas[i] * prices[i];
    }
    return sum;
}

} // namespace

bool RebalancePlan::has_trades() const {
    for (Eigen::Index i = 0; i < share_deltas.size(); ++i) {
        if (share_deltas[i] != 0.0) return true;
    }
    return false;
}

// ------------------------- TargetWeightResolver -----------------------------

TargetWeightResolver::TargetWeightResolver(bool fractional_shares)
    : fractional_shares_(fractional_shares) {}

double TargetWeightResolver::investable_value(double cash,
                                              const Eigen::VectorXd& shares,
                                              const Eigen::VectorXd& prices,
                                              ResolveScope scope) {
    if (scope == ResolveScope::CASH_ONLY) return cash;
    double total = cash;
    for (Eigen::Index i = 0; i < shares.size(); ++i) {
        if (shares[i] != 0.0) total += shares[i] * prices[i];
    }
    return total;
}

RebalancePlan TargetWeightResolver::resolve(double cash,
                                            const Eigen::VectorXd& shares,
                                            const Eigen::VectorXd& prices,
                                            const Eigen::VectorXd& weights,
                                            ResolveScope scope) const {
    check_sizes(shares, prices, weights);
    double total = investable_value(cash, shares, prices, scope);
    return resolve_budget(total, cash, shares, prices, weights, scope);
}

RebalancePlan TargetWeightResolver::resolve_budget(double budget,
                                                   double cash,
                                                   const Eigen::VectorXd& shares,
                                                   const Eigen::VectorXd& prices,
                                                   const Eigen::VectorXd& weights,
                                                   ResolveScope scope) const {
    check_sizes(shares, prices, weights);
    const Eigen::Index n = shares.size();

    RebalancePlan plan;
    plan.total_investable = investable_value(cash, shares, prices, scope);
    plan.target_shares = shares;
    plan.share_deltas = Eigen::VectorXd::Zero(n);
    plan.trade_costs.assign(static_cast<size_t>(n), TradeCost{});

    double allocatable = budget > 0.0 ? budget : 0.0;

    for (Eigen::Index i = 0; i < n; ++i) {
        double w = weights[i];
        double price = prices[i];
        if ((w > 0.0 || shares[i] != 0.0) && !(price > 0.0)) {
            std::ostringstream msg;
            msg << "no valid price for allocation at index " << i << ": " << price;
            throw std::invalid_argument(msg.str());
        }

        double desired = w > 0.0 ? allocatable * w / price : 0.0;
        if (!fractional_shares_) desired = floor_shares(desired);

        double target = scope == ResolveScope::FULL ? desired : shares[i] + desired;
        double delta = target - shares[i];

        bool negligible = fractional_shares_
            ? std::abs(delta) < kMinFractionalDelta
            : std::abs(delta * price) < kMinOrderNotional;
        if (negligible) {
            target = shares[i];
            delta = 0.0;
        }

        plan.target_shares[i] = target;
        plan.share_deltas[i] = delta;
    }

    plan.leftover_cash = cash - trade_value(plan.share_deltas, prices);
    return plan;
}

// ------------------------- CostAwareResolver --------------------------------

CostAwareResolver::CostAwareResolver(bool fractional_shares, const TransactionCostConfig& costs)
    : base_(fractional_shares), cost_model_(costs) {}

void CostAwareResolver::price_trades(RebalancePlan& plan, double cash, const Eigen::VectorXd& prices) const {
    plan.costs = 0.0;
    for (Eigen::Index i = 0; i < plan.share_deltas.size(); ++i) {
        TradeCost c{};
        if (plan.share_deltas[i] != 0.0) {
            c = cost_model_.calculate_cost(TradeOrder{"", plan.share_deltas[i], prices[i]});
        }
        plan.trade_costs[static_cast<size_t>(i)] = c;
        plan.costs += c.total();
    }
    plan.leftover_cash = cash - trade_value(plan.share_deltas, prices) - plan.costs;
}

RebalancePlan CostAwareResolver::resolve(double cash,
                                         const Eigen::VectorXd& shares,
                                         const Eigen::VectorXd& prices,
                                         const Eigen::VectorXd& weights,
                                         ResolveScope scope) const {
    check_sizes(shares, prices, weights);
    const double total = TargetWeightResolver::investable_value(cash, shares, prices, scope);

    // fixed point of budget = total - cost(trades(budget))
    double budget = total;
    RebalancePlan plan;
    for (int k = 0; k < kMaxCostIterations; ++k) {
        plan = base_.resolve_budget(budget, cash, shares, prices, weights, scope);
        price_trades(plan, cash, prices);
        double next = total - plan.costs;
        if (std::abs(next - budget) <= kCostConvergence * std::max(1.0, total)) break;
        budget = next;
    }

    // whole-share plans can settle on a cycle; shrink until cash is covered
    for (int k = 0; plan.leftover_cash < -kBalanceTolerance; ++k) {
        if (k >= kMaxCostIterations) {
            std::ostringstream msg;
            msg << "could not fund trades net of costs (shortfall " << -plan.leftover_cash << ")";
            throw ComputationError(msg.str());
        }
        budget += plan.leftover_cash;
        plan = base_.resolve_budget(budget, cash, shares, prices, weights, scope);
        price_trades(plan, cash, prices);
    }

    plan.total_investable = total;
    return plan;
}

std::unique_ptr<TransactionResolver> make_transaction_resolver(const BacktestParams& params) {
    if (params.transaction_costs.is_zero()) {
        return std::make_unique<TargetWeightResolver>(params.strategy.fractional_shares);
    }
    return std::make_unique<CostAwareResolver>(params.strategy.fractional_shares, params.transaction_costs);
}

} // namespace backtest
} // namespace allocsim
