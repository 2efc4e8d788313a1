// ============================================================================
// Implementation of Portfolio
// ============================================================================

#include "backtest/portfolio.hpp"

#include <limits>
#include <sstream>

namespace allocsim {
namespace backtest {

// ============================================================================
// Position
// ============================================================================

double Position::weight(double total_value) const {
    if (total_value <= 0.0) return 0.0;
    return market_value / total_value;
}

// ============================================================================
// Portfolio - helpers
// ============================================================================

void Portfolio::build_ticker_index() {
    ticker_index_.clear();
    for (size_t i = 0; i < tickers_.size(); ++i) {
        if (ticker_index_.count(tickers_[i])) {
            throw std::invalid_argument("duplicate ticker: " + tickers_[i]);
        }
        ticker_index_[tickers_[i]] = static_cast<int>(i);
    }
}

int Portfolio::find_ticker_index(const std::string& ticker) const {
    auto it = ticker_index_.find(ticker);
    if (it == ticker_index_.end()) return -1;
    return it->second;
}

void Portfolio::refresh_market_values() {
    for (size_t i = 0; i < positions_.size(); ++i) {
        positions_[i].market_value =
            positions_[i].shares == 0.0 ? 0.0 : positions_[i].shares * prices_[static_cast<int>(i)];
    }
}

// ============================================================================
// Portfolio - lifecycle
// ============================================================================

Portfolio::Portfolio(const std::vector<std::string>& tickers)
    : tickers_(tickers) {
    if (tickers.empty()) {
        throw std::invalid_argument("tickers must not be empty");
    }
    positions_.resize(tickers_.size());
    for (size_t i = 0; i < tickers_.size(); ++i) {
        positions_[i].ticker = tickers_[i];
    }
    prices_ = Eigen::VectorXd::Constant(static_cast<int>(tickers_.size()),
                                        std::numeric_limits<double>::quiet_NaN());
    build_ticker_index();
}

// ============================================================================
// Portfolio - queries
// ============================================================================

double Portfolio::total_value() const {
    return cash_ + invested_value();
}

double Portfolio::cash() const { return cash_; }

double Portfolio::invested_value() const {
    double invested = 0.0;
    for (const auto& p : positions_) invested += p.market_value;
    return invested;
}

double Portfolio::cumulative_contributions() const { return cumulative_contributions_; }

size_t Portfolio::num_assets() const { return tickers_.size(); }

const std::vector<std::string>& Portfolio::tickers() const { return tickers_; }

const std::string& Portfolio::date() const { return current_date_; }

Eigen::VectorXd Portfolio::current_shares() const {
    Eigen::VectorXd s(static_cast<int>(positions_.size()));
    for (size_t i = 0; i < positions_.size(); ++i) s[static_cast<int>(i)] = positions_[i].shares;
    return s;
}

const Eigen::VectorXd& Portfolio::current_prices() const { return prices_; }

Eigen::VectorXd Portfolio::holding_values() const {
    Eigen::VectorXd v(static_cast<int>(positions_.size()));
    for (size_t i = 0; i < positions_.size(); ++i) v[static_cast<int>(i)] = positions_[i].market_value;
    return v;
}

Eigen::VectorXd Portfolio::current_weights() const {
    double total = total_value();
    Eigen::VectorXd w(static_cast<int>(tickers_.size()));
    for (size_t i = 0; i < positions_.size(); ++i) {
        w[static_cast<int>(i)] = positions_[i].weight(total);
    }
    return w;
}

const Position& Portfolio::get_position(const std::string& ticker) const {
    int idx = find_ticker_index(ticker);
    if (idx < 0) throw std::invalid_argument("ticker not in universe: " + ticker);
    return positions_[static_cast<size_t>(idx)];
}

// ============================================================================
// Portfolio - price updates
// ============================================================================

void Portfolio::update_prices(const std::string& date, const Eigen::VectorXd& prices) {
    if (static_cast<size_t>(prices.size()) != tickers_.size()) {
        std::ostringstream msg;
        msg << "prices size (" << prices.size() << ") != num assets (" << tickers_.size() << ")";
        throw std::invalid_argument(msg.str());
    }
    for (int i = 0; i < prices.size(); ++i) {
        bool held = positions_[static_cast<size_t>(i)].shares != 0.0;
        if (std::isnan(prices[i]) && !held) continue;
        if (!(prices[i] > 0.0) || !std::isfinite(prices[i])) {
            std::ostringstream msg;
            msg << "price for " << tickers_[static_cast<size_t>(i)] << " is not positive: " << prices[i];
            throw std::invalid_argument(msg.str());
        }
    }
    current_date_ = date;
    prices_ = prices;
    refresh_market_values();
}

// ============================================================================
// Portfolio - cash movements
// ============================================================================

void Portfolio::deposit(double amount) {
    if (!(amount > 0.0)) throw std::invalid_argument("deposit amount must be > 0");
    cash_ += amount;
    cumulative_contributions_ += amount;
}

void Portfolio::credit_cash(double amount) {
    if (!(amount >= 0.0)) throw std::invalid_argument("credited amount must be >= 0");
    cash_ += amount;
}

double Portfolio::reinvest_dividend(size_t ticker_idx, double amount, bool fractional) {
    if (ticker_idx >= positions_.size()) throw std::invalid_argument("ticker index out of range");
    if (!(amount >= 0.0)) throw std::invalid_argument("dividend amount must be >= 0");
    double price = prices_[static_cast<int>(ticker_idx)];
    if (!(price > 0.0)) throw std::invalid_argument("cannot reinvest without a positive price");

    Position& pos = positions_[ticker_idx];
    double bought = fractional ? amount / price : floor_shares(amount / price);
    double residual = fractional ? 0.0 : amount - bought * price;

    if (bought > 0.0) {
        double new_total = pos.shares + bought;
        pos.cost_basis = ((pos.shares * pos.cost_basis) + bought * price) / new_total;
        pos.shares = new_total;
        pos.market_value = pos.shares * price;
    }
    if (residual > 0.0) cash_ += residual;
    return bought;
}

// ============================================================================
// Portfolio - trading
// ============================================================================

void Portfolio::apply_trades(const Eigen::VectorXd& share_deltas, double costs) {
    if (static_cast<size_t>(share_deltas.size()) != tickers_.size()) {
        throw std::invalid_argument("share_deltas size mismatch");
    }
    if (!(costs >= 0.0)) throw std::invalid_argument("costs must be >= 0");

    double new_cash = cash_ - costs;
    for (size_t i = 0; i < tickers_.size(); ++i) {
        double delta = share_deltas[static_cast<int>(i)];
        if (delta == 0.0) continue;
        double price = prices_[static_cast<int>(i)];
        if (!(price > 0.0)) {
            throw std::runtime_error("no valid price to trade " + tickers_[i]);
        }
        if (positions_[i].shares + delta < -kBalanceTolerance) {
            throw std::runtime_error("attempt to sell more shares of " + tickers_[i] + " than held");
        }
        new_cash -= delta * price;
    }
    if (new_cash < -kBalanceTolerance) {
        std::ostringstream msg;
        msg << "insufficient cash for trades on " << current_date_ << " (shortfall " << -new_cash << ")";
        throw std::runtime_error(msg.str());
    }

    // sells first, then buys; the batch is already validated
    for (int pass = 0; pass < 2; ++pass) {
        for (size_t i = 0; i < tickers_.size(); ++i) {
            double delta = share_deltas[static_cast<int>(i)];
            bool is_sell = delta < 0.0;
            if (delta == 0.0 || is_sell != (pass == 0)) continue;

            Position& pos = positions_[i];
            double price = prices_[static_cast<int>(i)];
            if (delta > 0.0) {
                double new_total = pos.shares + delta;
                pos.cost_basis = ((pos.shares * pos.cost_basis) + delta * price) / new_total;
                pos.shares = new_total;
            } else {
                pos.shares += delta;
                if (std::abs(pos.shares) <= kBalanceTolerance) {
                    pos.shares = 0.0;
                    pos.cost_basis = 0.0;
                }
            }
        }
    }

    cash_ = new_cash;
    refresh_market_values();
}

// ============================================================================
// Portfolio - snapshots
// ============================================================================

EquityCurvePoint Portfolio::snapshot(double contribution_today) const {
    EquityCurvePoint p;
    p.date = current_date_;
    p.cash = cash_;
    p.contribution = contribution_today;
    p.cumulative_contributions = cumulative_contributions_;
    p.shares = current_shares();
    p.prices = prices_;
    p.values = holding_values();
    p.total_value = p.cash + p.values.sum();
    p.weights = Eigen::VectorXd::Zero(p.values.size());
    if (p.total_value > 0.0) p.weights = p.values / p.total_value;
    return p;
}

} // namespace backtest
} // namespace allocsim
