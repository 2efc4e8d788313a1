// SPDX-License-Identifier: MIT
#ifndef ALLOCSIM_BACKTEST_PORTFOLIO_HPP
#define ALLOCSIM_BACKTEST_PORTFOLIO_HPP

#include <cmath>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <Eigen/Dense>

namespace allocsim {
namespace backtest {

/// Tolerance for cash and share balances after a batch of trades.
constexpr double kBalanceTolerance = 1e-6;

/// Whole-share rounding that absorbs floating noise (9.9999999999 -> 10).
inline double floor_shares(double shares) {
    return std::floor(shares + 1e-9);
}

/**
 * @struct Position
 * @brief Represents a single asset position
 */
struct Position {
    std::string ticker;       ///< Asset identifier
    double shares = 0.0;      ///< Number of shares held
    double cost_basis = 0.0;  ///< Average cost per share
    double market_value = 0.0;///< Current market value

    double weight(double total_value) const;
};

/**
 * @struct EquityCurvePoint
 * @brief End-of-day record of the portfolio, one per trading day
 */
struct EquityCurvePoint {
    std::string date;                       ///< Trading date (YYYY-MM-DD)
    double total_value = 0.0;               ///< cash + sum(shares * price)
    double cash = 0.0;                      ///< Uninvested cash balance
    double contribution = 0.0;              ///< Cash injected today (initial investment on funding day)
    double cumulative_contributions = 0.0;  ///< Initial investment + applied contributions
    Eigen::VectorXd shares;                 ///< Shares per ticker
    Eigen::VectorXd prices;                 ///< Valuation price per ticker
    Eigen::VectorXd values;                 ///< Holding value per ticker
    Eigen::VectorXd weights;                ///< values / total_value
};

/**
 * @class Portfolio
 * @brief Cash and share holdings of a single backtest run.
 *
 * Starts empty; the initial investment arrives through deposit() like any
 * other contribution. Prices of tickers with no holding may be NaN (not yet
 * quoted), since they contribute nothing to the valuation.
 */
class Portfolio {
public:
    explicit Portfolio(const std::vector<std::string>& tickers);

    ~Portfolio() = default;

    // -- State queries
    double total_value() const;
    double cash() const;
    double invested_value() const;
    double cumulative_contributions() const;
    size_t num_assets() const;
    const std::vector<std::string>& tickers() const;
    const std::string& date() const;

    Eigen::VectorXd current_shares() const;
    const Eigen::VectorXd& current_prices() const;
    Eigen::VectorXd holding_values() const;
    Eigen::VectorXd current_weights() const;
    const Position& get_position(const std::string& ticker) const;

    // -- Price updates
    void update_prices(const std::string& date, const Eigen::VectorXd& prices);

    // -- Cash movements
    void deposit(double amount);
    void credit_cash(double amount);

    /**
     * @brief Buy shares of one ticker with a dividend payout at today's price.
     * @return Shares bought; any unspent remainder is credited to cash.
     */
    double reinvest_dividend(size_t ticker_idx, double amount, bool fractional);

    // -- Trading
    /**
     * @brief Apply signed share deltas at current prices, sells first.
     *
     * The batch is applied atomically: it is validated in full and either
     * commits entirely or throws std::runtime_error leaving state untouched.
     *
     * @param share_deltas Positive buys, negative sells, per ticker.
     * @param costs Execution costs paid from cash.
     */
    void apply_trades(const Eigen::VectorXd& share_deltas, double costs);

    // -- Snapshots
    EquityCurvePoint snapshot(double contribution_today) const;

private:
    double cash_ = 0.0;
    double cumulative_contributions_ = 0.0;
    std::string current_date_;
    std::vector<std::string> tickers_;
    std::map<std::string, int> ticker_index_;
    std::vector<Position> positions_;
    Eigen::VectorXd prices_;

    void build_ticker_index();
    int find_ticker_index(const std::string& ticker) const;
    void refresh_market_values();
};

} // namespace backtest
} // namespace allocsim

#endif // ALLOCSIM_BACKTEST_PORTFOLIO_HPP
