// SPDX-License-Identifier: MIT
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "data/market_data.hpp"
#include "data/price_provider.hpp"
#include "backtest/backtest_config.hpp"
#include "backtest/portfolio.hpp"
#include "backtest/trading_calendar.hpp"
#include "backtest/trade_logger.hpp"
#include "backtest/transaction_resolver.hpp"

namespace allocsim
{
    namespace backtest
    {

        /**
         * @struct DividendRecord
         * @brief One dividend payout received by the portfolio.
         */
        struct DividendRecord
        {
            std::string date;
            std::string ticker;
            double shares_held = 0.0;
            double amount_per_share = 0.0;
            double price = 0.0;             ///< Valuation price on the payment date
            double cash_amount = 0.0;       ///< shares_held * amount_per_share
            double shares_reinvested = 0.0; ///< 0 when paid to cash
            bool reinvested = false;
        };

        /**
         * @struct BacktestResult
         * @brief Complete output of a simulation run.
         *
         * Holds the equity curve (one point per trading day), the trade log
         * and the dividend history. A BacktestResult only ever exists for a
         * run that finished; failures surface as BacktestError instead.
         */
        struct BacktestResult
        {
            std::vector<std::string> tickers;
            Eigen::VectorXd target_weights;
            double initial_investment = 0.0;
            std::string resolver_name;

            std::vector<EquityCurvePoint> equity_curve;
            std::vector<TradeRecord> trades;
            TradeSummary trade_summary;
            std::vector<DividendRecord> dividends;
            std::vector<Position> final_positions;

            double final_value() const;
            double total_contributions() const;

            /**
             * @brief Export the equity curve to CSV.
             *
             * Columns: date, total_value, cash, contribution,
             * cumulative_contributions, then one value column per ticker.
             *
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_equity_curve_csv(const std::string &filepath) const;
        };

        /**
         * @class BacktestEngine
         * @brief Day-by-day portfolio state machine.
         *
         * Each trading day is processed in a fixed order: mark to market,
         * dividends, contributions, allocation (funding, rebalance or cash
         * deployment), then one equity curve point. The engine keeps no
         * state between runs, so one instance may serve concurrent calls.
         */
        class BacktestEngine
        {
        public:
            explicit BacktestEngine(const BacktestParams &params);

            /**
             * @brief Construct with an explicit allocation strategy.
             * @throws std::invalid_argument If resolver is null.
             */
            BacktestEngine(const BacktestParams &params,
                           std::shared_ptr<const TransactionResolver> resolver);

            ~BacktestEngine() = default;

            /**
             * @brief Simulate over a price/dividend snapshot.
             * @param market_data Must contain every configured ticker.
             * @throws ConfigurationError, MissingPriceDataError, ComputationError
             */
            BacktestResult run(const MarketData &market_data) const;

            /**
             * @brief Query the provider for the run's tickers and range, then simulate.
             */
            BacktestResult run(const PriceDataProvider &provider) const;

            const BacktestParams &params() const { return params_; }
            const TransactionResolver &resolver() const { return *resolver_; }

        private:
            BacktestParams params_;
            std::shared_ptr<const TransactionResolver> resolver_;

            void log(const std::string &date, const std::string &message) const;
        };

    } // namespace backtest
} // namespace allocsim
