// SPDX-License-Identifier: MIT

#include "backtest/backtest_engine.hpp"
#include "backtest/errors.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace allocsim
{
    namespace backtest
    {

        namespace
        {

            enum class PendingAllocation
            {
                NONE,
                CASH_ONLY,
                FULL
            };

        } // namespace

        // ------------------------- BacktestResult -------------------------------
        double BacktestResult::final_value() const
        {
            if (equity_curve.empty())
                return 0.0;
            return equity_curve.back().total_value;
        }

        double BacktestResult::total_contributions() const
        {
            if (equity_curve.empty())
                return 0.0;
            return equity_curve.back().cumulative_contributions;
        }

        void BacktestResult::export_equity_curve_csv(const std::string &filepath) const
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("unable to open file for writing: " + filepath);

            out << "date,total_value,cash,contribution,cumulative_contributions";
            for (const auto &t : tickers)
                out << "," << t << "_value";
            out << "\n";
            out << std::fixed << std::setprecision(6);

            for (const auto &p : equity_curve)
            {
                out << p.date << "," << p.total_value << "," << p.cash << ","
                    << p.contribution << "," << p.cumulative_contributions;
                for (Eigen::Index i = 0; i < p.values.size(); ++i)
                    out << "," << p.values[i];
                out << "\n";
            }
        }

        // ------------------------- BacktestEngine -------------------------------
        BacktestEngine::BacktestEngine(const BacktestParams &params)
            : params_(params), resolver_(make_transaction_resolver(params))
        {
        }

        BacktestEngine::BacktestEngine(const BacktestParams &params,
                                       std::shared_ptr<const TransactionResolver> resolver)
            : params_(params), resolver_(std::move(resolver))
        {
            if (!resolver_)
                throw std::invalid_argument("BacktestEngine requires a transaction resolver");
        }

        void BacktestEngine::log(const std::string &date, const std::string &message) const
        {
            if (params_.verbose)
                std::cerr << "[backtest] " << date << " " << message << "\n";
        }

        BacktestResult BacktestEngine::run(const PriceDataProvider &provider) const
        {
            log(params_.start_date, "querying " + provider.get_name());
            return run(provider.query(params_.tickers, params_.start_date, params_.end_date));
        }

        BacktestResult BacktestEngine::run(const MarketData &market_data) const
        {
            const auto &tickers = params_.tickers;
            const auto n = static_cast<Eigen::Index>(tickers.size());
            if (n == 0 || params_.target_weights.size() != n)
                throw ConfigurationError("target weights do not match the configured tickers");
            if (!(params_.initial_investment > 0.0))
                throw ComputationError("initial_investment must be positive");

            for (const auto &t : tickers)
            {
                if (market_data.find_ticker_index(t) < 0)
                    throw MissingPriceDataError("No price series available for ticker " + t);
            }

            const MarketData data = market_data.select_assets(tickers).filter_by_date(params_.start_date, params_.end_date);
            const auto trading = TradingCalendar::trading_dates(data, params_.start_date, params_.end_date);
            const TradingCalendar calendar(params_.strategy.rebalance_frequency, params_.contribution.frequency);
            const std::vector<CalendarDay> days = calendar.build(params_.start_date, params_.end_date, trading);

            const bool carry_forward = params_.strategy.gap_fill == GapFillPolicy::CARRY_FORWARD;
            const Eigen::VectorXd &weights = params_.target_weights;

            Portfolio portfolio(tickers);
            TradeLogger logger;
            BacktestResult result;
            result.tickers = tickers;
            result.target_weights = weights;
            result.initial_investment = params_.initial_investment;
            result.resolver_name = resolver_->get_name();
            result.equity_curve.reserve(days.size());

            Eigen::VectorXd last_price = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::quiet_NaN());
            std::vector<bool> fresh(static_cast<size_t>(n), false);
            PendingAllocation pending = PendingAllocation::NONE;
            bool funded = false;

            for (const auto &day : days)
            {
                const std::string &date = day.date;
                const auto row = static_cast<size_t>(data.find_date_index(date));

                // 1. mark to market
                Eigen::VectorXd prices(n);
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    const auto col = static_cast<size_t>(j);
                    fresh[col] = data.has_price(row, col);
                    if (fresh[col])
                        last_price[j] = data.price(row, col);
                    prices[j] = (fresh[col] || carry_forward) ? last_price[j] : std::numeric_limits<double>::quiet_NaN();

                    if (portfolio.current_shares()[j] != 0.0 && std::isnan(prices[j]))
                        throw MissingPriceDataError("No price for held ticker " + tickers[col] + " on " + date);
                }
                portfolio.update_prices(date, prices);

                // 2. dividends
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    const auto col = static_cast<size_t>(j);
                    double per_share = data.dividend(row, col);
                    double held = portfolio.current_shares()[j];
                    if (per_share <= 0.0 || held <= 0.0)
                        continue;

                    DividendRecord rec;
                    rec.date = date;
                    rec.ticker = tickers[col];
                    rec.shares_held = held;
                    rec.amount_per_share = per_share;
                    rec.price = prices[j];
                    rec.cash_amount = held * per_share;

                    if (params_.strategy.reinvest_dividends)
                    {
                        Eigen::VectorXd pre = portfolio.current_weights();
                        rec.shares_reinvested = portfolio.reinvest_dividend(col, rec.cash_amount, params_.strategy.fractional_shares);
                        rec.reinvested = true;
                        if (rec.shares_reinvested > 0.0)
                        {
                            TradeRecord tr;
                            tr.date = date;
                            tr.ticker = tickers[col];
                            tr.reason = TradeReason::DIVIDEND_REINVESTMENT;
                            tr.shares = rec.shares_reinvested;
                            tr.price = prices[j];
                            tr.notional = tr.shares * tr.price;
                            tr.pre_trade_weight = pre[j];
                            tr.post_trade_weight = portfolio.current_weights()[j];
                            logger.log_trade(tr);
                        }
                    }
                    else
                    {
                        portfolio.credit_cash(rec.cash_amount);
                    }
                    result.dividends.push_back(rec);
                }

                // 3. contributions
                double contribution_today = 0.0;
                if (day.is_funding_day)
                {
                    portfolio.deposit(params_.initial_investment);
                    contribution_today += params_.initial_investment;
                    pending = PendingAllocation::FULL;
                }
                if (day.is_contribution_day && params_.contribution.enabled())
                {
                    portfolio.deposit(params_.contribution.amount);
                    contribution_today += params_.contribution.amount;
                    if (pending == PendingAllocation::NONE)
                        pending = PendingAllocation::CASH_ONLY;
                    log(date, "contribution of " + std::to_string(params_.contribution.amount));
                }
                if (day.is_rebalance_day)
                    pending = PendingAllocation::FULL;

                // 4. allocation
                if (pending != PendingAllocation::NONE)
                {
                    std::string missing;
                    for (Eigen::Index j = 0; j < n; ++j)
                    {
                        if (weights[j] > 0.0 && !fresh[static_cast<size_t>(j)])
                        {
                            missing = tickers[static_cast<size_t>(j)];
                            break;
                        }
                    }

                    if (!missing.empty() && !carry_forward)
                        throw MissingPriceDataError("No price for " + missing + " on allocation day " + date);

                    if (!missing.empty())
                    {
                        log(date, "allocation deferred, no quote for " + missing);
                    }
                    else
                    {
                        const ResolveScope scope = pending == PendingAllocation::FULL ? ResolveScope::FULL : ResolveScope::CASH_ONLY;
                        const TradeReason reason = !funded ? TradeReason::FUNDING
                                                   : scope == ResolveScope::FULL ? TradeReason::REBALANCE
                                                                                 : TradeReason::CONTRIBUTION;

                        Eigen::VectorXd pre_weights = portfolio.current_weights();
                        RebalancePlan plan = resolver_->resolve(portfolio.cash(), portfolio.current_shares(),
                                                                prices, weights, scope);
                        try
                        {
                            portfolio.apply_trades(plan.share_deltas, plan.costs);
                        }
                        catch (const std::runtime_error &e)
                        {
                            throw ComputationError(std::string("allocation on ") + date + " failed: " + e.what());
                        }
                        logger.log_allocation(date, reason, tickers, plan.share_deltas, prices,
                                              plan.trade_costs, pre_weights, portfolio.current_weights());

                        std::ostringstream msg;
                        msg << to_string(reason) << ": investable " << plan.total_investable
                            << ", costs " << plan.costs << ", cash left " << portfolio.cash();
                        log(date, msg.str());

                        funded = true;
                        pending = PendingAllocation::NONE;
                    }
                }

                // 5. record
                result.equity_curve.push_back(portfolio.snapshot(contribution_today));
            }

            for (const auto &t : tickers)
                result.final_positions.push_back(portfolio.get_position(t));
            result.trades = logger.trades();
            result.trade_summary = logger.get_summary();

            log(days.back().date, "completed " + std::to_string(days.size()) + " trading days, final value " +
                                      std::to_string(result.final_value()));
            return result;
        }

    } // namespace backtest
} // namespace allocsim
