/**
 * @file result_assembler.cpp
 * @brief Implementation of BacktestReport and ResultAssembler.
 */

#include "report/result_assembler.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace allocsim
{
    namespace report
    {

        namespace
        {

            nlohmann::json period_to_json(const analytics::PeriodReturn &p)
            {
                return nlohmann::json{
                    {"period", p.period},
                    {"period_start", p.period_start},
                    {"return", p.period_return}};
            }

            nlohmann::json drawdown_to_json(const analytics::DrawdownEvent &e)
            {
                nlohmann::json j;
                j["peak_date"] = e.peak_date;
                j["trough_date"] = e.trough_date;
                j["recovery_date"] = e.recovery_date.empty() ? nlohmann::json(nullptr)
                                                             : nlohmann::json(e.recovery_date);
                j["depth"] = e.depth;
                j["decline_days"] = e.decline_days;
                j["recovery_days"] = e.recovery_days;
                return j;
            }

        } // namespace

        // ===================================================================
        // BacktestReport
        // ===================================================================

        BacktestReport::BacktestReport(const backtest::BacktestParams &params,
                                       backtest::BacktestResult result,
                                       analytics::PerformanceMetrics metrics,
                                       std::vector<analytics::DrawdownEvent> drawdowns,
                                       DividendSummary dividends)
            : params_(params),
              result_(std::move(result)),
              metrics_(std::move(metrics)),
              drawdowns_(std::move(drawdowns)),
              dividends_(dividends)
        {
        }

        nlohmann::json BacktestReport::to_json() const
        {
            using analytics::PeriodGranularity;

            nlohmann::json j;
            j["metrics"] = metrics_.to_json();

            const auto &dd = metrics_.max_drawdown_info();
            nlohmann::json max_dd;
            max_dd["max_drawdown"] = dd.depth;
            max_dd["peak_date"] = dd.depth < 0.0 ? nlohmann::json(dd.peak_date) : nlohmann::json(nullptr);
            max_dd["trough_date"] = dd.depth < 0.0 ? nlohmann::json(dd.trough_date) : nlohmann::json(nullptr);
            max_dd["recovery_date"] = dd.recovery_date.empty() ? nlohmann::json(nullptr)
                                                               : nlohmann::json(dd.recovery_date);
            max_dd["drawdowns"] = nlohmann::json::array();
            for (const auto &event : drawdowns_)
            {
                max_dd["drawdowns"].push_back(drawdown_to_json(event));
            }
            j["max_drawdown"] = max_dd;

            j["best_periods"] = nlohmann::json::object();
            j["worst_periods"] = nlohmann::json::object();
            nlohmann::json returns = nlohmann::json::object();
            for (PeriodGranularity g : analytics::all_granularities())
            {
                std::string name = analytics::to_string(g);
                if (auto best = metrics_.best_period(g))
                {
                    j["best_periods"][name] = period_to_json(*best);
                }
                if (auto worst = metrics_.worst_period(g))
                {
                    j["worst_periods"][name] = period_to_json(*worst);
                }

                returns[name] = nlohmann::json::array();
                for (const auto &p : metrics_.period_returns(g))
                {
                    returns[name].push_back(period_to_json(p));
                }
            }

            auto wl = metrics_.monthly_win_loss();
            j["monthly_win_lose_analysis"] = {{"win", wl.win}, {"loss", wl.loss}, {"rate", wl.rate}};

            // Chart series
            nlohmann::json growth = nlohmann::json::array();
            nlohmann::json balance = nlohmann::json::array();
            for (const auto &point : result_.equity_curve)
            {
                growth.push_back({{"date", point.date},
                                  {"value", point.total_value},
                                  {"contributions", point.cumulative_contributions}});

                nlohmann::json holdings = nlohmann::json::array();
                for (size_t i = 0; i < result_.tickers.size(); ++i)
                {
                    Eigen::Index k = static_cast<Eigen::Index>(i);
                    holdings.push_back({{"ticker", result_.tickers[i]},
                                        {"value", point.values[k]},
                                        {"weight", point.weights[k]}});
                }
                balance.push_back({{"date", point.date}, {"holdings", holdings}});
            }

            nlohmann::json histogram = nlohmann::json::array();
            for (const auto &bucket : metrics_.monthly_histogram())
            {
                histogram.push_back({{"bucket", bucket.bucket}, {"count", bucket.count}});
            }

            j["chart_data"]["portfolio_growth"] = growth;
            j["chart_data"]["portfolio_balance"] = balance;
            j["chart_data"]["returns"] = returns;
            j["chart_data"]["monthly_returns_histogram"] = histogram;

            const auto &ts = result_.trade_summary;
            j["trades"] = {{"total_trades", ts.total_trades},
                           {"buy_trades", ts.buy_trades},
                           {"sell_trades", ts.sell_trades},
                           {"total_notional", ts.total_notional},
                           {"total_costs", ts.total_costs},
                           {"rebalance_count", ts.rebalance_count},
                           {"turnover", ts.turnover}};

            j["dividends"] = {{"payouts", dividends_.payouts},
                              {"total_received", dividends_.total_received},
                              {"reinvested", dividends_.reinvested},
                              {"to_cash", dividends_.to_cash}};

            nlohmann::json holdings = nlohmann::json::array();
            for (const auto &pos : result_.final_positions)
            {
                holdings.push_back({{"ticker", pos.ticker},
                                    {"shares", pos.shares},
                                    {"cost_basis", pos.cost_basis},
                                    {"market_value", pos.market_value}});
            }
            j["final_holdings"] = holdings;

            nlohmann::json config;
            config["start_date"] = params_.start_date;
            config["end_date"] = params_.end_date;
            config["base_currency"] = backtest::to_string(params_.base_currency);
            config["mode"] = backtest::to_string(params_.mode);
            config["initial_investment"] = params_.initial_investment;
            config["rebalance_frequency"] = backtest::to_string(params_.strategy.rebalance_frequency);
            config["fractional_shares"] = params_.strategy.fractional_shares;
            config["reinvest_dividends"] = params_.strategy.reinvest_dividends;
            config["resolver"] = result_.resolver_name;
            for (size_t i = 0; i < params_.tickers.size(); ++i)
            {
                config["target_weights"][params_.tickers[i]] =
                    params_.target_weights[static_cast<Eigen::Index>(i)];
            }
            j["config"] = config;

            return j;
        }

        void BacktestReport::save_json(const std::string &filepath, int indent) const
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open file for writing: " + filepath);
            }
            file << to_json().dump(indent) << "\n";
        }

        void BacktestReport::export_equity_curve_csv(const std::string &filepath) const
        {
            result_.export_equity_curve_csv(filepath);
        }

        void BacktestReport::print_summary() const
        {
            std::cout << "\n"
                      << metrics_.summary();

            std::cout << "\nFinal Holdings:\n";
            std::cout << "  " << std::left << std::setw(10) << "Ticker"
                      << std::right << std::setw(14) << "Shares"
                      << std::setw(16) << "Value"
                      << std::setw(10) << "Weight" << "\n";
            std::cout << "  " << std::string(50, '-') << "\n";

            double total = result_.final_value();
            for (const auto &pos : result_.final_positions)
            {
                std::cout << "  " << std::left << std::setw(10) << pos.ticker
                          << std::right << std::fixed
                          << std::setw(14) << std::setprecision(4) << pos.shares
                          << std::setw(16) << std::setprecision(2) << pos.market_value
                          << std::setw(9) << std::setprecision(2) << pos.weight(total) * 100.0 << "%\n";
            }
            if (!result_.equity_curve.empty())
            {
                std::cout << "  " << std::left << std::setw(10) << "CASH"
                          << std::right << std::setw(14) << ""
                          << std::setw(16) << std::setprecision(2) << result_.equity_curve.back().cash << "\n";
            }

            std::cout << "\nTrades: " << result_.trade_summary.total_trades
                      << " (" << result_.trade_summary.buy_trades << " buys, "
                      << result_.trade_summary.sell_trades << " sells), costs "
                      << std::setprecision(2) << result_.trade_summary.total_costs << "\n";
            std::cout << "Dividends: " << dividends_.payouts << " payouts, "
                      << std::setprecision(2) << dividends_.total_received << " received ("
                      << dividends_.reinvested << " reinvested, " << dividends_.to_cash << " to cash)\n";
        }

        // ===================================================================
        // ResultAssembler
        // ===================================================================

        ResultAssembler::ResultAssembler(const backtest::BacktestParams &params)
            : params_(params)
        {
        }

        BacktestReport ResultAssembler::assemble(const backtest::BacktestResult &result) const
        {
            analytics::PerformanceMetrics metrics(result, params_.risk_free_rate);
            analytics::DrawdownAnalysis drawdowns(metrics.values(), metrics.dates());

            return BacktestReport(params_, result, metrics, drawdowns.all_events(),
                                  summarize_dividends(result.dividends));
        }

        DividendSummary ResultAssembler::summarize_dividends(const std::vector<backtest::DividendRecord> &dividends)
        {
            DividendSummary summary;
            for (const auto &d : dividends)
            {
                ++summary.payouts;
                summary.total_received += d.cash_amount;
                // a whole-share reinvestment leaves its remainder in cash
                double reinvested = d.reinvested ? d.shares_reinvested * d.price : 0.0;
                summary.reinvested += reinvested;
                summary.to_cash += d.cash_amount - reinvested;
            }
            return summary;
        }

    } // namespace report
} // namespace allocsim
