/**
 * @file trade_logger.cpp
 * @brief Implementation of TradeLogger
 */

#include "backtest/trade_logger.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace allocsim {
namespace backtest {

std::string to_string(TradeReason reason)
{
    switch (reason)
    {
    case TradeReason::FUNDING:
        return "funding";
    case TradeReason::REBALANCE:
        return "rebalance";
    case TradeReason::CONTRIBUTION:
        return "contribution";
    case TradeReason::DIVIDEND_REINVESTMENT:
        return "dividend_reinvestment";
    }
    return "rebalance";
}

void TradeLogger::log_trade(const TradeRecord &record)
{
    TradeRecord r = record;
    r.trade_id = next_trade_id_++;
    trades_.push_back(r);
}

void TradeLogger::log_allocation(const std::string &date,
                                 TradeReason reason,
                                 const std::vector<std::string> &tickers,
                                 const Eigen::VectorXd &shares_traded,
                                 const Eigen::VectorXd &prices,
                                 const std::vector<TradeCost> &costs,
                                 const Eigen::VectorXd &pre_weights,
                                 const Eigen::VectorXd &post_weights)
{
    const auto n = static_cast<Eigen::Index>(tickers.size());
    if (shares_traded.size() != n || prices.size() != n ||
        static_cast<Eigen::Index>(costs.size()) != n ||
        pre_weights.size() != n || post_weights.size() != n)
    {
        throw std::invalid_argument("Mismatched allocation vector sizes");
    }

    if (reason == TradeReason::REBALANCE)
    {
        // one-way turnover of the rebalance: sum |delta w| / 2
        double abs_sum = 0.0;
        for (Eigen::Index i = 0; i < n; ++i)
        {
            abs_sum += std::abs(post_weights[i] - pre_weights[i]);
        }
        turnover_ += abs_sum / 2.0;
        rebalance_count_ += 1;
    }

    for (Eigen::Index i = 0; i < n; ++i)
    {
        double s = shares_traded[i];
        if (s == 0.0)
            continue;

        TradeRecord r;
        r.trade_id = next_trade_id_++;
        r.date = date;
        r.ticker = tickers[static_cast<size_t>(i)];
        r.reason = reason;
        r.shares = s;
        r.price = prices[i];
        r.notional = s * prices[i];
        r.commission = costs[static_cast<size_t>(i)].commission;
        r.slippage = costs[static_cast<size_t>(i)].slippage;
        r.total_cost = costs[static_cast<size_t>(i)].total();
        r.pre_trade_weight = pre_weights[i];
        r.post_trade_weight = post_weights[i];

        trades_.push_back(r);
    }
}

std::vector<TradeRecord> TradeLogger::trades_for_date(const std::string &date) const
{
    std::vector<TradeRecord> out;
    for (const auto &t : trades_)
    {
        if (t.date == date)
            out.push_back(t);
    }
    return out;
}

std::vector<TradeRecord> TradeLogger::trades_for_ticker(const std::string &ticker) const
{
    std::vector<TradeRecord> out;
    for (const auto &t : trades_)
    {
        if (t.ticker == ticker)
            out.push_back(t);
    }
    return out;
}

TradeSummary TradeLogger::get_summary() const
{
    TradeSummary s;
    s.total_trades = static_cast<int>(trades_.size());
    s.rebalance_count = rebalance_count_;
    s.turnover = turnover_;

    for (const auto &t : trades_)
    {
        if (t.shares > 0)
            ++s.buy_trades;
        else if (t.shares < 0)
            ++s.sell_trades;

        s.total_notional += std::abs(t.notional);
        s.total_costs += t.total_cost;
    }

    if (s.total_trades > 0)
        s.avg_cost_per_trade = s.total_costs / s.total_trades;

    return s;
}

void TradeLogger::export_to_csv(const std::string &filepath) const
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "trade_id,date,ticker,reason,shares,price,notional,commission,slippage,total_cost,pre_trade_weight,post_trade_weight\n";
    file << std::fixed << std::setprecision(8);

    for (const auto &t : trades_)
    {
        file << t.trade_id << ","
             << t.date << ","
             << t.ticker << ","
             << to_string(t.reason) << ","
             << t.shares << ","
             << t.price << ","
             << t.notional << ","
             << t.commission << ","
             << t.slippage << ","
             << t.total_cost << ","
             << t.pre_trade_weight << ","
             << t.post_trade_weight << "\n";
    }
}

} // namespace backtest
} // namespace allocsim
