/**
 * @file currency_converter.cpp
 * @brief Implementation of TableRateProvider and CurrencyConverter
 */

#include "data/currency_converter.hpp"
#include "backtest/errors.hpp"

#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace allocsim
{

    namespace
    {
        const double GBX_PER_GBP = 100.0;
    }

    // ============================================================================
    // TableRateProvider
    // ============================================================================

    void TableRateProvider::add_rate(const std::string &from,
                                     const std::string &to,
                                     const std::string &date,
                                     double rate)
    {
        if (!(rate > 0.0) || !std::isfinite(rate))
        {
            std::ostringstream msg;
            msg << "Expected positive value for FX rate " << from << "/" << to
                << " on " << date << ", got: " << rate;
            throw std::invalid_argument(msg.str());
        }
        rates_[std::make_pair(from, to)][date] = rate;
    }

    bool TableRateProvider::lookup(const std::string &from,
                                   const std::string &to,
                                   const std::string &date,
                                   double &out) const
    {
        auto direct = rates_.find(std::make_pair(from, to));
        if (direct != rates_.end())
        {
            auto it = direct->second.upper_bound(date);
            if (it != direct->second.begin())
            {
                out = std::prev(it)->second;
                return true;
            }
        }

        auto inverse = rates_.find(std::make_pair(to, from));
        if (inverse != rates_.end())
        {
            auto it = inverse->second.upper_bound(date);
            if (it != inverse->second.begin())
            {
                out = 1.0 / std::prev(it)->second;
                return true;
            }
        }
        return false;
    }

    double TableRateProvider::rate(const std::string &from,
                                   const std::string &to,
                                   const std::string &date) const
    {
        if (from == to)
        {
            return 1.0;
        }
        if (from == "GBX")
        {
            return rate("GBP", to, date) / GBX_PER_GBP;
        }
        if (to == "GBX")
        {
            return rate(from, "GBP", date) * GBX_PER_GBP;
        }

        double out = 0.0;
        if (!lookup(from, to, date, out))
        {
            throw backtest::MissingPriceDataError("No FX rate " + from + "/" + to +
                                                  " on or before " + date);
        }
        return out;
    }

    size_t TableRateProvider::size() const
    {
        size_t n = 0;
        for (const auto &pair : rates_)
        {
            n += pair.second.size();
        }
        return n;
    }

    // ============================================================================
    // CurrencyConverter
    // ============================================================================

    CurrencyConverter::CurrencyConverter(const CurrencyRateProvider &provider)
        : provider_(provider)
    {
    }

    MarketData CurrencyConverter::to_base(const MarketData &data, const std::string &base_currency) const
    {
        Eigen::MatrixXd prices = data.get_prices();
        Eigen::MatrixXd dividends = data.get_dividends();
        const auto &dates = data.get_dates();
        const auto &tickers = data.get_tickers();

        for (size_t j = 0; j < tickers.size(); ++j)
        {
            const std::string &ccy = data.currencies()[j];
            if (ccy.empty() || ccy == base_currency)
            {
                continue;
            }
            for (size_t i = 0; i < dates.size(); ++i)
            {
                if (!data.has_price(i, j) && data.dividend(i, j) == 0.0)
                {
                    continue;
                }
                double fx = provider_.rate(ccy, base_currency, dates[i]);
                auto r = static_cast<Eigen::Index>(i);
                auto c = static_cast<Eigen::Index>(j);
                prices(r, c) *= fx;
                dividends(r, c) *= fx;
            }
        }

        MarketData out(prices, dividends, dates, tickers);
        for (const auto &ticker : tickers)
        {
            out.set_currency(ticker, base_currency);
        }
        return out;
    }

    MarketData CurrencyConverter::to_base(const MarketData &data, const std::string &base_currency,
                                          const std::string &start_date, const std::string &end_date) const
    {
        return to_base(data.filter_by_date(start_date, end_date), base_currency);
    }

} // namespace allocsim
