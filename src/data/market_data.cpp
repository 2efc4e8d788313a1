/**
 * @file market_data.cpp
 * @brief Implementation of MarketData class
 */

#include "data/market_data.hpp"
#include "data/date_utils.hpp"

#include <iostream>
#include <cmath>

namespace allocsim
{

    // ============================================================================
    // Constructors
    // ============================================================================

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : MarketData(prices, Eigen::MatrixXd::Zero(prices.rows(), prices.cols()), dates, tickers)
    {
    }

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const Eigen::MatrixXd &dividends,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dividends_(dividends), dates_(dates), tickers_(tickers),
          currencies_(tickers.size())
    {
        validate();
        build_index_maps();
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    bool MarketData::has_price(size_t date_idx, size_t ticker_idx) const
    {
        return !std::isnan(price(date_idx, ticker_idx));
    }

    double MarketData::get_price(const std::string &ticker, const std::string &date) const
    {
        int ticker_idx = find_ticker_index(ticker);
        int date_idx = find_date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        return prices_(date_idx, ticker_idx);
    }

    double MarketData::get_dividend(const std::string &ticker, const std::string &date) const
    {
        int ticker_idx = find_ticker_index(ticker);
        int date_idx = find_date_index(date);

        if (ticker_idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        if (date_idx < 0)
        {
            throw std::invalid_argument("Date not found: " + date);
        }

        return dividends_(date_idx, ticker_idx);
    }

    int MarketData::find_ticker_index(const std::string &ticker) const
    {
        auto it = ticker_index_.find(ticker);
        if (it != ticker_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    int MarketData::find_date_index(const std::string &date) const
    {
        auto it = date_index_.find(date);
        if (it != date_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    // ============================================================================
    // Currency Tagging
    // ============================================================================

    const std::string &MarketData::currency(const std::string &ticker) const
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return currencies_[static_cast<size_t>(idx)];
    }

    void MarketData::set_currency(const std::string &ticker, const std::string &currency)
    {
        int idx = find_ticker_index(ticker);
        if (idx < 0)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        currencies_[static_cast<size_t>(idx)] = currency;
    }

    // ================================
    // Data Filtering and Manipulation
    // ================================

    MarketData MarketData::filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const
    {
        std::vector<Eigen::Index> rows;
        std::vector<std::string> filtered_dates;
        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (dates_[i] >= start_date && dates_[i] <= end_date)
            {
                rows.push_back(static_cast<Eigen::Index>(i));
                filtered_dates.push_back(dates_[i]);
            }
        }

        Eigen::MatrixXd filtered_prices(static_cast<Eigen::Index>(rows.size()), prices_.cols());
        Eigen::MatrixXd filtered_dividends(static_cast<Eigen::Index>(rows.size()), prices_.cols());
        for (size_t i = 0; i < rows.size(); ++i)
        {
            filtered_prices.row(static_cast<Eigen::Index>(i)) = prices_.row(rows[i]);
            filtered_dividends.row(static_cast<Eigen::Index>(i)) = dividends_.row(rows[i]);
        }

        MarketData out(filtered_prices, filtered_dividends, filtered_dates, tickers_);
        out.currencies_ = currencies_;
        return out;
    }

    MarketData MarketData::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        std::vector<int> indices;
        indices.reserve(selected_tickers.size());

        for (const auto &ticker : selected_tickers)
        {
            int idx = find_ticker_index(ticker);
            if (idx < 0)
            {
                throw std::invalid_argument("Ticker not found: " + ticker);
            }
            indices.push_back(idx);
        }

        Eigen::MatrixXd selected_prices(prices_.rows(), static_cast<Eigen::Index>(indices.size()));
        Eigen::MatrixXd selected_dividends(prices_.rows(), static_cast<Eigen::Index>(indices.size()));
        std::vector<std::string> selected_currencies;
        for (size_t i = 0; i < indices.size(); ++i)
        {
            selected_prices.col(static_cast<Eigen::Index>(i)) = prices_.col(indices[i]);
            selected_dividends.col(static_cast<Eigen::Index>(i)) = dividends_.col(indices[i]);
            selected_currencies.push_back(currencies_[static_cast<size_t>(indices[i])]);
        }

        MarketData out(selected_prices, selected_dividends, dates_, selected_tickers);
        out.currencies_ = selected_currencies;
        return out;
    }

    // ===================
    // Validation Methods
    // ===================

    size_t MarketData::count_quotes(size_t ticker_idx) const
    {
        size_t count = 0;
        for (size_t i = 0; i < num_dates(); ++i)
        {
            if (has_price(i, ticker_idx))
            {
                ++count;
            }
        }
        return count;
    }

    size_t MarketData::count_missing() const
    {
        size_t count = 0;
        for (int i = 0; i < prices_.rows(); ++i)
        {
            for (int j = 0; j < prices_.cols(); ++j)
            {
                if (std::isnan(prices_(i, j)))
                {
                    ++count;
                }
            }
        }
        return count;
    }

    void MarketData::print_summary() const
    {
        std::cout << "\n=== Market Data Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Assets: ";
        for (const auto &ticker : tickers_)
        {
            std::cout << ticker << " ";
        }
        int dividend_events = 0;
        for (int i = 0; i < dividends_.rows(); ++i)
        {
            for (int j = 0; j < dividends_.cols(); ++j)
            {
                if (dividends_(i, j) > 0.0)
                {
                    ++dividend_events;
                }
            }
        }
        std::cout << "\nMissing values: " << count_missing() << "\n";
        std::cout << "Dividend events: " << dividend_events << "\n";
        std::cout << "==========================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    void MarketData::validate() const
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Price matrix rows must match dates vector size");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument("Price matrix columns must match tickers vector size");
        }
        if (dividends_.rows() != prices_.rows() || dividends_.cols() != prices_.cols())
        {
            throw std::invalid_argument("Dividend matrix must have the same shape as the price matrix");
        }

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            if (!date_utils::is_iso_date(dates_[i]))
            {
                throw std::invalid_argument("Invalid date in market data: '" + dates_[i] + "'");
            }
            if (i > 0 && !(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument("Market data dates must be strictly ascending at " + dates_[i]);
            }
        }

        for (Eigen::Index i = 0; i < prices_.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices_.cols(); ++j)
            {
                double p = prices_(i, j);
                if (!std::isnan(p) && !(p > 0.0 && std::isfinite(p)))
                {
                    throw std::invalid_argument("Non-positive price for " + tickers_[static_cast<size_t>(j)] +
                                                " on " + dates_[static_cast<size_t>(i)]);
                }
                double d = dividends_(i, j);
                if (!(d >= 0.0 && std::isfinite(d)))
                {
                    throw std::invalid_argument("Invalid dividend for " + tickers_[static_cast<size_t>(j)] +
                                                " on " + dates_[static_cast<size_t>(i)]);
                }
            }
        }
    }

    void MarketData::build_index_maps()
    {
        date_index_.clear();
        ticker_index_.clear();

        for (size_t i = 0; i < dates_.size(); ++i)
        {
            date_index_[dates_[i]] = i;
        }

        for (size_t i = 0; i < tickers_.size(); ++i)
        {
            if (ticker_index_.count(tickers_[i]))
            {
                throw std::invalid_argument("Duplicate ticker in market data: " + tickers_[i]);
            }
            ticker_index_[tickers_[i]] = i;
        }
    }

} // namespace allocsim
