/**
 * @file price_provider.cpp
 * @brief Implementation of InMemoryPriceProvider
 */

#include "data/price_provider.hpp"
#include "backtest/errors.hpp"

#include <stdexcept>

namespace allocsim
{

    InMemoryPriceProvider::InMemoryPriceProvider(std::shared_ptr<const MarketData> snapshot)
        : snapshot_(std::move(snapshot))
    {
        if (!snapshot_)
        {
            throw std::invalid_argument("InMemoryPriceProvider requires a market data snapshot");
        }
    }

    MarketData InMemoryPriceProvider::query(const std::vector<std::string> &tickers,
                                            const std::string &start_date,
                                            const std::string &end_date) const
    {
        for (const auto &ticker : tickers)
        {
            if (snapshot_->find_ticker_index(ticker) < 0)
            {
                throw backtest::MissingPriceDataError("No price series available for ticker " + ticker);
            }
        }
        return snapshot_->select_assets(tickers).filter_by_date(start_date, end_date);
    }

} // namespace allocsim
