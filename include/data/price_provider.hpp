/**
 * @file price_provider.hpp
 * @brief Source of per-ticker price and dividend series for a backtest.
 */

#ifndef ALLOCSIM_DATA_PRICE_PROVIDER_HPP
#define ALLOCSIM_DATA_PRICE_PROVIDER_HPP

#include "data/market_data.hpp"

#include <memory>
#include <string>
#include <vector>

namespace allocsim
{

    /**
     * @class PriceDataProvider
     * @brief Abstract interface for price/dividend series sources.
     *
     * Implementations must fail loudly for a requested ticker they cannot
     * serve rather than return partial or interpolated data.
     */
    class PriceDataProvider
    {
    public:
        virtual ~PriceDataProvider() = default;

        /**
         * @brief Price and dividend series for the tickers over [start, end].
         * @return MarketData whose columns follow the order of @p tickers.
         * @throws backtest::MissingPriceDataError For an unknown ticker.
         */
        virtual MarketData query(const std::vector<std::string> &tickers,
                                 const std::string &start_date,
                                 const std::string &end_date) const = 0;

        virtual std::string get_name() const = 0;
    };

    /**
     * @class InMemoryPriceProvider
     * @brief Serves queries from an immutable, shareable MarketData snapshot.
     */
    class InMemoryPriceProvider : public PriceDataProvider
    {
    public:
        explicit InMemoryPriceProvider(std::shared_ptr<const MarketData> snapshot);

        MarketData query(const std::vector<std::string> &tickers,
                         const std::string &start_date,
                         const std::string &end_date) const override;

        std::string get_name() const override { return "InMemoryPriceProvider"; }

        const std::shared_ptr<const MarketData> &snapshot() const { return snapshot_; }

    private:
        std::shared_ptr<const MarketData> snapshot_;
    };

} // namespace allocsim

#endif // ALLOCSIM_DATA_PRICE_PROVIDER_HPP
