/**
 * @file currency_converter.hpp
 * @brief Conversion of multi-currency price series into a base currency.
 *
 * Rates come from a CurrencyRateProvider collaborator. Conversion happens
 * once, before the simulation, so engine arithmetic only ever sees
 * base-currency values.
 */

#ifndef ALLOCSIM_DATA_CURRENCY_CONVERTER_HPP
#define ALLOCSIM_DATA_CURRENCY_CONVERTER_HPP

#include "data/market_data.hpp"

#include <map>
#include <string>
#include <utility>

namespace allocsim
{

    /**
     * @class CurrencyRateProvider
     * @brief Abstract source of FX rates.
     */
    class CurrencyRateProvider
    {
    public:
        virtual ~CurrencyRateProvider() = default;

        /**
         * @brief Units of @p to per one unit of @p from on @p date.
         * @throws backtest::MissingPriceDataError If no rate is available.
         */
        virtual double rate(const std::string &from,
                            const std::string &to,
                            const std::string &date) const = 0;
    };

    /**
     * @class TableRateProvider
     * @brief In-memory rate table keyed by currency pair and date.
     *
     * A lookup uses the most recent rate on or before the requested date.
     * Inverse pairs are derived from the stored direction. Pence sterling
     * (GBX) is handled as a fixed 1/100 of GBP.
     */
    class TableRateProvider : public CurrencyRateProvider
    {
    public:
        TableRateProvider() = default;

        /**
         * @throws std::invalid_argument If rate is not positive.
         */
        void add_rate(const std::string &from,
                      const std::string &to,
                      const std::string &date,
                      double rate);

        double rate(const std::string &from,
                    const std::string &to,
                    const std::string &date) const override;

        size_t size() const;

    private:
        bool lookup(const std::string &from,
                    const std::string &to,
                    const std::string &date,
                    double &out) const;

        std::map<std::pair<std::string, std::string>, std::map<std::string, double>> rates_;
    };

    /**
     * @class CurrencyConverter
     * @brief Rewrites a MarketData snapshot into a single base currency.
     */
    class CurrencyConverter
    {
    public:
        explicit CurrencyConverter(const CurrencyRateProvider &provider);

        /**
         * @brief Convert every non-base ticker's prices and dividends.
         *
         * Tickers whose currency is empty or already @p base_currency are
         * copied unchanged. The provider is queried once per quoted
         * (ticker, date).
         *
         * @throws backtest::MissingPriceDataError If a needed rate is missing.
         */
        MarketData to_base(const MarketData &data, const std::string &base_currency) const;

        /**
         * @brief Convert only the rows dated within [start_date, end_date].
         *
         * Rows outside the window are dropped first, so the rate table only
         * has to cover the simulated period.
         */
        MarketData to_base(const MarketData &data, const std::string &base_currency,
                           const std::string &start_date, const std::string &end_date) const;

    private:
        const CurrencyRateProvider &provider_;
    };

} // namespace allocsim

#endif // ALLOCSIM_DATA_CURRENCY_CONVERTER_HPP
