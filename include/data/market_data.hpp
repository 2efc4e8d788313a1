/*
 * @file market_data.hpp
 * @brief Time-series price and dividend storage.
 *
 * Holds adjusted close prices and per-share dividend events for a set of
 * tickers on a common ascending date axis, using Eigen matrices.
 */

#ifndef ALLOCSIM_DATA_MARKET_DATA_HPP
#define ALLOCSIM_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace allocsim
{
    /**
     * @class MarketData
     * @brief Container for multi-asset adjusted close and dividend series.
     *
     * @note Both matrices are stored as (dates x assets).
     * @note A missing quote is NaN in the price matrix. A day without a
     *       dividend event is 0 in the dividend matrix.
     * @note Instances are not modified once handed to an engine and may be
     *       shared between concurrently running backtests.
     */
    class MarketData
    {
    public:
        /**
         * @brief Constructor with prices only (no dividend events).
         * @param prices Price matrix (dates x assets).
         * @param dates Strictly ascending YYYY-MM-DD dates.
         * @param tickers Asset ticker symbols.
         * @throws std::invalid_argument On dimension mismatch, unordered dates
         *         or non-positive prices.
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        /**
         * @brief Constructor with prices and dividends.
         * @param dividends Dividend per share matrix, same shape as prices.
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const Eigen::MatrixXd &dividends,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        ~MarketData() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const Eigen::MatrixXd &get_prices() const
        {
            return prices_;
        }

        const Eigen::MatrixXd &get_dividends() const
        {
            return dividends_;
        }

        const std::vector<std::string> &get_dates() const
        {
            return dates_;
        }

        const std::vector<std::string> &get_tickers() const
        {
            return tickers_;
        }

        size_t num_dates() const
        {
            return static_cast<size_t>(prices_.rows());
        }

        size_t num_assets() const
        {
            return static_cast<size_t>(prices_.cols());
        }

        /**
         * @brief Whether a quote exists at (date index, ticker index).
         */
        bool has_price(size_t date_idx, size_t ticker_idx) const;

        double price(size_t date_idx, size_t ticker_idx) const
        {
            return prices_(static_cast<Eigen::Index>(date_idx), static_cast<Eigen::Index>(ticker_idx));
        }

        double dividend(size_t date_idx, size_t ticker_idx) const
        {
            return dividends_(static_cast<Eigen::Index>(date_idx), static_cast<Eigen::Index>(ticker_idx));
        }

        /**
         * @brief Price for specific asset and date (NaN if not quoted).
         * @throws std::invalid_argument If the ticker or date is unknown.
         */
        double get_price(const std::string &ticker, const std::string &date) const;

        /**
         * @brief Dividend per share for specific asset and date (0 if none).
         * @throws std::invalid_argument If the ticker or date is unknown.
         */
        double get_dividend(const std::string &ticker, const std::string &date) const;

        /**
         * @brief Index of a ticker, or -1 if not present.
         */
        int find_ticker_index(const std::string &ticker) const;

        /**
         * @brief Index of a date, or -1 if not present.
         */
        int find_date_index(const std::string &date) const;

        /** ===========================================
         *  Currency Tagging
         *  ===========================================
         */

        /**
         * @brief Quote currency of a ticker (empty when unspecified, meaning
         *        the run's base currency).
         */
        const std::string &currency(const std::string &ticker) const;

        void set_currency(const std::string &ticker, const std::string &currency);

        const std::vector<std::string> &currencies() const
        {
            return currencies_;
        }

        /** ===========================================
         *  Filtering Methods
         *  ===========================================
         */

        /**
         * @brief Keep rows whose date falls in [start_date, end_date].
         *
         * Bounds do not need to be present in the date axis. The result may
         * have zero rows.
         */
        MarketData filter_by_date(const std::string &start_date,
                                  const std::string &end_date) const;

        /**
         * @brief Select subset of assets, in the requested order.
         * @throws std::invalid_argument If a ticker is not present.
         */
        MarketData select_assets(const std::vector<std::string> &selected_tickers) const;

        /** ===========================================
         *  Validation Methods
         *  ===========================================
         */

        /**
         * @brief Number of quoted days for a ticker column.
         */
        size_t count_quotes(size_t ticker_idx) const;

        /**
         * @brief Count missing price values.
         */
        size_t count_missing() const;

        void print_summary() const;

    private:
        void validate() const;
        void build_index_maps();

        Eigen::MatrixXd prices_;                     ///< Price matrix (dates x assets)
        Eigen::MatrixXd dividends_;                  ///< Dividend per share (dates x assets)
        std::vector<std::string> dates_;             ///< Date strings
        std::vector<std::string> tickers_;           ///< Asset tickers
        std::vector<std::string> currencies_;        ///< Quote currency per ticker
        std::map<std::string, size_t> date_index_;   ///< Date to index map
        std::map<std::string, size_t> ticker_index_; ///< Ticker to index map
    };

}
#endif // ALLOCSIM_DATA_MARKET_DATA_HPP
