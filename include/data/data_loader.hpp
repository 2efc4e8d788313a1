/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads price/dividend history and currency rates from CSV files and the
 * backtest configuration from JSON.
 */

#ifndef ALLOCSIM_DATA_DATA_LOADER_HPP
#define ALLOCSIM_DATA_DATA_LOADER_HPP

#include "market_data.hpp"
#include "currency_converter.hpp"
#include "backtest/backtest_config.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace allocsim {

/**
 * @class DataLoader
 * @brief Loads and parses market data from CSV and JSON sources
 *
 * Supported price CSV layouts:
 * - Long format: date,ticker,adj_close[,dividend[,currency]]
 * - Wide format: date,TICKER1,TICKER2,... (prices only)
 *
 * Dates may be YYYY-MM-DD, DD/MM/YYYY or MM/DD/YYYY and are normalized
 * to ISO. Empty or unparseable prices are stored as NaN (no quote).
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load prices and dividends from a long-format CSV
     *
     * Expected format:
     * date,ticker,adj_close,dividend,currency
     * 2020-01-02,AAPL,75.09,0,USD
     * 2020-01-02,VOD.L,146.2,,GBX
     *
     * Column order is taken from the header. The dividend and currency
     * columns are optional; price aliases "price" and "close", ticker
     * alias "symbol".
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load (loads all if empty)
     * @return MarketData with currencies set per ticker
     * @throws std::runtime_error if the file cannot be read, lacks required
     *         columns, holds no valid row, or a ticker has two currencies
     */
    static MarketData load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load prices from a wide-format CSV
     *
     * Expected format:
     * date,AAPL,MSFT,...
     * 2020-01-02,75.09,160.62,...
     *
     * @throws std::runtime_error if the file cannot be loaded
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Auto-detect the CSV layout from its header and load
     */
    static MarketData load_csv(const std::string& filepath,
                               const std::vector<std::string>& tickers = {});

    /**
     * @brief Load currency rates
     *
     * Expected format:
     * date,from,to,rate
     * 2020-01-02,USD,GBP,0.7612
     *
     * @throws std::runtime_error if the file cannot be read or a row is invalid
     */
    static TableRateProvider load_fx_csv(const std::string& filepath);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load a backtest configuration file
     * @throws std::runtime_error on I/O or JSON syntax errors
     * @throws backtest::ConfigurationError on invalid field types
     */
    static backtest::BacktestConfig load_backtest_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate synthetic weekday prices with quarterly dividends
     *
     * Prices follow a discretized geometric Brownian motion starting at 100.
     * Each ticker pays dividend_yield / 4 of its price on the first trading
     * day of March, June, September and December.
     *
     * @param tickers List of ticker symbols
     * @param num_days Number of trading days (weekends are skipped)
     * @param start_date First calendar date considered
     * @param volatility Daily volatility
     * @param drift Daily drift
     * @param dividend_yield Annual dividend yield (0 disables dividends)
     * @param seed Random seed; equal seeds give identical data
     */
    static MarketData generate_synthetic_data(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        double dividend_yield = 0.0,
        unsigned int seed = 42
    );

    // ========================================================================
    // Export Methods
    // ========================================================================

    /**
     * @brief Save market data in the long format read by load_csv_long
     *
     * Rows with neither a price nor a dividend are omitted.
     */
    static void save_csv_long(const MarketData& data, const std::string& filepath);

    /**
     * @brief Save prices only, one column per ticker
     */
    static void save_csv_wide(const MarketData& data, const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Normalize a date field to YYYY-MM-DD
     * @return Empty string if the field is not a recognizable date
     */
    static std::string parse_date_field(const std::string& field);

    static bool is_valid_date_format(const std::string& date);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @return Double value, or NaN if conversion fails
     */
    static double safe_stod(const std::string& str);
};

} // namespace allocsim

#endif // ALLOCSIM_DATA_DATA_LOADER_HPP
