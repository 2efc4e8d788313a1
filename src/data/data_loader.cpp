/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class
 */

#include "data/data_loader.hpp"
#include "data/date_utils.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <iomanip>
#include <set>
#include <map>
#include <stdexcept>

namespace allocsim
{

    namespace
    {
        struct LongRow
        {
            double price = std::numeric_limits<double>::quiet_NaN();
            double dividend = 0.0;
        };

        int find_column(const std::vector<std::string> &header,
                        const std::vector<std::string> &names)
        {
            for (size_t i = 0; i < header.size(); ++i)
            {
                if (std::find(names.begin(), names.end(), header[i]) != names.end())
                {
                    return static_cast<int>(i);
                }
            }
            return -1;
        }
    } // namespace

    // ===========================
    // CSV Loading - Long Format
    // ===========================

    MarketData DataLoader::load_csv_long(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        std::vector<std::string> header;
        for (const auto &field : parse_csv_line(line))
        {
            header.push_back(to_lower(trim(field)));
        }

        int date_col = find_column(header, {"date"});
        int ticker_col = find_column(header, {"ticker", "symbol"});
        int price_col = find_column(header, {"adj_close", "adjusted_close", "price", "close"});
        int dividend_col = find_column(header, {"dividend", "dividends"});
        int currency_col = find_column(header, {"currency"});

        if (date_col < 0 || ticker_col < 0 || price_col < 0)
        {
            throw std::runtime_error(
                "Long CSV requires date, ticker and adj_close columns: " + filepath);
        }

        std::map<std::string, std::map<std::string, LongRow>> data_map; // date -> ticker -> row
        std::map<std::string, std::string> currency_of;
        std::set<std::string> all_tickers;
        size_t skipped = 0;

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (static_cast<int>(fields.size()) <= std::max({date_col, ticker_col, price_col}))
            {
                ++skipped;
                continue;
            }

            std::string date = parse_date_field(fields[date_col]);
            std::string ticker = trim(fields[ticker_col]);
            if (date.empty() || ticker.empty())
            {
                ++skipped;
                continue;
            }

            // Filter by tickers if specified
            if (!tickers.empty() &&
                std::find(tickers.begin(), tickers.end(), ticker) == tickers.end())
            {
                continue;
            }

            LongRow &row = data_map[date][ticker];
            double price = safe_stod(fields[price_col]);
            if (!std::isnan(price))
            {
                row.price = price;
            }
            if (dividend_col >= 0 && dividend_col < static_cast<int>(fields.size()))
            {
                double dividend = safe_stod(fields[dividend_col]);
                if (!std::isnan(dividend))
                {
                    row.dividend += dividend;
                }
            }
            if (currency_col >= 0 && currency_col < static_cast<int>(fields.size()))
            {
                std::string currency = trim(fields[currency_col]);
                std::transform(currency.begin(), currency.end(), currency.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::toupper(c)); });
                if (!currency.empty())
                {
                    auto it = currency_of.find(ticker);
                    if (it == currency_of.end())
                    {
                        currency_of[ticker] = currency;
                    }
                    else if (it->second != currency)
                    {
                        throw std::runtime_error("Ticker " + ticker + " is quoted in both " +
                                                 it->second + " and " + currency);
                    }
                }
            }
            all_tickers.insert(ticker);
        }

        file.close();

        if (data_map.empty() || all_tickers.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }
        if (skipped > 0)
        {
            std::cerr << "Warning: skipped " << skipped << " malformed rows in " << filepath << std::endl;
        }

        std::vector<std::string> dates;
        for (const auto &entry : data_map)
        {
            dates.push_back(entry.first);
        }
        std::vector<std::string> ticker_vec(all_tickers.begin(), all_tickers.end());

        Eigen::MatrixXd prices(dates.size(), ticker_vec.size());
        prices.setConstant(std::numeric_limits<double>::quiet_NaN());
        Eigen::MatrixXd dividends = Eigen::MatrixXd::Zero(dates.size(), ticker_vec.size());

        for (size_t i = 0; i < dates.size(); ++i)
        {
            const auto &rows = data_map[dates[i]];
            for (size_t j = 0; j < ticker_vec.size(); ++j)
            {
                auto it = rows.find(ticker_vec[j]);
                if (it != rows.end())
                {
                    prices(i, j) = it->second.price;
                    dividends(i, j) = it->second.dividend;
                }
            }
        }

        MarketData data(prices, dividends, dates, ticker_vec);
        for (const auto &entry : currency_of)
        {
            data.set_currency(entry.first, entry.second);
        }
        return data;
    }

    // ===========================
    // CSV Loading - Wide Format
    // ===========================

    MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::vector<std::string> all_tickers;
        std::vector<std::string> dates;

        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        if (header.empty() || to_lower(trim(header[0])) != "date")
        {
            throw std::runtime_error("CSV must start with 'date' column");
        }

        for (size_t i = 1; i < header.size(); ++i)
        {
            all_tickers.push_back(trim(header[i]));
        }

        // Determine which columns to load
        std::vector<size_t> column_indices;
        std::vector<std::string> selected_tickers;

        if (tickers.empty())
        {
            for (size_t i = 0; i < all_tickers.size(); ++i)
            {
                column_indices.push_back(i);
                selected_tickers.push_back(all_tickers[i]);
            }
        }
        else
        {
            for (const auto &ticker : tickers)
            {
                auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                if (it != all_tickers.end())
                {
                    column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                    selected_tickers.push_back(ticker);
                }
            }

            if (column_indices.empty())
            {
                throw std::runtime_error("None of the specified tickers found in CSV");
            }
        }

        std::map<std::string, std::vector<double>> rows_by_date;
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (fields.size() < 2)
                continue;

            std::string date = parse_date_field(fields[0]);
            if (date.empty())
            {
                continue; // Skip invalid dates
            }

            std::vector<double> row_prices;
            row_prices.reserve(column_indices.size());
            for (size_t idx : column_indices)
            {
                if (idx + 1 < fields.size())
                {
                    row_prices.push_back(safe_stod(fields[idx + 1]));
                }
                else
                {
                    row_prices.push_back(std::numeric_limits<double>::quiet_NaN());
                }
            }
            rows_by_date[date] = row_prices;
        }

        file.close();

        if (rows_by_date.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        Eigen::MatrixXd prices(rows_by_date.size(), selected_tickers.size());
        Eigen::Index i = 0;
        for (const auto &entry : rows_by_date)
        {
            dates.push_back(entry.first);
            for (size_t j = 0; j < selected_tickers.size(); ++j)
            {
                prices(i, static_cast<Eigen::Index>(j)) = entry.second[j];
            }
            ++i;
        }

        return MarketData(prices, dates, selected_tickers);
    }

    // ========================
    // Auto-detect CSV Format
    // ========================

    MarketData DataLoader::load_csv(const std::string &filepath,
                                    const std::vector<std::string> &tickers)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        std::getline(file, line);
        file.close();

        std::vector<std::string> header;
        for (const auto &field : parse_csv_line(line))
        {
            header.push_back(to_lower(trim(field)));
        }

        // Long format carries a ticker column; wide format one column per ticker
        if (find_column(header, {"ticker", "symbol"}) >= 0)
        {
            return load_csv_long(filepath, tickers);
        }
        return load_csv_wide(filepath, tickers);
    }

    // ==================
    // Currency Rates
    // ==================

    TableRateProvider DataLoader::load_fx_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        std::vector<std::string> header;
        for (const auto &field : parse_csv_line(line))
        {
            header.push_back(to_lower(trim(field)));
        }
        int date_col = find_column(header, {"date"});
        int from_col = find_column(header, {"from", "base"});
        int to_col = find_column(header, {"to", "quote"});
        int rate_col = find_column(header, {"rate"});
        int max_col = std::max({date_col, from_col, to_col, rate_col});
        if (date_col < 0 || from_col < 0 || to_col < 0 || rate_col < 0)
        {
            throw std::runtime_error("FX CSV requires date, from, to and rate columns: " + filepath);
        }

        TableRateProvider provider;
        size_t line_no = 1;
        while (std::getline(file, line))
        {
            ++line_no;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            if (static_cast<int>(fields.size()) <= max_col)
            {
                throw std::runtime_error("Malformed FX row at line " + std::to_string(line_no) + " of " + filepath);
            }

            std::string date = parse_date_field(fields[date_col]);
            double rate = safe_stod(fields[rate_col]);
            if (date.empty() || std::isnan(rate) || rate <= 0.0)
            {
                throw std::runtime_error("Invalid FX row at line " + std::to_string(line_no) + " of " + filepath);
            }
            provider.add_rate(trim(fields[from_col]), trim(fields[to_col]), date, rate);
        }

        return provider;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    backtest::BacktestConfig DataLoader::load_backtest_config(const std::string &config_path)
    {
        return backtest::BacktestConfig::from_json(load_json(config_path));
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    MarketData DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        double dividend_yield,
        unsigned int seed)
    {
        if (tickers.empty() || num_days == 0)
        {
            throw std::invalid_argument("Synthetic data needs at least one ticker and one day");
        }

        std::mt19937 gen(seed);
        std::normal_distribution<double> dist(drift, volatility);

        // Weekdays only
        std::vector<std::string> dates;
        dates.reserve(num_days);
        std::string date = start_date;
        while (dates.size() < num_days)
        {
            if (date_utils::day_of_week(date) < 5)
            {
                dates.push_back(date);
            }
            date = date_utils::add_days(date, 1);
        }

        Eigen::MatrixXd prices(num_days, tickers.size());
        Eigen::MatrixXd dividends = Eigen::MatrixXd::Zero(num_days, tickers.size());

        // Geometric Brownian motion
        for (size_t j = 0; j < tickers.size(); ++j)
        {
            prices(0, j) = 100.0;
            for (size_t i = 1; i < num_days; ++i)
            {
                double return_val = dist(gen);
                prices(i, j) = prices(i - 1, j) * std::max(1.0 + return_val, 0.01);
            }
        }

        if (dividend_yield > 0.0)
        {
            for (size_t i = 1; i < num_days; ++i)
            {
                int month = date_utils::extract_month(dates[i]);
                bool new_month = date_utils::extract_month(dates[i - 1]) != month;
                if (new_month && month % 3 == 0)
                {
                    for (size_t j = 0; j < tickers.size(); ++j)
                    {
                        dividends(i, j) = prices(i, j) * dividend_yield / 4.0;
                    }
                }
            }
        }

        return MarketData(prices, dividends, dates, tickers);
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_csv_long(const MarketData &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,ticker,adj_close,dividend,currency\n";

        const auto &dates = data.get_dates();
        const auto &tickers = data.get_tickers();

        for (size_t i = 0; i < dates.size(); ++i)
        {
            for (size_t j = 0; j < tickers.size(); ++j)
            {
                double dividend = data.dividend(i, j);
                if (!data.has_price(i, j) && dividend == 0.0)
                    continue;

                file << dates[i] << "," << tickers[j] << ",";
                if (data.has_price(i, j))
                {
                    file << std::fixed << std::setprecision(6) << data.price(i, j);
                }
                file << "," << std::fixed << std::setprecision(6) << dividend
                     << "," << data.currency(tickers[j]) << "\n";
            }
        }

        file.close();
    }

    void DataLoader::save_csv_wide(const MarketData &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date";
        for (const auto &ticker : data.get_tickers())
        {
            file << "," << ticker;
        }
        file << "\n";

        const auto &dates = data.get_dates();
        for (size_t i = 0; i < dates.size(); ++i)
        {
            file << dates[i];
            for (size_t j = 0; j < data.num_assets(); ++j)
            {
                file << ",";
                if (data.has_price(i, j))
                {
                    file << std::fixed << std::setprecision(6) << data.price(i, j);
                }
            }
            file << "\n";
        }

        file.close();
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else if (c != '\r')
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::parse_date_field(const std::string &field)
    {
        std::string date = trim(field);
        if (is_valid_date_format(date))
        {
            return date_utils::is_iso_date(date) ? date : "";
        }
        try
        {
            return date_utils::normalize_date(date);
        }
        catch (const std::invalid_argument &)
        {
            return "";
        }
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        // Simple check for YYYY-MM-DD format
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::string DataLoader::to_lower(const std::string &str)
    {
        std::string out = str;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace allocsim
