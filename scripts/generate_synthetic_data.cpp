/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic price and dividend history for the backtester
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include <iostream>
#include <iomanip>
#include <exception>

using namespace allocsim;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    std::vector<std::string> tickers = {
        "VTI",    // US total market
        "VXUS",   // International equity
        "BND",    // US bonds
        "VNQ",    // Real estate
        "GLD"     // Gold
    };

    // 5 years of weekdays
    size_t num_days = 1305;
    std::string start_date = "2019-01-01";

    std::string output_file = "data/market/prices.csv";
    double base_volatility = 0.012;  // 1.2% daily volatility
    double base_drift = 0.0003;      // ~8% annualized return
    double dividend_yield = 0.02;    // paid quarterly
    unsigned int seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--days" && i + 1 < argc) {
                num_days = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--start" && i + 1 < argc) {
                start_date = argv[++i];
            } else if (arg == "--volatility" && i + 1 < argc) {
                base_volatility = std::stod(argv[++i]);
            } else if (arg == "--drift" && i + 1 < argc) {
                base_drift = std::stod(argv[++i]);
            } else if (arg == "--dividend-yield" && i + 1 < argc) {
                dividend_yield = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE          Output CSV file (default: data/market/prices.csv)\n"
                          << "  --days N               Number of trading days (default: 1305)\n"
                          << "  --start DATE           First calendar date (default: 2019-01-01)\n"
                          << "  --volatility VAL       Daily volatility (default: 0.012)\n"
                          << "  --drift VAL            Daily drift (default: 0.0003)\n"
                          << "  --dividend-yield VAL   Annual dividend yield, paid quarterly (default: 0.02)\n"
                          << "  --seed N               Random seed (default: 42)\n"
                          << "  --help                 Show this help\n";
                return 0;
            }
        }

        std::cout << "Generating " << num_days << " trading days for "
                  << tickers.size() << " assets from " << start_date << "..." << std::endl;

        auto data = DataLoader::generate_synthetic_data(
            tickers,
            num_days,
            start_date,
            base_volatility,
            base_drift,
            dividend_yield,
            seed
        );

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_csv_long(data, output_file);

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << data.num_dates() << " ("
                  << data.get_dates().front() << " to "
                  << data.get_dates().back() << ")\n";
        std::cout << "Assets: " << data.num_assets() << "\n\n";

        std::cout << std::setw(8) << "Ticker"
                  << std::setw(12) << "First"
                  << std::setw(12) << "Last"
                  << std::setw(14) << "Price Return"
                  << std::setw(12) << "Dividends" << "\n";
        std::cout << std::string(58, '-') << "\n";

        size_t last = data.num_dates() - 1;
        for (size_t j = 0; j < data.num_assets(); ++j) {
            double first_price = data.price(0, j);
            double last_price = data.price(last, j);
            double dividends = data.get_dividends().col(static_cast<Eigen::Index>(j)).sum();

            std::cout << std::setw(8) << data.get_tickers()[j]
                      << std::fixed << std::setprecision(2)
                      << std::setw(12) << first_price
                      << std::setw(12) << last_price
                      << std::setw(13) << (last_price / first_price - 1.0) * 100.0 << "%"
                      << std::setw(12) << dividends << "\n";
        }
        std::cout << std::string(58, '-') << "\n";
        std::cout << "\nDone.\n" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
