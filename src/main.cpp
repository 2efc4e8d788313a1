/**
 * @file main.cpp
 * @brief Main entry point for the allocsim backtester
 *
 * Command-line application that loads a backtest configuration and price
 * history, simulates the portfolio day by day, and writes the performance
 * report as JSON.
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/currency_converter.hpp"
#include "backtest/backtest_config.hpp"
#include "backtest/backtest_engine.hpp"
#include "backtest/errors.hpp"
#include "report/result_assembler.hpp"
#include <iostream>
#include <string>
#include <exception>
#include <iomanip>
#include <chrono>

using namespace allocsim;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "allocsim v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to backtest configuration JSON file (required)\n"
              << "  --prices PATH         Price/dividend CSV: date,ticker,adj_close[,dividend[,currency]] (required)\n"
              << "  --fx PATH             Currency rate CSV: date,from,to,rate\n"
              << "  --output PATH         Result JSON file (default: results/backtest_result.json)\n"
              << "  --curve PATH          Also export the equity curve as CSV\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/backtest_config.json"
              << " --prices data/market/prices.csv --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       allocsim v1.0.0                                          \n"
              << "       Portfolio Backtest Simulation                            \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string prices_path;
    std::string fx_path;
    std::string output_path = "results/backtest_result.json";
    std::string curve_path;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--fx" && i + 1 < argc)
            {
                args.fx_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--curve" && i + 1 < argc)
            {
                args.curve_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && !prices_path.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/6] Loading configuration..." << std::endl;

        auto config = DataLoader::load_backtest_config(args.config_path);
        config.verbose = config.verbose || args.verbose;
        auto params = backtest::BacktestParams::from_config(config);

        if (args.verbose)
        {
            std::cout << "  - Period: " << params.start_date << " to " << params.end_date << "\n";
            std::cout << "  - Mode: " << backtest::to_string(params.mode)
                      << ", base currency: " << backtest::to_string(params.base_currency) << "\n";
            std::cout << "  - Rebalance: " << backtest::to_string(params.strategy.rebalance_frequency)
                      << ", fractional: " << (params.strategy.fractional_shares ? "yes" : "no")
                      << ", reinvest dividends: " << (params.strategy.reinvest_dividends ? "yes" : "no") << "\n";
            std::cout << "  - Target weights:\n";
            for (size_t i = 0; i < params.tickers.size(); ++i)
            {
                std::cout << "      " << std::setw(8) << std::left << params.tickers[i]
                          << std::fixed << std::setprecision(2)
                          << params.target_weights[static_cast<Eigen::Index>(i)] * 100.0 << "%\n";
            }
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/6] Loading market data..." << std::endl;

        auto data = DataLoader::load_csv(args.prices_path, params.tickers);
        std::cout << "  - Loaded " << data.num_dates() << " dates, "
                  << data.num_assets() << " assets" << std::endl;

        if (args.verbose)
        {
            data.print_summary();
        }

        // ====================================================================
        // 3. Currency Conversion
        // ====================================================================
        std::cout << "[3/6] Converting to " << backtest::to_string(params.base_currency) << "..." << std::endl;

        TableRateProvider rates;
        if (!args.fx_path.empty())
        {
            rates = DataLoader::load_fx_csv(args.fx_path);
            if (args.verbose)
            {
                std::cout << "  - Loaded " << rates.size() << " currency rates\n";
            }
        }
        CurrencyConverter converter(rates);
        data = converter.to_base(data, backtest::to_string(params.base_currency),
                                 params.start_date, params.end_date);

        // ====================================================================
        // 4. Simulation
        // ====================================================================
        std::cout << "[4/6] Running backtest..." << std::endl;

        backtest::BacktestEngine engine(params);
        auto result = engine.run(data);

        std::cout << "  - Simulated " << result.equity_curve.size() << " trading days, "
                  << result.trade_summary.total_trades << " trades ("
                  << engine.resolver().get_name() << ")" << std::endl;

        // ====================================================================
        // 5. Metrics
        // ====================================================================
        std::cout << "[5/6] Computing performance metrics..." << std::endl;

        report::ResultAssembler assembler(params);
        auto report = assembler.assemble(result);
        report.print_summary();

        // ====================================================================
        // 6. Output
        // ====================================================================
        std::cout << "\n[6/6] Writing results..." << std::endl;

        report.save_json(args.output_path);
        std::cout << "  - Report written to: " << args.output_path << "\n";
        if (!args.curve_path.empty())
        {
            report.export_equity_curve_csv(args.curve_path);
            std::cout << "  - Equity curve written to: " << args.curve_path << "\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Backtest completed successfully in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const backtest::BacktestError &e)
    {
        std::cerr << "\nError [" << backtest::to_string(e.kind()) << "]: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
