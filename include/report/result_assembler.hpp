/**
 * @file result_assembler.hpp
 * @brief Combines a finished backtest and its metrics into one report.
 *
 * The report is what the CLI writes and the job repository stores: headline
 * metrics, the drawdown breakdown, best and worst periods, the monthly
 * win/loss split and the chart series, serialized with nlohmann::json.
 */

#ifndef ALLOCSIM_REPORT_RESULT_ASSEMBLER_HPP
#define ALLOCSIM_REPORT_RESULT_ASSEMBLER_HPP

#include "analytics/drawdown_analysis.hpp"
#include "analytics/performance_metrics.hpp"
#include "backtest/backtest_config.hpp"
#include "backtest/backtest_result.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace allocsim
{
    namespace report
    {

        /**
         * @struct DividendSummary
         * @brief Totals over every dividend payout of a run.
         */
        struct DividendSummary
        {
            int payouts = 0;
            double total_received = 0.0;
            double reinvested = 0.0;
            double to_cash = 0.0;
        };

        /**
         * @class BacktestReport
         * @brief Immutable result of one backtest plus everything derived from it.
         */
        class BacktestReport
        {
        public:
            BacktestReport(const backtest::BacktestParams &params,
                           backtest::BacktestResult result,
                           analytics::PerformanceMetrics metrics,
                           std::vector<analytics::DrawdownEvent> drawdowns,
                           DividendSummary dividends);

            const backtest::BacktestParams &params() const { return params_; }
            const backtest::BacktestResult &result() const { return result_; }
            const analytics::PerformanceMetrics &metrics() const { return metrics_; }
            const std::vector<analytics::DrawdownEvent> &drawdowns() const { return drawdowns_; }
            const DividendSummary &dividends() const { return dividends_; }

            /**
             * @brief Serialize the full report.
             *
             * Top-level keys: metrics, max_drawdown, best_periods,
             * worst_periods, monthly_win_lose_analysis, chart_data, trades,
             * dividends, final_holdings, config.
             */
            nlohmann::json to_json() const;

            /**
             * @brief Write to_json() to a file, creating parent directories.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void save_json(const std::string &filepath, int indent = 2) const;

            /** @brief Equity curve CSV, see BacktestResult::export_equity_curve_csv. */
            void export_equity_curve_csv(const std::string &filepath) const;

            /** @brief Print a summary table to std::cout. */
            void print_summary() const;

        private:
            backtest::BacktestParams params_;
            backtest::BacktestResult result_;
            analytics::PerformanceMetrics metrics_;
            std::vector<analytics::DrawdownEvent> drawdowns_;
            DividendSummary dividends_;
        };

        /**
         * @class ResultAssembler
         * @brief Builds a BacktestReport from a finished run.
         */
        class ResultAssembler
        {
        public:
            explicit ResultAssembler(const backtest::BacktestParams &params);

            /**
             * @brief Compute metrics and drawdowns for a result.
             * @throws ComputationError If the equity curve cannot be analysed.
             */
            BacktestReport assemble(const backtest::BacktestResult &result) const;

            static DividendSummary summarize_dividends(const std::vector<backtest::DividendRecord> &dividends);

        private:
            backtest::BacktestParams params_;
        };

    } // namespace report
} // namespace allocsim

#endif // ALLOCSIM_REPORT_RESULT_ASSEMBLER_HPP
