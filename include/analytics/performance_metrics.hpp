/**
 * @file performance_metrics.hpp
 * @brief Performance metrics calculator for a backtest equity curve.
 *
 * Every statistic is a pure function of the equity curve and the initial
 * investment: constructing twice from the same curve gives identical
 * results. All values are computed eagerly in the constructor.
 *
 * Daily returns strip out that day's contribution, so cash injections do
 * not register as performance:
 *
 *   r_t = (V_t - contribution_t) / V_{t-1} - 1
 *
 * Annualized volatility uses 252 trading days per year by default; CAGR
 * uses calendar days (365.25 per year) between the first and last point.
 */

#ifndef ALLOCSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
#define ALLOCSIM_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "analytics/period_returns.hpp"
#include "backtest/portfolio.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace allocsim
{

    namespace backtest
    {
        struct BacktestResult;
    }

    namespace analytics
    {

        /**
         * @struct DrawdownInfo
         * @brief The maximum drawdown and where it happened.
         */
        struct DrawdownInfo
        {
            double depth = 0.0;        ///< min over t of (V_t - peak_t) / peak_t, <= 0
            int peak_index = 0;        ///< Index of the running peak before the trough
            int trough_index = 0;      ///< Index of the trough
            int recovery_index = -1;   ///< First index back at the peak (-1 if unrecovered)
            std::string peak_date;
            std::string trough_date;
            std::string recovery_date; ///< Empty if unrecovered
        };

        /**
         * @struct WinLossSummary
         * @brief Count of positive versus non-positive months.
         */
        struct WinLossSummary
        {
            int win = 0;
            int loss = 0;
            double rate = 0.0; ///< win / (win + loss), 0 when there are no months
        };

        /**
         * @struct HistogramBucket
         * @brief One bar of the monthly return histogram.
         */
        struct HistogramBucket
        {
            std::string bucket;
            int count = 0;
        };

        /**
         * @class PerformanceMetrics
         * @brief Return, risk and period statistics of an equity curve.
         *
         * Usage:
         * @code
         *   PerformanceMetrics metrics(result, params.risk_free_rate);
         *   double sharpe = metrics.sharpe_ratio();
         *   auto best_month = metrics.best_period(PeriodGranularity::MONTHLY);
         * @endcode
         *
         * Thread safety: immutable after construction.
         */
        class PerformanceMetrics
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Construct from a finished backtest.
             * @param result Backtest result (equity curve and initial investment).
             * @param risk_free_rate Annualized risk-free rate used by the Sharpe ratio.
             * @param trading_days_per_year Annualization factor for volatility.
             * @throws ComputationError If the curve is empty or a divisor is non-positive.
             */
            explicit PerformanceMetrics(const backtest::BacktestResult &result,
                                        double risk_free_rate = 0.0,
                                        int trading_days_per_year = 252);

            /**
             * @brief Construct from a raw equity curve.
             * @throws ComputationError If the curve is empty or a divisor is non-positive.
             * @throws std::invalid_argument If trading_days_per_year is not positive.
             */
            PerformanceMetrics(const std::vector<backtest::EquityCurvePoint> &equity_curve,
                               double initial_investment,
                               double risk_free_rate = 0.0,
                               int trading_days_per_year = 252);

            ~PerformanceMetrics() = default;

            // ---------------------------------------------------------------
            // Return Metrics
            // ---------------------------------------------------------------

            double initial_investment() const { return initial_investment_; }
            double final_value() const;
            double total_contributions() const;

            /** @brief final_value / initial_investment - 1. */
            double cumulative_return() const;

            /** @brief final_value - total_contributions. */
            double cumulative_gain() const;

            /** @brief Calendar days between the first and last curve dates. */
            long long calendar_days() const;

            /**
             * @brief (final / initial)^(365.25 / calendar_days) - 1.
             * @return 0 when the curve spans no calendar days; -1 when the
             *         portfolio was wiped out.
             */
            double cagr() const;

            // ---------------------------------------------------------------
            // Risk Metrics
            // ---------------------------------------------------------------

            /** @brief Sample std of daily returns times sqrt(trading days); 0 for fewer than 2 returns. */
            double annualized_volatility() const;

            /** @brief (cagr - risk_free_rate) / volatility; 0 when volatility is 0. */
            double sharpe_ratio() const;

            double max_drawdown() const;
            const DrawdownInfo &max_drawdown_info() const;

            /** @brief Drawdown at every curve point; values are non-positive. */
            const std::vector<double> &drawdown_series() const;

            // ---------------------------------------------------------------
            // Return Series
            // ---------------------------------------------------------------

            /** @brief Contribution-adjusted daily returns, one per point after the first. */
            const std::vector<double> &daily_returns() const;

            /** @brief Dates aligned with daily_returns(). */
            const std::vector<std::string> &return_dates() const;

            const std::vector<PeriodReturn> &period_returns(PeriodGranularity granularity) const;
            std::optional<PeriodReturn> best_period(PeriodGranularity granularity) const;
            std::optional<PeriodReturn> worst_period(PeriodGranularity granularity) const;

            WinLossSummary monthly_win_loss() const;

            /**
             * @brief Monthly returns binned into six fixed buckets.
             *
             * Bucket lower bounds are inclusive; all six buckets are always
             * returned, in ascending order.
             */
            std::vector<HistogramBucket> monthly_histogram() const;

            // ---------------------------------------------------------------
            // Accessors
            // ---------------------------------------------------------------

            const std::vector<double> &values() const { return values_; }
            const std::vector<std::string> &dates() const { return dates_; }
            double risk_free_rate() const { return risk_free_rate_; }
            int trading_days_per_year() const { return trading_days_per_year_; }

            // ---------------------------------------------------------------
            // Export
            // ---------------------------------------------------------------

            /**
             * @brief Human-readable multi-line summary.
             */
            std::string summary() const;

            /**
             * @brief Headline metrics as a JSON object: final_value,
             *        cumulative_return, cumulative_gain, total_contributions,
             *        cagr, volatility, sharpe.
             */
            nlohmann::json to_json() const;

        private:
            void initialize(const std::vector<backtest::EquityCurvePoint> &equity_curve);
            void compute_returns(const std::vector<backtest::EquityCurvePoint> &equity_curve);
            void compute_drawdown();

            double initial_investment_;
            double risk_free_rate_;
            int trading_days_per_year_;

            std::vector<double> values_;
            std::vector<std::string> dates_;
            double total_contributions_ = 0.0;

            std::vector<double> daily_returns_;
            std::vector<std::string> return_dates_;
            std::map<PeriodGranularity, std::vector<PeriodReturn>> period_returns_;

            std::vector<double> drawdown_series_;
            DrawdownInfo max_drawdown_info_;

            double volatility_ = 0.0;
        };

    } // namespace analytics
} // namespace allocsim

#endif // ALLOCSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
