/**
 * @file performance_metrics.cpp
 * @brief Implementation of the PerformanceMetrics class.
 *
 * Volatility uses simple square-root-of-time scaling; CAGR uses geometric
 * compounding over calendar days.
 */

#include "analytics/performance_metrics.hpp"
#include "backtest/backtest_result.hpp"
#include "backtest/errors.hpp"
#include "data/date_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace analytics
    {

        namespace
        {
            constexpr double kDaysPerYear = 365.25;

            const char *const kBucketLabels[] = {
                "< -10%", "-10% to -5%", "-5% to 0%", "0% to 5%", "5% to 10%", "10%+"};

            int histogram_bucket(double r)
            {
                if (r < -0.10)
                    return 0;
                if (r < -0.05)
                    return 1;
                if (r < 0.0)
                    return 2;
                if (r < 0.05)
                    return 3;
                if (r < 0.10)
                    return 4;
                return 5;
            }

            std::string percent(double fraction)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
                return oss.str();
            }
        } // namespace

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const backtest::BacktestResult &result,
                                               double risk_free_rate,
                                               int trading_days_per_year)
            : initial_investment_(result.initial_investment),
              risk_free_rate_(risk_free_rate),
              trading_days_per_year_(trading_days_per_year)
        {
            initialize(result.equity_curve);
        }

        PerformanceMetrics::PerformanceMetrics(const std::vector<backtest::EquityCurvePoint> &equity_curve,
                                               double initial_investment,
                                               double risk_free_rate,
                                               int trading_days_per_year)
            : initial_investment_(initial_investment),
              risk_free_rate_(risk_free_rate),
              trading_days_per_year_(trading_days_per_year)
        {
            initialize(equity_curve);
        }

        // ===================================================================
        // Return Metrics
        // ===================================================================

        double PerformanceMetrics::final_value() const
        {
            return values_.back();
        }

        double PerformanceMetrics::total_contributions() const
        {
            return total_contributions_;
        }

        double PerformanceMetrics::cumulative_return() const
        {
            return final_value() / initial_investment_ - 1.0;
        }

        double PerformanceMetrics::cumulative_gain() const
        {
            return final_value() - total_contributions_;
        }

        long long PerformanceMetrics::calendar_days() const
        {
            return date_utils::days_between(dates_.front(), dates_.back());
        }

        double PerformanceMetrics::cagr() const
        {
            long long days = calendar_days();
            if (days <= 0)
            {
                return 0.0;
            }
            double growth = final_value() / initial_investment_;
            if (growth <= 0.0)
            {
                return -1.0;
            }
            return std::pow(growth, kDaysPerYear / static_cast<double>(days)) - 1.0;
        }

        // ===================================================================
        // Risk Metrics
        // ===================================================================

        double PerformanceMetrics::annualized_volatility() const
        {
            return volatility_;
        }

        double PerformanceMetrics::sharpe_ratio() const
        {
            if (volatility_ == 0.0)
            {
                return 0.0;
            }
            return (cagr() - risk_free_rate_) / volatility_;
        }

        double PerformanceMetrics::max_drawdown() const
        {
            return max_drawdown_info_.depth;
        }

        const DrawdownInfo &PerformanceMetrics::max_drawdown_info() const
        {
            return max_drawdown_info_;
        }

        const std::vector<double> &PerformanceMetrics::drawdown_series() const
        {
            return drawdown_series_;
        }

        // ===================================================================
        // Return Series
        // ===================================================================

        const std::vector<double> &PerformanceMetrics::daily_returns() const
        {
            return daily_returns_;
        }

        const std::vector<std::string> &PerformanceMetrics::return_dates() const
        {
            return return_dates_;
        }

        const std::vector<PeriodReturn> &PerformanceMetrics::period_returns(PeriodGranularity granularity) const
        {
            return period_returns_.at(granularity);
        }

        std::optional<PeriodReturn> PerformanceMetrics::best_period(PeriodGranularity granularity) const
        {
            return analytics::best_period(period_returns(granularity));
        }

        std::optional<PeriodReturn> PerformanceMetrics::worst_period(PeriodGranularity granularity) const
        {
            return analytics::worst_period(period_returns(granularity));
        }

        WinLossSummary PerformanceMetrics::monthly_win_loss() const
        {
            WinLossSummary result;
            for (const auto &month : period_returns(PeriodGranularity::MONTHLY))
            {
                if (month.period_return > 0.0)
                {
                    ++result.win;
                }
                else
                {
                    ++result.loss;
                }
            }
            int months = result.win + result.loss;
            if (months > 0)
            {
                result.rate = static_cast<double>(result.win) / static_cast<double>(months);
            }
            return result;
        }

        std::vector<HistogramBucket> PerformanceMetrics::monthly_histogram() const
        {
            std::vector<HistogramBucket> buckets;
            for (const char *label : kBucketLabels)
            {
                buckets.push_back(HistogramBucket{label, 0});
            }
            for (const auto &month : period_returns(PeriodGranularity::MONTHLY))
            {
                ++buckets[histogram_bucket(month.period_return)].count;
            }
            return buckets;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string PerformanceMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Summary\n";
            oss << "===================\n";
            oss << "  Period:              " << dates_.front() << " to " << dates_.back()
                << " (" << calendar_days() << " days)\n";
            oss << "\n";

            oss << "Return Metrics:\n";
            oss << "  Final Value:         " << std::setprecision(2) << final_value() << "\n";
            oss << "  Contributions:       " << std::setprecision(2) << total_contributions() << "\n";
            oss << "  Cumulative Gain:     " << std::setprecision(2) << cumulative_gain() << "\n";
            oss << "  Cumulative Return:   " << std::setprecision(4)
                << cumulative_return() * 100.0 << "%\n";
            oss << "  CAGR:                " << std::setprecision(4) << cagr() * 100.0 << "%\n";
            oss << "\n";

            oss << "Risk Metrics:\n";
            oss << "  Annualized Vol:      " << std::setprecision(4)
                << annualized_volatility() * 100.0 << "%\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << sharpe_ratio() << "\n";
            oss << "  Max Drawdown:        " << std::setprecision(4) << max_drawdown() * 100.0 << "%\n";
            if (max_drawdown_info_.depth < 0.0)
            {
                oss << "  Peak / Trough:       " << max_drawdown_info_.peak_date << " / "
                    << max_drawdown_info_.trough_date << "\n";
                oss << "  Recovered:           "
                    << (max_drawdown_info_.recovery_date.empty() ? "no" : max_drawdown_info_.recovery_date)
                    << "\n";
            }
            oss << "\n";

            auto wl = monthly_win_loss();
            oss << "Monthly:\n";
            oss << "  Win / Loss:          " << wl.win << " / " << wl.loss
                << " (" << percent(wl.rate) << ")\n";
            auto best = best_period(PeriodGranularity::MONTHLY);
            auto worst = worst_period(PeriodGranularity::MONTHLY);
            if (best && worst)
            {
                oss << "  Best Month:          " << best->period << " " << percent(best->period_return) << "\n";
                oss << "  Worst Month:         " << worst->period << " " << percent(worst->period_return) << "\n";
            }

            return oss.str();
        }

        nlohmann::json PerformanceMetrics::to_json() const
        {
            nlohmann::json j;
            j["final_value"] = final_value();
            j["cumulative_return"] = cumulative_return();
            j["cumulative_gain"] = cumulative_gain();
            j["total_contributions"] = total_contributions();
            j["cagr"] = cagr();
            j["volatility"] = annualized_volatility();
            j["sharpe"] = sharpe_ratio();
            return j;
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void PerformanceMetrics::initialize(const std::vector<backtest::EquityCurvePoint> &equity_curve)
        {
            if (equity_curve.empty())
            {
                throw backtest::ComputationError("Cannot compute metrics of an empty equity curve");
            }
            if (!(initial_investment_ > 0.0))
            {
                throw backtest::ComputationError(
                    "initial_investment must be positive to compute returns, got: " + std::to_string(initial_investment_));
            }
            if (trading_days_per_year_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year_));
            }

            values_.reserve(equity_curve.size());
            dates_.reserve(equity_curve.size());
            for (const auto &point : equity_curve)
            {
                values_.push_back(point.total_value);
                dates_.push_back(point.date);
            }
            total_contributions_ = equity_curve.back().cumulative_contributions;

            compute_returns(equity_curve);
            compute_drawdown();
        }

        void PerformanceMetrics::compute_returns(const std::vector<backtest::EquityCurvePoint> &equity_curve)
        {
            for (size_t t = 1; t < equity_curve.size(); ++t)
            {
                double previous = equity_curve[t - 1].total_value;
                if (!(previous > 0.0))
                {
                    throw backtest::ComputationError(
                        "Non-positive portfolio value " + std::to_string(previous) + " on " + equity_curve[t - 1].date);
                }
                const auto &point = equity_curve[t];
                daily_returns_.push_back((point.total_value - point.contribution) / previous - 1.0);
                return_dates_.push_back(point.date);
            }

            size_t n = daily_returns_.size();
            if (n >= 2)
            {
                double mean = 0.0;
                for (double r : daily_returns_)
                {
                    mean += r;
                }
                mean /= static_cast<double>(n);

                double sum_sq = 0.0;
                for (double r : daily_returns_)
                {
                    sum_sq += (r - mean) * (r - mean);
                }
                volatility_ = std::sqrt(sum_sq / static_cast<double>(n - 1)) *
                              std::sqrt(static_cast<double>(trading_days_per_year_));
            }

            for (PeriodGranularity granularity : all_granularities())
            {
                period_returns_[granularity] = compute_period_returns(return_dates_, daily_returns_, granularity);
            }
        }

        void PerformanceMetrics::compute_drawdown()
        {
            int n = static_cast<int>(values_.size());
            drawdown_series_.resize(n);

            double peak = values_[0];
            double max_dd = 0.0;
            int peak_idx = 0;
            int best_peak_idx = 0;
            int best_trough_idx = 0;

            for (int i = 0; i < n; ++i)
            {
                if (values_[i] > peak)
                {
                    peak = values_[i];
                    peak_idx = i;
                }
                if (!(peak > 0.0))
                {
                    throw backtest::ComputationError(
                        "Non-positive running peak " + std::to_string(peak) + " on " + dates_[i]);
                }
                double dd = (values_[i] - peak) / peak;
                drawdown_series_[i] = dd;

                if (dd < max_dd)
                {
                    max_dd = dd;
                    best_peak_idx = peak_idx;
                    best_trough_idx = i;
                }
            }

            int recovery_idx = -1;
            if (max_dd < 0.0)
            {
                double peak_value = values_[best_peak_idx];
                for (int i = best_trough_idx + 1; i < n; ++i)
                {
                    if (values_[i] >= peak_value)
                    {
                        recovery_idx = i;
                        break;
                    }
                }
            }

            max_drawdown_info_.depth = max_dd;
            max_drawdown_info_.peak_index = best_peak_idx;
            max_drawdown_info_.trough_index = best_trough_idx;
            max_drawdown_info_.recovery_index = recovery_idx;
            max_drawdown_info_.peak_date = dates_[best_peak_idx];
            max_drawdown_info_.trough_date = dates_[best_trough_idx];
            max_drawdown_info_.recovery_date = (recovery_idx >= 0) ? dates_[recovery_idx] : "";
        }

    } // namespace analytics
} // namespace allocsim
