/**
 * @file drawdown_analysis.cpp
 * @brief Implementation of the DrawdownAnalysis class.
 *
 * Events are identified by tracking the running peak and detecting the
 * transitions into and out of drawdown.
 */

#include "analytics/drawdown_analysis.hpp"
#include "backtest/errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace allocsim
{
    namespace analytics
    {

        // ===================================================================
        // Constructors
        // ===================================================================

        DrawdownAnalysis::DrawdownAnalysis(const std::vector<double> &values,
                                           const std::vector<std::string> &dates)
            : values_(values), dates_(dates), worst_event_index_(-1)
        {
            if (values_.empty())
            {
                throw backtest::ComputationError("Cannot analyse drawdowns of an empty value series");
            }
            if (values_.size() != dates_.size())
            {
                throw std::invalid_argument(
                    "Value series size (" + std::to_string(values_.size()) + ") must match dates size (" + std::to_string(dates_.size()) + ")");
            }

            compute_underwater_curve();
            identify_events();
        }

        // ===================================================================
        // Event Access
        // ===================================================================

        const std::vector<DrawdownEvent> &DrawdownAnalysis::all_events() const
        {
            return events_;
        }

        std::vector<DrawdownEvent> DrawdownAnalysis::top_drawdowns(int n) const
        {
            if (n < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'n', got: " + std::to_string(n));
            }

            std::vector<DrawdownEvent> sorted_events(events_);
            std::stable_sort(sorted_events.begin(), sorted_events.end(),
                             [](const DrawdownEvent &a, const DrawdownEvent &b)
                             {
                                 return a.depth < b.depth; // Deepest first
                             });

            int count = std::min(n, static_cast<int>(sorted_events.size()));
            sorted_events.resize(count);
            return sorted_events;
        }

        const DrawdownEvent &DrawdownAnalysis::worst_drawdown() const
        {
            if (worst_event_index_ < 0)
            {
                throw std::runtime_error("No drawdown events found in the value series");
            }
            return events_[worst_event_index_];
        }

        int DrawdownAnalysis::event_count() const
        {
            return static_cast<int>(events_.size());
        }

        // ===================================================================
        // Aggregate Statistics
        // ===================================================================

        DrawdownSummary DrawdownAnalysis::summary() const
        {
            DrawdownSummary result;
            result.total_events = static_cast<int>(events_.size());
            if (events_.empty())
            {
                return result;
            }

            double sum_depth = 0.0;
            double sum_decline = 0.0;
            double sum_recovery = 0.0;
            int recovery_count = 0;
            int underwater_days = 0;

            for (const auto &event : events_)
            {
                sum_depth += event.depth;
                sum_decline += static_cast<double>(event.decline_days);
                result.max_depth = std::min(result.max_depth, event.depth);

                if (event.recovery_days >= 0)
                {
                    sum_recovery += static_cast<double>(event.recovery_days);
                    ++recovery_count;
                    underwater_days += event.total_days;
                }
                else
                {
                    underwater_days += static_cast<int>(values_.size()) - 1 - event.peak_index;
                }
            }

            double n_events = static_cast<double>(events_.size());
            result.average_depth = sum_depth / n_events;
            result.average_decline_days = sum_decline / n_events;
            result.average_recovery_days = (recovery_count > 0)
                                               ? (sum_recovery / static_cast<double>(recovery_count))
                                               : -1.0;
            result.unrecovered_count = result.total_events - recovery_count;
            if (values_.size() > 1)
            {
                result.time_in_drawdown_pct =
                    static_cast<double>(underwater_days) / static_cast<double>(values_.size() - 1);
            }
            return result;
        }

        const std::vector<double> &DrawdownAnalysis::underwater_curve() const
        {
            return underwater_curve_;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string DrawdownAnalysis::report(int max_events) const
        {
            std::ostringstream oss;
            oss << std::fixed;

            auto sum = summary();

            oss << "Drawdown Analysis\n";
            oss << "=================\n";
            oss << "  Events:             " << sum.total_events << "\n";
            oss << "  Max Depth:          " << std::setprecision(2) << sum.max_depth * 100.0 << "%\n";
            oss << "  Unrecovered Events: " << sum.unrecovered_count << "\n";
            oss << "  Time in Drawdown:   " << std::setprecision(2)
                << sum.time_in_drawdown_pct * 100.0 << "%\n";

            int events_to_show = static_cast<int>(events_.size());
            if (max_events >= 0 && max_events < events_to_show)
            {
                events_to_show = max_events;
            }
            if (events_to_show == 0)
            {
                return oss.str();
            }

            oss << "\n  " << std::left
                << std::setw(6) << "Rank"
                << std::setw(10) << "Depth"
                << std::setw(13) << "Peak"
                << std::setw(13) << "Trough"
                << std::setw(13) << "Recovery"
                << "\n";
            oss << "  " << std::string(55, '-') << "\n";

            auto sorted = top_drawdowns(events_to_show);
            for (int i = 0; i < static_cast<int>(sorted.size()); ++i)
            {
                const auto &e = sorted[i];
                std::ostringstream depth;
                depth << std::fixed << std::setprecision(2) << e.depth * 100.0 << "%";
                oss << "  " << std::left
                    << std::setw(6) << (i + 1)
                    << std::setw(10) << depth.str()
                    << std::setw(13) << e.peak_date
                    << std::setw(13) << e.trough_date
                    << std::setw(13) << (e.recovery_date.empty() ? "-" : e.recovery_date)
                    << "\n";
            }
            return oss.str();
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void DrawdownAnalysis::compute_underwater_curve()
        {
            underwater_curve_.resize(values_.size());

            double peak = values_[0];
            for (size_t i = 0; i < values_.size(); ++i)
            {
                peak = std::max(peak, values_[i]);
                if (peak <= 0.0)
                {
                    throw backtest::ComputationError(
                        "Non-positive running peak " + std::to_string(peak) + " on " + dates_[i]);
                }
                underwater_curve_[i] = (values_[i] - peak) / peak;
            }
        }

        void DrawdownAnalysis::identify_events()
        {
            int n = static_cast<int>(values_.size());

            double peak = values_[0];
            int peak_idx = 0;
            bool in_drawdown = false;
            int event_peak_idx = 0;
            int event_trough_idx = 0;

            for (int i = 1; i < n; ++i)
            {
                if (values_[i] >= peak)
                {
                    if (in_drawdown)
                    {
                        events_.push_back(make_event(event_peak_idx, event_trough_idx, i));
                        in_drawdown = false;
                    }
                    peak = values_[i];
                    peak_idx = i;
                }
                else if (!in_drawdown)
                {
                    in_drawdown = true;
                    event_peak_idx = peak_idx;
                    event_trough_idx = i;
                }
                else if (values_[i] < values_[event_trough_idx])
                {
                    event_trough_idx = i;
                }
            }

            if (in_drawdown)
            {
                events_.push_back(make_event(event_peak_idx, event_trough_idx, -1));
            }

            double worst_depth = 0.0;
            for (size_t k = 0; k < events_.size(); ++k)
            {
                if (events_[k].depth < worst_depth)
                {
                    worst_depth = events_[k].depth;
                    worst_event_index_ = static_cast<int>(k);
                }
            }
        }

        DrawdownEvent DrawdownAnalysis::make_event(int peak_idx, int trough_idx, int recovery_idx) const
        {
            DrawdownEvent event;
            event.peak_index = peak_idx;
            event.trough_index = trough_idx;
            event.recovery_index = recovery_idx;
            event.peak_date = dates_[peak_idx];
            event.trough_date = dates_[trough_idx];
            event.peak_value = values_[peak_idx];
            event.trough_value = values_[trough_idx];
            event.depth = (event.trough_value - event.peak_value) / event.peak_value;
            event.decline_days = trough_idx - peak_idx;
            if (recovery_idx >= 0)
            {
                event.recovery_date = dates_[recovery_idx];
                event.recovery_days = recovery_idx - trough_idx;
                event.total_days = recovery_idx - peak_idx;
            }
            return event;
        }

    } // namespace analytics
} // namespace allocsim
