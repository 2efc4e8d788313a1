/**
 * @file drawdown_analysis.hpp
 * @brief Drawdown event decomposition of a portfolio value curve.
 *
 * A drawdown event is a contiguous stretch where the portfolio value sits
 * below its running peak. Each event has a peak, a trough and, if the value
 * climbs back to the peak before the series ends, a recovery point.
 *
 * Depths follow the sign convention of the report: (trough - peak) / peak,
 * so every depth is non-positive and -0.25 means 25% below the peak.
 */

#ifndef ALLOCSIM_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
#define ALLOCSIM_ANALYTICS_DRAWDOWN_ANALYSIS_HPP

#include <string>
#include <vector>

namespace allocsim
{
    namespace analytics
    {

        /**
         * @struct DrawdownEvent
         * @brief One peak-to-trough-to-recovery cycle.
         *
         * If the value has not recovered by the end of the series,
         * recovery_index is -1 and recovery_date is empty.
         */
        struct DrawdownEvent
        {
            int peak_index = 0;
            int trough_index = 0;
            int recovery_index = -1;

            std::string peak_date;
            std::string trough_date;
            std::string recovery_date;

            double peak_value = 0.0;
            double trough_value = 0.0;
            double depth = 0.0; ///< (trough - peak) / peak, <= 0

            int decline_days = 0;   ///< Trading days from peak to trough
            int recovery_days = -1; ///< Trading days from trough to recovery (-1 if unrecovered)
            int total_days = -1;    ///< Trading days from peak to recovery (-1 if unrecovered)
        };

        /**
         * @struct DrawdownSummary
         * @brief Aggregate statistics across all drawdown events.
         */
        struct DrawdownSummary
        {
            int total_events = 0;
            double average_depth = 0.0;
            double average_decline_days = 0.0;
            double average_recovery_days = -1.0; ///< -1 when no event recovered
            int unrecovered_count = 0;
            double time_in_drawdown_pct = 0.0; ///< Fraction of trading days spent below a peak
            double max_depth = 0.0;            ///< Most negative depth
        };

        /**
         * @class DrawdownAnalysis
         * @brief Identifies and characterizes every drawdown event in a value curve.
         *
         * Usage:
         * @code
         *   DrawdownAnalysis analysis(values, dates);
         *   auto worst = analysis.top_drawdowns(1);
         *   double underwater = analysis.summary().time_in_drawdown_pct;
         * @endcode
         *
         * Instances are immutable after construction.
         */
        class DrawdownAnalysis
        {
        public:
            /**
             * @brief Construct from a value series and its dates.
             * @throws ComputationError If the series is empty or a running peak is not positive.
             * @throws std::invalid_argument If the sizes differ.
             */
            DrawdownAnalysis(const std::vector<double> &values,
                             const std::vector<std::string> &dates);

            ~DrawdownAnalysis() = default;

            /** @brief All events in chronological order. */
            const std::vector<DrawdownEvent> &all_events() const;

            /**
             * @brief The n deepest events, deepest first.
             * @throws std::invalid_argument If n < 1.
             */
            std::vector<DrawdownEvent> top_drawdowns(int n) const;

            /**
             * @brief The deepest event.
             * @throws std::runtime_error If the series never fell below a peak.
             */
            const DrawdownEvent &worst_drawdown() const;

            bool has_drawdown() const { return worst_event_index_ >= 0; }
            int event_count() const;

            DrawdownSummary summary() const;

            /**
             * @brief Drawdown at every point; 0 at or above the running peak.
             */
            const std::vector<double> &underwater_curve() const;

            /**
             * @brief Formatted report of the deepest events.
             * @param max_events Maximum number of events to list (default all).
             */
            std::string report(int max_events = -1) const;

        private:
            void compute_underwater_curve();
            void identify_events();
            DrawdownEvent make_event(int peak_idx, int trough_idx, int recovery_idx) const;

            std::vector<double> values_;
            std::vector<std::string> dates_;
            std::vector<DrawdownEvent> events_;
            std::vector<double> underwater_curve_;
            int worst_event_index_;
        };

    } // namespace analytics
} // namespace allocsim

#endif // ALLOCSIM_ANALYTICS_DRAWDOWN_ANALYSIS_HPP
