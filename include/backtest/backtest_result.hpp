/**
 * @file backtest_result.hpp
 * @brief Convenience header for BacktestResult.
 *
 * Forwards to backtest_engine.hpp where BacktestResult is defined, so the
 * analytics and report layers can include the result struct by its
 * logical name.
 */

#ifndef ALLOCSIM_BACKTEST_BACKTEST_RESULT_HPP
#define ALLOCSIM_BACKTEST_BACKTEST_RESULT_HPP

#include "backtest/backtest_engine.hpp"

#endif // ALLOCSIM_BACKTEST_BACKTEST_RESULT_HPP
