#pragma once

#include <stdexcept>
#include <string>

namespace allocsim {
namespace backtest {

enum class ErrorKind {
    CONFIGURATION,
    MISSING_PRICE_DATA,
    COMPUTATION
};

std::string to_string(ErrorKind kind);

// Base of every failure that aborts a backtest run. A run either completes
// or throws one of these; no partial result is ever returned.
class BacktestError : public std::runtime_error {
public:
    BacktestError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigurationError : public BacktestError {
public:
    explicit ConfigurationError(const std::string& msg)
        : BacktestError(ErrorKind::CONFIGURATION, msg) {}
};

class MissingPriceDataError : public BacktestError {
public:
    explicit MissingPriceDataError(const std::string& msg)
        : BacktestError(ErrorKind::MISSING_PRICE_DATA, msg) {}
};

class ComputationError : public BacktestError {
public:
    explicit ComputationError(const std::string& msg)
        : BacktestError(ErrorKind::COMPUTATION, msg) {}
};

} // namespace backtest
} // namespace allocsim
