#include "backtest/errors.hpp"

namespace allocsim {
namespace backtest {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:
            return "configuration_error";
        case ErrorKind::MISSING_PRICE_DATA:
            return "missing_price_data";
        case ErrorKind::COMPUTATION:
            return "computation_error";
    }
    return "unknown_error";
}

} // namespace backtest
} // namespace allocsim
