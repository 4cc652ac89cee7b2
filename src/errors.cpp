#include "edgerunner/errors.hpp"

namespace edgerunner {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidOdds:
        return "InvalidOdds";
    case ErrorKind::InvalidProbability:
        return "InvalidProbability";
    case ErrorKind::InvalidBankroll:
        return "InvalidBankroll";
    case ErrorKind::InvalidInput:
        return "InvalidInput";
    case ErrorKind::DivisionByZero:
        return "DivisionByZero";
    }
    return "Unknown";
}

KellyError::KellyError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace edgerunner
