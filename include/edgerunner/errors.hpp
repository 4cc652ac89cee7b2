#pragma once

#include <stdexcept>
#include <string>

namespace edgerunner {

enum class ErrorKind {
    InvalidOdds,
    InvalidProbability,
    InvalidBankroll,
    InvalidInput,
    DivisionByZero
};

const char* toString(ErrorKind kind);

class KellyError : public std::runtime_error {
public:
    KellyError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace edgerunner
