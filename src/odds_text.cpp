#include "edgerunner/odds_text.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace edgerunner {

namespace {

constexpr double kWholeFractionLimit =
    static_cast<double>(std::numeric_limits<std::int64_t>::max());

std::string stripSeparators(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    std::copy_if(value.begin(), value.end(), std::back_inserter(out), [](char c) { return c != ','; });
    return out;
}

double parseAmerican(const std::string& text) {
    std::string digits = stripSeparators(text);
    if (!digits.empty() && digits.front() == '+') {
        digits.erase(0, 1);
    }
    if (digits.empty()) {
        throw KellyError(ErrorKind::InvalidOdds, "American odds text is empty");
    }
    std::size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(digits, &pos);
    } catch (const std::exception& ex) {
        throw KellyError(ErrorKind::InvalidOdds, std::string("American odds must be an integer: ") + ex.what());
    }
    if (pos != digits.size()) {
        throw KellyError(ErrorKind::InvalidOdds, "American odds must be an integer: " + text);
    }
    return static_cast<double>(value);
}

} // namespace

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

double parseReal(const std::string& text, ErrorKind kind) {
    std::string value = trim(text);
    if (value.empty()) {
        throw KellyError(kind, "Expected a number but got nothing");
    }
    std::size_t pos = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw KellyError(kind, "Not a number: " + value);
    }
    if (pos != value.size()) {
        throw KellyError(kind, "Not a number: " + value);
    }
    return parsed;
}

double parseBankroll(const std::string& text) {
    double bankroll = parseReal(stripSeparators(text), ErrorKind::InvalidBankroll);
    if (!std::isfinite(bankroll) || bankroll < 0.0) {
        throw KellyError(ErrorKind::InvalidBankroll, "Bankroll must be a non-negative amount");
    }
    return bankroll;
}

OddsValue parseOdds(const std::string& text, OddsFormat format) {
    std::string value = trim(text);
    if (value.empty()) {
        throw KellyError(ErrorKind::InvalidOdds, "Odds text is empty");
    }

    OddsValue odds = DecimalOdds{ 0.0 };
    switch (format) {
    case OddsFormat::Decimal:
        odds = DecimalOdds{ parseReal(value, ErrorKind::InvalidOdds) };
        break;
    case OddsFormat::American:
        odds = AmericanOdds{ parseAmerican(value) };
        break;
    case OddsFormat::Fractional: {
        auto slash = value.find('/');
        if (slash == std::string::npos || value.find('/', slash + 1) != std::string::npos) {
            throw KellyError(ErrorKind::InvalidOdds, "Fractional odds must look like n/d: " + value);
        }
        double num = parseReal(value.substr(0, slash), ErrorKind::InvalidOdds);
        double den = parseReal(value.substr(slash + 1), ErrorKind::InvalidOdds);
        odds = FractionalOdds{ num, den };
        break;
    }
    }

    toDecimal(odds);
    return odds;
}

std::string formatOdds(double decimalOdds, OddsFormat format, int decimalPlaces) {
    if (!std::isfinite(decimalOdds) || decimalOdds <= 1.0) {
        throw KellyError(ErrorKind::InvalidOdds, "Decimal odds must be greater than 1.0");
    }
    double b = decimalOdds - 1.0;

    std::ostringstream oss;
    switch (format) {
    case OddsFormat::Decimal:
        oss << std::fixed << std::setprecision(decimalPlaces) << decimalOdds;
        break;
    case OddsFormat::American:
        oss << std::fixed << std::setprecision(0);
        if (decimalOdds < 2.0) {
            oss << '-' << std::round(100.0 / b);
        } else if (std::isfinite(b * 100.0)) {
            oss << '+' << std::round(b * 100.0);
        } else {
            // b is integral this far out; scale by appending the digits.
            oss << '+' << b << "00";
        }
        break;
    case OddsFormat::Fractional: {
        if (b >= kWholeFractionLimit) {
            oss << std::fixed << std::setprecision(0) << b << "/1";
            break;
        }
        auto fraction = approximateFraction(b, kDisplayFractionDenominator);
        oss << fraction.numerator() << '/' << fraction.denominator();
        break;
    }
    }
    return oss.str();
}

std::string formatOdds(const OddsValue& odds) {
    return formatOdds(toDecimal(odds), formatOf(odds));
}

std::string formatPercent(double fraction, int places) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(places) << fraction * 100.0 << '%';
    return oss.str();
}

std::string formatAmount(double amount, int places) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(places) << amount;
    return oss.str();
}

} // namespace edgerunner
