#include "edgerunner/odds.hpp"

#include "edgerunner/errors.hpp"
#include "edgerunner/odds_text.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace edgerunner {

namespace {

constexpr int kMaxContinuedFractionTerms = 64;
constexpr double kFractionTolerance = 1e-7;
constexpr double kFractionLimit = static_cast<double>(std::numeric_limits<std::int64_t>::max());

double requireDecimal(double value) {
    if (!std::isfinite(value) || value <= 1.0) {
        throw KellyError(ErrorKind::InvalidOdds, "Decimal odds must be greater than 1.0");
    }
    return value;
}

struct DecimalConversion {
    double operator()(const DecimalOdds& odds) const { return requireDecimal(odds.value); }

    double operator()(const AmericanOdds& odds) const {
        if (!std::isfinite(odds.value) || odds.value == 0.0) {
            throw KellyError(ErrorKind::InvalidOdds, "American odds must be a nonzero number");
        }
        if (odds.value > 0.0) {
            return requireDecimal(1.0 + odds.value / 100.0);
        }
        return requireDecimal(1.0 + 100.0 / -odds.value);
    }

    double operator()(const FractionalOdds& odds) const {
        if (!std::isfinite(odds.numerator) || !std::isfinite(odds.denominator) ||
            odds.numerator <= 0.0 || odds.denominator <= 0.0) {
            throw KellyError(ErrorKind::InvalidOdds,
                             "Fractional odds need a positive numerator and denominator");
        }
        return requireDecimal(1.0 + odds.numerator / odds.denominator);
    }
};

struct FormatOf {
    OddsFormat operator()(const DecimalOdds&) const { return OddsFormat::Decimal; }
    OddsFormat operator()(const AmericanOdds&) const { return OddsFormat::American; }
    OddsFormat operator()(const FractionalOdds&) const { return OddsFormat::Fractional; }
};

} // namespace

OddsFormat formatOf(const OddsValue& odds) {
    return std::visit(FormatOf{}, odds);
}

double toDecimal(const OddsValue& odds) {
    return std::visit(DecimalConversion{}, odds);
}

OddsValue fromDecimal(double decimalOdds, OddsFormat target) {
    const double d = requireDecimal(decimalOdds);
    const double b = d - 1.0;

    switch (target) {
    case OddsFormat::Decimal:
        return DecimalOdds{ d };
    case OddsFormat::American:
        if (d >= 2.0) {
            return AmericanOdds{ b * 100.0 };
        }
        return AmericanOdds{ -100.0 / b };
    case OddsFormat::Fractional: {
        if (b >= kFractionLimit) {
            return FractionalOdds{ b, 1.0 };
        }
        auto fraction = approximateFraction(b, kMaxFractionDenominator);
        if (fraction.numerator() > 0) {
            double num = static_cast<double>(fraction.numerator());
            double den = static_cast<double>(fraction.denominator());
            if (std::abs(num / den - b) <= kFractionTolerance) {
                return FractionalOdds{ num, den };
            }
        }
        // Not representable within the denominator bound; keep the exact ratio.
        return FractionalOdds{ b, 1.0 };
    }
    }
    throw KellyError(ErrorKind::InvalidInput, "Unknown odds format");
}

OddsValue convertOdds(const OddsValue& odds, OddsFormat target) {
    return fromDecimal(toDecimal(odds), target);
}

boost::rational<std::int64_t> approximateFraction(double value, std::int64_t maxDenominator) {
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    if (!std::isfinite(value) || value < 0.0 || value >= static_cast<double>(kMax)) {
        throw KellyError(ErrorKind::InvalidInput, "Cannot approximate value as a fraction");
    }
    if (maxDenominator < 1) {
        throw KellyError(ErrorKind::InvalidInput, "Fraction denominator bound must be positive");
    }

    double x = value;
    double a = std::floor(x);
    std::int64_t h0 = 1;
    std::int64_t k0 = 0;
    std::int64_t h1 = static_cast<std::int64_t>(a);
    std::int64_t k1 = 1;

    for (int term = 0; term < kMaxContinuedFractionTerms; ++term) {
        double frac = x - a;
        if (frac < 1e-12) {
            break;
        }
        x = 1.0 / frac;
        if (x >= static_cast<double>(kMax)) {
            break;
        }
        a = std::floor(x);
        auto ai = static_cast<std::int64_t>(a);
        if (ai > (maxDenominator - k0) / k1) {
            break;
        }
        if (h1 > 0 && ai > (kMax - h0) / h1) {
            break;
        }
        std::int64_t h2 = h0 + ai * h1;
        std::int64_t k2 = k0 + ai * k1;
        h0 = h1;
        k0 = k1;
        h1 = h2;
        k1 = k2;
    }

    return boost::rational<std::int64_t>(h1, k1);
}

const char* toString(OddsFormat format) {
    switch (format) {
    case OddsFormat::Decimal:
        return "decimal";
    case OddsFormat::American:
        return "american";
    case OddsFormat::Fractional:
        return "fractional";
    }
    return "unknown";
}

OddsFormat parseOddsFormat(const std::string& text) {
    std::string name = trim(text);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (name == "decimal") {
        return OddsFormat::Decimal;
    }
    if (name == "american") {
        return OddsFormat::American;
    }
    if (name == "fractional") {
        return OddsFormat::Fractional;
    }
    throw KellyError(ErrorKind::InvalidInput, "Unknown odds format: " + text);
}

} // namespace edgerunner
