#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <boost/rational.hpp>

namespace edgerunner {

enum class OddsFormat { Decimal, American, Fractional };

// Total payout per unit staked, stake included.
struct DecimalOdds {
    double value;
};

// Positive: profit per 100 staked. Negative: stake needed to win 100.
// Not restricted to integers; fromDecimal() returns the exact inverse.
struct AmericanOdds {
    double value;
};

// Profit ratio numerator/denominator relative to stake.
struct FractionalOdds {
    double numerator;
    double denominator;
};

using OddsValue = std::variant<DecimalOdds, AmericanOdds, FractionalOdds>;

// Largest denominator fromDecimal() will use for fractional odds. Any
// decimal value is reproduced to better than 1e-6 at this bound.
constexpr std::int64_t kMaxFractionDenominator = 1'000'000;

OddsFormat formatOf(const OddsValue& odds);

double toDecimal(const OddsValue& odds);
OddsValue fromDecimal(double decimalOdds, OddsFormat target);
OddsValue convertOdds(const OddsValue& odds, OddsFormat target);

// Best rational approximation of a non-negative value by continued fractions,
// never exceeding maxDenominator.
boost::rational<std::int64_t> approximateFraction(double value, std::int64_t maxDenominator);

const char* toString(OddsFormat format);
OddsFormat parseOddsFormat(const std::string& text);

} // namespace edgerunner
