#pragma once

#include "edgerunner/errors.hpp"
#include "edgerunner/odds.hpp"

#include <string>

namespace edgerunner {

constexpr int kOddsDisplayPlaces = 3;
constexpr int kPercentDisplayPlaces = 2;
constexpr std::int64_t kDisplayFractionDenominator = 1'000;

OddsValue parseOdds(const std::string& text, OddsFormat format);

std::string formatOdds(double decimalOdds, OddsFormat format, int decimalPlaces = kOddsDisplayPlaces);
std::string formatOdds(const OddsValue& odds);

std::string formatPercent(double fraction, int places = kPercentDisplayPlaces);
std::string formatAmount(double amount, int places = kPercentDisplayPlaces);

std::string trim(const std::string& value);

// Parses a whole string as a real number; anything else throws with the given kind.
double parseReal(const std::string& text, ErrorKind kind);

// Bankroll text with optional thousands separators ("1,000").
double parseBankroll(const std::string& text);

} // namespace edgerunner
