#pragma once

#include "edgerunner/odds.hpp"
#include "edgerunner/odds_text.hpp"

namespace edgerunner {

struct CalculatorConfig {
    double bankroll = 1000.0;
    OddsFormat oddsFormat = OddsFormat::Decimal;
    double kellyMultiplier = 0.5;
    double estimatedProbability = 0.55;
    int oddsPlaces = kOddsDisplayPlaces;
    int percentPlaces = kPercentDisplayPlaces;
    int unitPlaces = 4;
    int growthPlaces = 6;
};

// Defaults overridden by EDGERUNNER_BANKROLL, EDGERUNNER_ODDS_FORMAT,
// EDGERUNNER_KELLY and EDGERUNNER_PROBABILITY. Bad overrides throw.
CalculatorConfig loadCalculatorConfig();

} // namespace edgerunner
