#pragma once

#include <optional>

namespace edgerunner {

enum class BetSide { OnEvent, OnOpposite };

// 1 / decimalOdds. No overround correction.
double impliedProbability(double decimalOdds);

// Odds for the opposite side of a two-way market with no margin: d / (d - 1).
double complementDecimalOdds(double decimalOdds);

double oddsFromMarketProbability(double marketProbability, BetSide side);

// Break-even decimal odds for a probability; empty when no finite price exists.
std::optional<double> fairDecimalOdds(double probability);

void requireProbability(double probability);

} // namespace edgerunner
