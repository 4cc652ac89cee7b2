#pragma once

#include <string>

namespace edgerunner {

enum class KellyPreset { Full, Half, Quarter };

double kellyMultiplier(KellyPreset preset);

// Accepts "full", "half", "quarter" or a custom real in (0, 1].
double parseKellyMultiplier(const std::string& text);

struct KellyResult {
    // Unclamped; negative when the bet has no edge.
    double fullKellyFraction;
    double appliedFraction;
    double recommendedStake;
};

KellyResult computeKelly(double decimalOdds,
                         double estimatedProbability,
                         double bankroll,
                         double kellyMultiplier);

// Expected log growth per bet when staking fraction f at net odds b.
double expectedLogGrowth(double estimatedProbability, double netOdds, double fraction);

enum class StakeAdvice { NoEdge, Moderate, Aggressive };

constexpr double kAggressiveKellyFraction = 0.25;

StakeAdvice classifyStake(double fullKellyFraction);

const char* toString(StakeAdvice advice);

} // namespace edgerunner
