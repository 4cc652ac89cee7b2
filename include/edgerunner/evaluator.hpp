#pragma once

#include "edgerunner/errors.hpp"
#include "edgerunner/odds.hpp"
#include "edgerunner/probability.hpp"

#include <optional>
#include <string>

namespace edgerunner {

struct BetInput {
    OddsValue odds;
    double estimatedProbability;
    double bankroll;
    double kellyMultiplier;
};

struct Evaluation {
    double decimalOdds;
    double impliedProbability;
    double edge;
    double evPerUnitStake;
    double fullKellyFraction;
    double appliedFraction;
    double recommendedStake;

    double winPerUnitStake;
    double lossPerUnitStake;
    std::optional<double> fairDecimalOdds;
    double fullKellyLogGrowth;
};

struct EvaluationResult {
    std::optional<Evaluation> value;
    std::optional<ErrorKind> error;
    std::string message;

    bool ok() const { return value.has_value(); }
};

struct StakeLadder {
    double full;
    double half;
    double quarter;
};

Evaluation evaluate(const BetInput& input);
Evaluation evaluate(const OddsValue& odds,
                    double estimatedProbability,
                    double bankroll,
                    double kellyMultiplier);

// Non-throwing form: either value or error is set, never both.
EvaluationResult tryEvaluate(const BetInput& input);

StakeLadder stakeLadder(const BetInput& input);

// Same bet viewed from the other side: complementary odds in the same
// notation and the complementary estimated probability.
BetInput switchSide(const BetInput& input);

// Replaces the odds with those implied by a quoted market probability for the
// backed side, expressed in the given notation.
BetInput priceFromMarket(const BetInput& input,
                         double marketProbability,
                         BetSide side,
                         OddsFormat format);

} // namespace edgerunner
