#include "edgerunner/evaluator.hpp"

#include "edgerunner/edge.hpp"
#include "edgerunner/kelly.hpp"

#include <algorithm>

namespace edgerunner {

Evaluation evaluate(const BetInput& input) {
    double d = toDecimal(input.odds);
    EdgeMetrics edge = computeEdge(d, input.estimatedProbability);
    KellyResult kelly =
        computeKelly(d, input.estimatedProbability, input.bankroll, input.kellyMultiplier);

    Evaluation result{};
    result.decimalOdds = d;
    result.impliedProbability = edge.impliedProbability;
    result.edge = edge.edge;
    result.evPerUnitStake = edge.evPerUnitStake;
    result.fullKellyFraction = kelly.fullKellyFraction;
    result.appliedFraction = kelly.appliedFraction;
    result.recommendedStake = kelly.recommendedStake;

    result.winPerUnitStake = d - 1.0;
    result.lossPerUnitStake = 1.0;
    result.fairDecimalOdds = fairDecimalOdds(input.estimatedProbability);
    result.fullKellyLogGrowth = expectedLogGrowth(
        input.estimatedProbability, d - 1.0, std::clamp(kelly.fullKellyFraction, 0.0, 1.0));
    return result;
}

Evaluation evaluate(const OddsValue& odds,
                    double estimatedProbability,
                    double bankroll,
                    double kellyMultiplier) {
    return evaluate(BetInput{ odds, estimatedProbability, bankroll, kellyMultiplier });
}

EvaluationResult tryEvaluate(const BetInput& input) {
    EvaluationResult result;
    try {
        result.value = evaluate(input);
    } catch (const KellyError& ex) {
        result.error = ex.kind();
        result.message = ex.what();
    }
    return result;
}

StakeLadder stakeLadder(const BetInput& input) {
    double d = toDecimal(input.odds);
    auto stakeFor = [&](KellyPreset preset) {
        return computeKelly(d, input.estimatedProbability, input.bankroll, kellyMultiplier(preset))
            .recommendedStake;
    };
    return StakeLadder{ stakeFor(KellyPreset::Full),
                        stakeFor(KellyPreset::Half),
                        stakeFor(KellyPreset::Quarter) };
}

BetInput switchSide(const BetInput& input) {
    double opposite = complementDecimalOdds(toDecimal(input.odds));
    requireProbability(input.estimatedProbability);

    BetInput flipped = input;
    flipped.odds = fromDecimal(opposite, formatOf(input.odds));
    flipped.estimatedProbability = 1.0 - input.estimatedProbability;
    return flipped;
}

BetInput priceFromMarket(const BetInput& input,
                         double marketProbability,
                         BetSide side,
                         OddsFormat format) {
    BetInput priced = input;
    priced.odds = fromDecimal(oddsFromMarketProbability(marketProbability, side), format);
    return priced;
}

} // namespace edgerunner
