#include "edgerunner/probability.hpp"

#include "edgerunner/errors.hpp"

#include <cmath>

namespace edgerunner {

namespace {

void requireDecimalOdds(double decimalOdds) {
    if (!std::isfinite(decimalOdds) || decimalOdds <= 1.0) {
        throw KellyError(ErrorKind::InvalidOdds, "Decimal odds must be greater than 1.0");
    }
}

} // namespace

void requireProbability(double probability) {
    if (!std::isfinite(probability) || probability < 0.0 || probability > 1.0) {
        throw KellyError(ErrorKind::InvalidProbability, "Probability must be within [0, 1]");
    }
}

double impliedProbability(double decimalOdds) {
    requireDecimalOdds(decimalOdds);
    return 1.0 / decimalOdds;
}

double complementDecimalOdds(double decimalOdds) {
    requireDecimalOdds(decimalOdds);
    return decimalOdds / (decimalOdds - 1.0);
}

double oddsFromMarketProbability(double marketProbability, BetSide side) {
    requireProbability(marketProbability);
    double priced = side == BetSide::OnEvent ? marketProbability : 1.0 - marketProbability;
    if (priced <= 0.0 || priced >= 1.0) {
        throw KellyError(ErrorKind::InvalidProbability,
                         "Market probability for the backed side must be strictly between 0 and 1");
    }
    return 1.0 / priced;
}

std::optional<double> fairDecimalOdds(double probability) {
    requireProbability(probability);
    if (probability == 0.0) {
        return std::nullopt;
    }
    double fair = 1.0 / probability;
    if (!std::isfinite(fair)) {
        return std::nullopt;
    }
    return fair;
}

} // namespace edgerunner
