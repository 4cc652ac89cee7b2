#include "edgerunner/kelly.hpp"

#include "edgerunner/errors.hpp"
#include "edgerunner/odds_text.hpp"
#include "edgerunner/probability.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace edgerunner {

namespace {

void requireMultiplier(double multiplier) {
    if (!std::isfinite(multiplier) || multiplier <= 0.0 || multiplier > 1.0) {
        throw KellyError(ErrorKind::InvalidInput, "Kelly multiplier must be within (0, 1]");
    }
}

double requireNetOdds(double decimalOdds) {
    if (!std::isfinite(decimalOdds)) {
        throw KellyError(ErrorKind::InvalidOdds, "Decimal odds must be finite");
    }
    double b = decimalOdds - 1.0;
    if (b == 0.0) {
        throw KellyError(ErrorKind::DivisionByZero, "Net odds of zero leave the Kelly fraction undefined");
    }
    if (b < 0.0) {
        throw KellyError(ErrorKind::InvalidOdds, "Decimal odds must be greater than 1.0");
    }
    return b;
}

} // namespace

double kellyMultiplier(KellyPreset preset) {
    switch (preset) {
    case KellyPreset::Full:
        return 1.0;
    case KellyPreset::Half:
        return 0.5;
    case KellyPreset::Quarter:
        return 0.25;
    }
    throw KellyError(ErrorKind::InvalidInput, "Unknown Kelly preset");
}

double parseKellyMultiplier(const std::string& text) {
    std::string name = trim(text);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (name == "full") {
        return kellyMultiplier(KellyPreset::Full);
    }
    if (name == "half") {
        return kellyMultiplier(KellyPreset::Half);
    }
    if (name == "quarter") {
        return kellyMultiplier(KellyPreset::Quarter);
    }
    double value = parseReal(name, ErrorKind::InvalidInput);
    requireMultiplier(value);
    return value;
}

KellyResult computeKelly(double decimalOdds,
                         double estimatedProbability,
                         double bankroll,
                         double kellyMultiplier) {
    double b = requireNetOdds(decimalOdds);
    requireProbability(estimatedProbability);
    if (!std::isfinite(bankroll) || bankroll < 0.0) {
        throw KellyError(ErrorKind::InvalidBankroll, "Bankroll must be a non-negative amount");
    }
    requireMultiplier(kellyMultiplier);

    double p = estimatedProbability;
    double q = 1.0 - p;
    double full = (b * p - q) / b;

    // Never stake against the estimate: no edge means no bet.
    double applied = std::clamp(full, 0.0, 1.0) * kellyMultiplier;
    double stake = std::min(applied * bankroll, bankroll);
    return KellyResult{ full, applied, stake };
}

double expectedLogGrowth(double estimatedProbability, double netOdds, double fraction) {
    requireProbability(estimatedProbability);
    if (!std::isfinite(netOdds) || netOdds <= 0.0) {
        throw KellyError(ErrorKind::InvalidOdds, "Net odds must be positive");
    }
    if (!std::isfinite(fraction) || fraction < 0.0 || fraction > 1.0) {
        throw KellyError(ErrorKind::InvalidInput, "Stake fraction must be within [0, 1]");
    }
    if (fraction == 0.0) {
        return 0.0;
    }

    double p = estimatedProbability;
    double q = 1.0 - p;
    double growth = p * std::log1p(fraction * netOdds);
    if (q > 0.0) {
        growth += q * std::log1p(-fraction);
    }
    return growth;
}

StakeAdvice classifyStake(double fullKellyFraction) {
    if (fullKellyFraction <= 0.0) {
        return StakeAdvice::NoEdge;
    }
    if (fullKellyFraction > kAggressiveKellyFraction) {
        return StakeAdvice::Aggressive;
    }
    return StakeAdvice::Moderate;
}

const char* toString(StakeAdvice advice) {
    switch (advice) {
    case StakeAdvice::NoEdge:
        return "no edge, do not bet";
    case StakeAdvice::Moderate:
        return "moderate";
    case StakeAdvice::Aggressive:
        return "aggressive, consider half or quarter Kelly";
    }
    return "unknown";
}

} // namespace edgerunner
