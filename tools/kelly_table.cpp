#include "edgerunner/edge.hpp"
#include "edgerunner/kelly.hpp"
#include "edgerunner/odds_text.hpp"
#include "edgerunner/probability.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: kelly_table <decimalOdds> [bankroll]\n";
        return 1;
    }

    double decimalOdds = 0.0;
    double bankroll = 1000.0;
    try {
        decimalOdds = edgerunner::toDecimal(
            edgerunner::parseOdds(argv[1], edgerunner::OddsFormat::Decimal));
        if (argc > 2) {
            bankroll = edgerunner::parseBankroll(argv[2]);
        }
    } catch (const edgerunner::KellyError& ex) {
        std::cerr << edgerunner::toString(ex.kind()) << ": " << ex.what() << '\n';
        return 1;
    }

    std::cout << "=== MARKET ===\n";
    std::cout << "Decimal odds: " << std::fixed << std::setprecision(3) << decimalOdds
              << "  Implied probability: "
              << edgerunner::formatPercent(edgerunner::impliedProbability(decimalOdds)) << "\n";
    std::cout << "Bankroll: " << edgerunner::formatAmount(bankroll) << "\n\n";

    std::cout << "=== KELLY CRITERION BY ESTIMATED PROBABILITY ===\n";
    std::cout << std::setw(8) << "p" << std::setw(10) << "edge" << std::setw(10) << "EV"
              << std::setw(10) << "kelly" << std::setw(12) << "full" << std::setw(12) << "half"
              << std::setw(12) << "quarter" << '\n';

    for (int step = 0; step <= 20; ++step) {
        double p = step * 0.05;
        auto edge = edgerunner::computeEdge(decimalOdds, p);
        auto full = edgerunner::computeKelly(
            decimalOdds, p, bankroll, edgerunner::kellyMultiplier(edgerunner::KellyPreset::Full));
        auto half = edgerunner::computeKelly(
            decimalOdds, p, bankroll, edgerunner::kellyMultiplier(edgerunner::KellyPreset::Half));
        auto quarter = edgerunner::computeKelly(
            decimalOdds, p, bankroll, edgerunner::kellyMultiplier(edgerunner::KellyPreset::Quarter));

        std::cout << std::setw(8) << std::setprecision(2) << p << std::setw(10)
                  << std::setprecision(4) << edge.edge << std::setw(10) << edge.evPerUnitStake
                  << std::setw(10) << full.appliedFraction << std::setw(12) << std::setprecision(2)
                  << full.recommendedStake << std::setw(12) << half.recommendedStake << std::setw(12)
                  << quarter.recommendedStake << '\n';
    }

    return 0;
}
