#include "edgerunner/odds_text.hpp"
#include "edgerunner/probability.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: convert_odds <decimal|american|fractional> <odds>\n";
        return 1;
    }

    try {
        edgerunner::OddsFormat format = edgerunner::parseOddsFormat(argv[1]);
        edgerunner::OddsValue odds = edgerunner::parseOdds(argv[2], format);
        double d = edgerunner::toDecimal(odds);

        std::cout << "Decimal:    " << edgerunner::formatOdds(d, edgerunner::OddsFormat::Decimal) << '\n';
        std::cout << "American:   " << edgerunner::formatOdds(d, edgerunner::OddsFormat::American) << '\n';
        std::cout << "Fractional: " << edgerunner::formatOdds(d, edgerunner::OddsFormat::Fractional) << '\n';
        std::cout << "Implied probability: "
                  << edgerunner::formatPercent(edgerunner::impliedProbability(d)) << '\n';
        std::cout << "Opposite side (no margin): "
                  << edgerunner::formatOdds(edgerunner::complementDecimalOdds(d),
                                            edgerunner::OddsFormat::Decimal)
                  << '\n';
    } catch (const edgerunner::KellyError& ex) {
        std::cerr << edgerunner::toString(ex.kind()) << ": " << ex.what() << '\n';
        return 1;
    }

    return 0;
}
