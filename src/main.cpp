#include "edgerunner/config.hpp"
#include "edgerunner/edge.hpp"
#include "edgerunner/kelly.hpp"
#include "edgerunner/odds_text.hpp"
#include "edgerunner/session.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace edgerunner;

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  odds <text>         set odds in the current notation (2.50, +150, 5/2)\n"
              << "  market <percent>    price the odds from a quoted market probability (no margin)\n"
              << "  format <name>       decimal | american | fractional (converts current odds)\n"
              << "  prob <percent>      your win probability for the backed side\n"
              << "  bankroll <amount>   bankroll to size the stake against\n"
              << "  kelly <value>       full | half | quarter | custom multiplier in (0, 1]\n"
              << "  side <yes|no>       back the event or its opposite\n"
              << "  show                print the current evaluation\n"
              << "  quit\n";
}

void printEvaluation(const CalculatorState& state, const CalculatorConfig& cfg) {
    std::cout << "\n----------------------------------------\n";
    std::cout << "Side: " << (state.side == BetSide::OnEvent ? "Yes" : "No")
              << "  Bankroll: " << formatAmount(state.input.bankroll, cfg.percentPlaces)
              << "  Kelly multiplier: " << state.input.kellyMultiplier << "\n";

    if (!state.result.ok()) {
        std::cout << "Error [" << toString(*state.result.error) << "]: " << state.result.message
                  << "\n";
        return;
    }

    const Evaluation& e = *state.result.value;
    std::cout << "Odds: " << formatOdds(e.decimalOdds, OddsFormat::Decimal, cfg.oddsPlaces) << " | "
              << formatOdds(e.decimalOdds, OddsFormat::American) << " | "
              << formatOdds(e.decimalOdds, OddsFormat::Fractional) << "\n";
    std::cout << "Implied probability: " << formatPercent(e.impliedProbability, cfg.percentPlaces)
              << "  Your probability: "
              << formatPercent(state.input.estimatedProbability, cfg.percentPlaces) << "\n";
    std::cout << "Edge: " << formatPercent(e.edge, cfg.percentPlaces)
              << (classifyEdge(e.edge) == EdgeSign::Positive ? " (positive)" : " (none)") << "\n";
    std::cout << "EV per unit staked: " << formatAmount(e.evPerUnitStake, cfg.unitPlaces)
              << "  Win per unit: " << formatAmount(e.winPerUnitStake, cfg.unitPlaces)
              << "  Loss per unit: " << formatAmount(e.lossPerUnitStake, cfg.unitPlaces) << "\n";
    if (e.fairDecimalOdds && *e.fairDecimalOdds > 1.0) {
        std::cout << "Fair odds: " << formatOdds(*e.fairDecimalOdds, OddsFormat::Decimal, cfg.oddsPlaces) << " | "
                  << formatOdds(*e.fairDecimalOdds, OddsFormat::American) << " | "
                  << formatOdds(*e.fairDecimalOdds, OddsFormat::Fractional) << "\n";
    } else {
        std::cout << "Fair odds: -\n";
    }
    std::cout << "Full Kelly fraction: " << formatPercent(e.fullKellyFraction, cfg.percentPlaces)
              << " (" << toString(classifyStake(e.fullKellyFraction)) << ")\n";
    std::cout << "Applied fraction: " << formatPercent(e.appliedFraction, cfg.percentPlaces)
              << "  Recommended stake: " << formatAmount(e.recommendedStake, cfg.percentPlaces)
              << "\n";
    std::cout << "Log growth per bet at full Kelly: "
              << formatAmount(e.fullKellyLogGrowth, cfg.growthPlaces)
              << "\n";

    if (e.fullKellyFraction > 0.0) {
        StakeLadder ladder = stakeLadder(state.input);
        std::cout << "Stakes  full: " << formatAmount(ladder.full, cfg.percentPlaces)
                  << "  half: " << formatAmount(ladder.half, cfg.percentPlaces)
                  << "  quarter: " << formatAmount(ladder.quarter, cfg.percentPlaces) << "\n";
    }
}

// Applies one command to the snapshot. Returns false on quit.
bool handleCommand(const std::string& line, CalculatorState& state, OddsFormat& format,
                   const CalculatorConfig& cfg) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;
    std::string argument;
    std::getline(iss, argument);
    argument = trim(argument);

    if (command.empty() || command == "show") {
        printEvaluation(state, cfg);
        return true;
    }
    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "help") {
        printHelp();
        return true;
    }

    BetInput next = state.input;
    try {
        if (command == "odds") {
            next.odds = parseOdds(argument, format);
        } else if (command == "market") {
            double market = parseReal(argument, ErrorKind::InvalidProbability) / 100.0;
            next = priceFromMarket(next, market, state.side, format);
        } else if (command == "format") {
            format = parseOddsFormat(argument);
            if (state.result.ok()) {
                next.odds = convertOdds(state.input.odds, format);
            }
        } else if (command == "prob") {
            next.estimatedProbability = parseReal(argument, ErrorKind::InvalidProbability) / 100.0;
        } else if (command == "bankroll") {
            next.bankroll = parseBankroll(argument);
        } else if (command == "kelly") {
            next.kellyMultiplier = parseKellyMultiplier(argument);
        } else if (command == "side") {
            BetSide side = BetSide::OnEvent;
            if (argument == "no") {
                side = BetSide::OnOpposite;
            } else if (argument != "yes") {
                throw KellyError(ErrorKind::InvalidInput, "Side must be yes or no");
            }
            state = updateSide(state, side);
            printEvaluation(state, cfg);
            return true;
        } else {
            std::cerr << "Unknown command: " << command << " (type help)\n";
            return true;
        }
    } catch (const KellyError& ex) {
        std::cerr << "Rejected [" << toString(ex.kind()) << "]: " << ex.what() << "\n";
        return true;
    }

    state = update(state, next);
    printEvaluation(state, cfg);
    return true;
}

} // namespace

int main() {
    CalculatorConfig cfg;
    try {
        cfg = loadCalculatorConfig();
    } catch (const KellyError& ex) {
        std::cerr << "Configuration error [" << toString(ex.kind()) << "]: " << ex.what() << "\n";
        return 1;
    }

    OddsFormat format = cfg.oddsFormat;
    BetInput input{ fromDecimal(2.0, format), cfg.estimatedProbability, cfg.bankroll,
                    cfg.kellyMultiplier };
    CalculatorState state = initialState(input);

    std::cout << "EdgeRunner Kelly criterion calculator.\n";
    std::cout << "Odds notation: " << toString(format)
              << " (set EDGERUNNER_ODDS_FORMAT, EDGERUNNER_BANKROLL, EDGERUNNER_KELLY or "
                 "EDGERUNNER_PROBABILITY to change defaults)\n";
    printHelp();
    printEvaluation(state, cfg);

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!handleCommand(trim(line), state, format, cfg)) {
            break;
        }
    }

    std::cout << "Goodbye.\n";
    return 0;
}
