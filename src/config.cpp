#include "edgerunner/config.hpp"

#include "edgerunner/kelly.hpp"
#include "edgerunner/probability.hpp"

#include <cstdlib>
#include <string>

namespace edgerunner {

namespace {

// Empty when the variable is unset or blank.
std::string readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return "";
    }
    return trim(env);
}

} // namespace

CalculatorConfig loadCalculatorConfig() {
    CalculatorConfig cfg;

    std::string bankroll = readEnv("EDGERUNNER_BANKROLL");
    if (!bankroll.empty()) {
        cfg.bankroll = parseBankroll(bankroll);
    }

    std::string format = readEnv("EDGERUNNER_ODDS_FORMAT");
    if (!format.empty()) {
        cfg.oddsFormat = parseOddsFormat(format);
    }

    std::string kelly = readEnv("EDGERUNNER_KELLY");
    if (!kelly.empty()) {
        cfg.kellyMultiplier = parseKellyMultiplier(kelly);
    }

    std::string probability = readEnv("EDGERUNNER_PROBABILITY");
    if (!probability.empty()) {
        double p = parseReal(probability, ErrorKind::InvalidProbability);
        requireProbability(p);
        cfg.estimatedProbability = p;
    }

    return cfg;
}

} // namespace edgerunner
