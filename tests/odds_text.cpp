#include "edgerunner/odds_text.hpp"

#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "odds_text_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectNear(double actual, double expected, double tolerance, const std::string& what) {
    if (std::abs(actual - expected) > tolerance) {
        fail(what + ": expected " + std::to_string(expected) + " got " + std::to_string(actual));
    }
}

void expectText(const std::string& actual, const std::string& expected, const std::string& what) {
    if (actual != expected) {
        fail(what + ": expected \"" + expected + "\" got \"" + actual + "\"");
    }
}

void expectError(edgerunner::ErrorKind kind, const std::function<void()>& fn, const std::string& what) {
    try {
        fn();
    } catch (const edgerunner::KellyError& ex) {
        if (ex.kind() != kind) {
            fail(what + ": wrong error kind " + edgerunner::toString(ex.kind()));
        }
        return;
    }
    fail(what + ": expected " + edgerunner::toString(kind));
}

} // namespace

int main() {
    using namespace edgerunner;

    expectNear(toDecimal(parseOdds(" 2.50 ", OddsFormat::Decimal)), 2.5, 0.0, "decimal text");
    expectNear(toDecimal(parseOdds("+150", OddsFormat::American)), 2.5, 1e-12, "american +150");
    expectNear(toDecimal(parseOdds("150", OddsFormat::American)), 2.5, 1e-12, "american unsigned");
    expectNear(toDecimal(parseOdds("-200", OddsFormat::American)), 1.5, 1e-12, "american -200");
    expectNear(toDecimal(parseOdds("1,200", OddsFormat::American)), 13.0, 1e-12, "american separators");
    expectNear(toDecimal(parseOdds("5/2", OddsFormat::Fractional)), 3.5, 1e-12, "fractional 5/2");
    expectNear(toDecimal(parseOdds(" 10 / 11 ", OddsFormat::Fractional)), 1.0 + 10.0 / 11.0, 1e-12,
               "fractional with spaces");

    if (formatOf(parseOdds("-110", OddsFormat::American)) != OddsFormat::American) {
        fail("parsed american keeps its notation");
    }

    expectError(ErrorKind::InvalidOdds, [] { parseOdds("", OddsFormat::Decimal); }, "empty odds");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("abc", OddsFormat::Decimal); }, "word odds");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("2.5x", OddsFormat::Decimal); }, "trailing junk");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("1.0", OddsFormat::Decimal); }, "decimal 1.0");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("0", OddsFormat::American); }, "american 0");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("1.5", OddsFormat::American); }, "american fraction");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("+", OddsFormat::American); }, "american sign only");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("5/0", OddsFormat::Fractional); }, "fractional /0");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("5", OddsFormat::Fractional); }, "fractional no slash");
    expectError(ErrorKind::InvalidOdds, [] { parseOdds("1/2/3", OddsFormat::Fractional); }, "two slashes");

    expectText(formatOdds(2.5, OddsFormat::Decimal), "2.500", "decimal display");
    expectText(formatOdds(2.5, OddsFormat::American), "+150", "american underdog display");
    expectText(formatOdds(2.0, OddsFormat::American), "+100", "american evens display");
    expectText(formatOdds(1.5, OddsFormat::American), "-200", "american favorite display");
    expectText(formatOdds(3.5, OddsFormat::Fractional), "5/2", "fractional display");
    expectText(formatOdds(1.5, OddsFormat::Fractional), "1/2", "fractional odds-on display");
    expectText(formatOdds(AmericanOdds{ -110 }), "-110", "format odds value");
    expectError(ErrorKind::InvalidOdds, [] { formatOdds(1.0, OddsFormat::Decimal); }, "format 1.0");
    expectText(formatOdds(2.5, OddsFormat::Decimal, 1), "2.5", "decimal display places");

    expectText(formatOdds(1e19, OddsFormat::Fractional), "10000000000000000000/1", "fractional 1e19");
    expectText(formatOdds(1e20, OddsFormat::Fractional), "100000000000000000000/1", "fractional 1e20");
    expectText(formatOdds(1e19, OddsFormat::American), "+1000000000000000000000", "american 1e19");
    expectText(formatOdds(1e19, OddsFormat::Decimal), "10000000000000000000.000", "decimal 1e19");
    std::string farOut = formatOdds(1e308, OddsFormat::American);
    if (farOut.size() < 3 || farOut.compare(0, 2, "+1") != 0 ||
        farOut.compare(farOut.size() - 2, 2, "00") != 0 || farOut.find_first_of("-in") != std::string::npos) {
        fail("american display beyond double range of b*100: " + farOut);
    }

    expectText(formatPercent(0.1234), "12.34%", "percent");
    expectText(formatPercent(0.5, 0), "50%", "percent no places");
    expectText(formatAmount(100.0), "100.00", "amount");

    if (parseOddsFormat(" American ") != OddsFormat::American ||
        parseOddsFormat("FRACTIONAL") != OddsFormat::Fractional ||
        parseOddsFormat("decimal") != OddsFormat::Decimal) {
        fail("odds format names");
    }
    expectText(toString(OddsFormat::Fractional), "fractional", "format name");
    expectError(ErrorKind::InvalidInput, [] { parseOddsFormat("moneyline"); }, "unknown format");

    expectNear(parseBankroll("1,000"), 1000.0, 0.0, "bankroll separators");
    expectNear(parseBankroll(" 0 "), 0.0, 0.0, "zero bankroll");
    expectError(ErrorKind::InvalidBankroll, [] { parseBankroll("-1"); }, "negative bankroll");
    expectError(ErrorKind::InvalidBankroll, [] { parseBankroll("lots"); }, "word bankroll");

    expectText(trim("  x y \n"), "x y", "trim");
    expectText(trim(" \t "), "", "trim blank");

    std::cout << "Odds text checks passed.\n";
    return 0;
}
