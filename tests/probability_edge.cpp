#include "edgerunner/edge.hpp"
#include "edgerunner/errors.hpp"
#include "edgerunner/probability.hpp"

#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "probability_edge_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectNear(double actual, double expected, double tolerance, const std::string& what) {
    if (std::abs(actual - expected) > tolerance) {
        fail(what + ": expected " + std::to_string(expected) + " got " + std::to_string(actual));
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

    expectNear(impliedProbability(2.0), 0.5, 0.0, "implied at evens");
    expectNear(impliedProbability(4.0), 0.25, 0.0, "implied at 4.0");

    double previous = 1.0;
    for (double d = 1.0001; d < 1000.0; d *= 1.07) {
        double implied = impliedProbability(d);
        if (!(implied > 0.0 && implied < 1.0)) {
            fail("implied probability out of (0, 1) at " + std::to_string(d));
        }
        if (!(implied < previous)) {
            fail("implied probability not strictly decreasing at " + std::to_string(d));
        }
        previous = implied;
    }

    expectError(ErrorKind::InvalidOdds, [] { impliedProbability(1.0); }, "implied at 1.0");
    expectError(ErrorKind::InvalidOdds, [] { impliedProbability(0.0); }, "implied at 0");
    expectError(ErrorKind::InvalidOdds, [] { impliedProbability(INFINITY); }, "implied at infinity");

    expectNear(complementDecimalOdds(2.0), 2.0, 1e-12, "complement of evens");
    expectNear(complementDecimalOdds(1.5), 3.0, 1e-12, "complement of 1.5");
    expectNear(complementDecimalOdds(complementDecimalOdds(2.75)), 2.75, 1e-12, "complement involution");
    expectError(ErrorKind::InvalidOdds, [] { complementDecimalOdds(1.0); }, "complement of 1.0");

    expectNear(oddsFromMarketProbability(0.6, BetSide::OnEvent), 1.0 / 0.6, 1e-12, "market yes side");
    expectNear(oddsFromMarketProbability(0.6, BetSide::OnOpposite), 1.0 / 0.4, 1e-12, "market no side");
    expectError(ErrorKind::InvalidProbability, [] { oddsFromMarketProbability(1.0, BetSide::OnEvent); },
                "market certainty");
    expectError(ErrorKind::InvalidProbability, [] { oddsFromMarketProbability(0.0, BetSide::OnEvent); },
                "market impossibility");
    expectError(ErrorKind::InvalidProbability, [] { oddsFromMarketProbability(1.2, BetSide::OnOpposite); },
                "market above one");

    if (fairDecimalOdds(0.0).has_value()) {
        fail("fair odds at p=0 should be empty");
    }
    expectNear(*fairDecimalOdds(0.25), 4.0, 0.0, "fair odds at 0.25");
    if (fairDecimalOdds(1e-310).has_value()) {
        fail("fair odds beyond the double range should be empty");
    }

    auto metrics = computeEdge(2.0, 0.6);
    expectNear(metrics.impliedProbability, 0.5, 0.0, "edge implied");
    expectNear(metrics.edge, 0.6 - 0.5, 0.0, "edge value");
    expectNear(metrics.evPerUnitStake, 0.2, 1e-12, "ev at 2.0 / 0.6");

    for (double d : { 1.25, 1.9, 2.0, 3.3, 12.0 }) {
        for (double p : { 0.0, 0.1, 0.45, 0.5, 0.77, 1.0 }) {
            auto m = computeEdge(d, p);
            if (m.edge != p - impliedProbability(d)) {
                fail("edge must equal p - implied exactly");
            }
            // EV per unit stake is d * edge.
            expectNear(m.evPerUnitStake, d * m.edge, 1e-12, "ev identity");
        }
    }

    auto negative = computeEdge(1.5, 0.5);
    if (classifyEdge(negative.edge) != EdgeSign::Negative || negative.evPerUnitStake >= 0.0) {
        fail("1.5 at p=0.5 should have a negative edge");
    }
    if (classifyEdge(computeEdge(3.0, 0.5).edge) != EdgeSign::Positive) {
        fail("3.0 at p=0.5 should have a positive edge");
    }
    if (classifyEdge(0.0) != EdgeSign::Negative) {
        fail("zero edge is not positive");
    }

    expectError(ErrorKind::InvalidProbability, [] { computeEdge(2.0, -0.01); }, "negative probability");
    expectError(ErrorKind::InvalidProbability, [] { computeEdge(2.0, 1.01); }, "probability above one");
    expectError(ErrorKind::InvalidProbability, [] { computeEdge(2.0, std::nan("")); }, "NaN probability");
    expectError(ErrorKind::InvalidOdds, [] { computeEdge(1.0, 0.5); }, "edge at odds 1.0");

    std::cout << "Probability and edge checks passed.\n";
    return 0;
}
