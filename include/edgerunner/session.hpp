#pragma once

#include "edgerunner/evaluator.hpp"

namespace edgerunner {

// Snapshot held by a presentation layer: the current input and the result
// computed from exactly that input.
struct CalculatorState {
    BetInput input;
    BetSide side = BetSide::OnEvent;
    EvaluationResult result;
};

CalculatorState initialState(const BetInput& input);

CalculatorState update(const CalculatorState& state, const BetInput& next);

// Throws KellyError when the current odds or probability cannot be mirrored.
CalculatorState updateSide(const CalculatorState& state, BetSide side);

} // namespace edgerunner
