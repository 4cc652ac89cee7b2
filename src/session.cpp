#include "edgerunner/session.hpp"

namespace edgerunner {

CalculatorState initialState(const BetInput& input) {
    CalculatorState state{ input, BetSide::OnEvent, tryEvaluate(input) };
    return state;
}

CalculatorState update(const CalculatorState& state, const BetInput& next) {
    CalculatorState updated{ next, state.side, tryEvaluate(next) };
    return updated;
}

CalculatorState updateSide(const CalculatorState& state, BetSide side) {
    if (side == state.side) {
        return state;
    }
    BetInput flipped = switchSide(state.input);
    CalculatorState updated{ flipped, side, tryEvaluate(flipped) };
    return updated;
}

} // namespace edgerunner
