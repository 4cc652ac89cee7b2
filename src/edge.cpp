#include "edgerunner/edge.hpp"

#include "edgerunner/probability.hpp"

namespace edgerunner {

EdgeMetrics computeEdge(double decimalOdds, double estimatedProbability) {
    double implied = impliedProbability(decimalOdds);
    requireProbability(estimatedProbability);

    double p = estimatedProbability;
    double q = 1.0 - p;
    return EdgeMetrics{ implied, p - implied, p * (decimalOdds - 1.0) - q };
}

EdgeSign classifyEdge(double edge) {
    return edge > 0.0 ? EdgeSign::Positive : EdgeSign::Negative;
}

} // namespace edgerunner
