#pragma once

namespace edgerunner {

struct EdgeMetrics {
    double impliedProbability;
    double edge;
    double evPerUnitStake;
};

enum class EdgeSign { Negative, Positive };

EdgeMetrics computeEdge(double decimalOdds, double estimatedProbability);

EdgeSign classifyEdge(double edge);

} // namespace edgerunner
