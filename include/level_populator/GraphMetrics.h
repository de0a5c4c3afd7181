#pragma once

#include "WeightedGraph.h"
#include <cmath>
#include <vector>

namespace level_populator {

// Longest finite weighted shortest path over all node pairs.
// Unreachable pairs are ignored, so disconnected graphs are underestimated.
double weightedDiameter(const WeightedGraph& graph);

// degree / (maxDegree + minDegree) per node; all zero when every degree is 0
std::vector<double> normalizedDegree(const WeightedGraph& graph);

// ||lo| - |v|| + ||hi| - |v||, smaller is better
inline double intervalDistance(double lo, double hi, double value) {
    return std::abs(std::abs(lo) - std::abs(value)) + std::abs(std::abs(hi) - std::abs(value));
}

// Rescaled interval distance: best fitting value -> 1, worst -> 0.
// When every distance is equal all values score 1.
std::vector<double> intervalFit(const std::vector<double>& values, double lo, double hi);

} // namespace level_populator
