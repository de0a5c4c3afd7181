#include "level_populator/GraphMetrics.h"
#include <algorithm>
#include <cmath>

namespace level_populator {

double weightedDiameter(const WeightedGraph& graph) {
    double diameter = 0.0;
    for (size_t source = 0; source < graph.nodeCount(); ++source) {
        for (double d : graph.shortestPaths(source)) {
            if (std::isfinite(d) && d > diameter) {
                diameter = d;
            }
        }
    }
    return diameter;
}

std::vector<double> normalizedDegree(const WeightedGraph& graph) {
    std::vector<double> result(graph.nodeCount(), 0.0);
    if (graph.nodeCount() == 0) return result;

    size_t minDegree = graph.degree(0);
    size_t maxDegree = graph.degree(0);
    for (size_t i = 1; i < graph.nodeCount(); ++i) {
        minDegree = std::min(minDegree, graph.degree(i));
        maxDegree = std::max(maxDegree, graph.degree(i));
    }

    // Sum, not range
    const size_t denominator = maxDegree + minDegree;
    if (denominator == 0) return result;

    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        result[i] = static_cast<double>(graph.degree(i)) / static_cast<double>(denominator);
    }
    return result;
}

std::vector<double> intervalFit(const std::vector<double>& values, double lo, double hi) {
    std::vector<double> fit(values.size(), 1.0);
    if (values.empty()) return fit;

    std::vector<double> distance(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        distance[i] = intervalDistance(lo, hi, values[i]);
    }

    const auto [minIt, maxIt] = std::minmax_element(distance.begin(), distance.end());
    const double minDistance = *minIt;
    const double range = *maxIt - minDistance;
    if (range == 0.0) return fit;

    for (size_t i = 0; i < values.size(); ++i) {
        fit[i] = 1.0 - (distance[i] - minDistance) / range;
    }
    return fit;
}

} // namespace level_populator
