#pragma once

#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace level_populator {

// Undirected weighted graph over dense node indices.
// Re-adding an existing edge replaces its weight.
class WeightedGraph {
public:
    struct Link {
        size_t node;
        double weight;
    };

    static constexpr double kUnreachable = std::numeric_limits<double>::infinity();

    size_t addNode();
    void addEdge(size_t a, size_t b, double weight);

    size_t nodeCount() const { return links_.size(); }
    size_t edgeCount() const { return edgeCount_; }

    const std::vector<Link>& neighbors(size_t node) const { return links_[node]; }
    size_t degree(size_t node) const { return links_[node].size(); }
    bool hasEdge(size_t a, size_t b) const;

    // Dijkstra from source; unreachable nodes get kUnreachable
    std::vector<double> shortestPaths(size_t source) const;

    // Every edge once, as (a, b, weight) with a < b, in insertion order of a
    std::vector<std::pair<std::pair<size_t, size_t>, double>> edges() const;

private:
    std::vector<std::vector<Link>> links_;
    size_t edgeCount_ = 0;
};

} // namespace level_populator
