#include "level_populator/WeightedGraph.h"
#include <functional>
#include <queue>

namespace level_populator {

size_t WeightedGraph::addNode() {
    links_.emplace_back();
    return links_.size() - 1;
}

void WeightedGraph::addEdge(size_t a, size_t b, double weight) {
    for (Link& link : links_[a]) {
        if (link.node == b) {
            link.weight = weight;
            for (Link& back : links_[b]) {
                if (back.node == a) back.weight = weight;
            }
            return;
        }
    }

    links_[a].push_back({b, weight});
    if (a != b) {
        links_[b].push_back({a, weight});
    }
    ++edgeCount_;
}

bool WeightedGraph::hasEdge(size_t a, size_t b) const {
    for (const Link& link : links_[a]) {
        if (link.node == b) return true;
    }
    return false;
}

std::vector<double> WeightedGraph::shortestPaths(size_t source) const {
    std::vector<double> dist(links_.size(), kUnreachable);
    using Entry = std::pair<double, size_t>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;

    dist[source] = 0.0;
    open.push({0.0, source});

    while (!open.empty()) {
        auto [d, current] = open.top();
        open.pop();
        if (d > dist[current]) continue;  // Stale entry

        for (const Link& link : links_[current]) {
            double candidate = d + link.weight;
            if (candidate < dist[link.node]) {
                dist[link.node] = candidate;
                open.push({candidate, link.node});
            }
        }
    }

    return dist;
}

std::vector<std::pair<std::pair<size_t, size_t>, double>> WeightedGraph::edges() const {
    std::vector<std::pair<std::pair<size_t, size_t>, double>> result;
    result.reserve(edgeCount_);
    for (size_t a = 0; a < links_.size(); ++a) {
        for (const Link& link : links_[a]) {
            if (a <= link.node) {
                result.push_back({{a, link.node}, link.weight});
            }
        }
    }
    return result;
}

} // namespace level_populator
