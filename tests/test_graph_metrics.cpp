// Tests for weighted diameter, normalized degree and interval fitness

#include <doctest/doctest.h>
#include "TestLevels.h"
#include "level_populator/GraphMetrics.h"
#include "level_populator/RoomGraph.h"

using namespace level_populator;

namespace {

WeightedGraph makePath(const std::vector<double>& weights) {
    WeightedGraph graph;
    graph.addNode();
    for (size_t i = 0; i < weights.size(); ++i) {
        graph.addNode();
        graph.addEdge(i, i + 1, weights[i]);
    }
    return graph;
}

} // namespace

// ============================================================================
// weightedDiameter Tests
// ============================================================================

TEST_SUITE("weightedDiameter") {
    TEST_CASE("path graph diameter is the total length") {
        CHECK(weightedDiameter(makePath({1.0, 2.0, 4.0})) == doctest::Approx(7.0));
    }

    TEST_CASE("single node and empty graph have zero diameter") {
        CHECK(weightedDiameter(WeightedGraph{}) == 0.0);
        CHECK(weightedDiameter(makePath({})) == 0.0);
    }

    TEST_CASE("unreachable pairs are ignored") {
        WeightedGraph graph = makePath({1.0, 2.0});
        graph.addNode();
        CHECK(weightedDiameter(graph) == doctest::Approx(3.0));
    }

    TEST_CASE("extending the longest path never shrinks the diameter") {
        WeightedGraph graph = makePath({1.0, 2.0});
        double before = weightedDiameter(graph);
        size_t tail = graph.addNode();
        graph.addEdge(2, tail, 0.5);
        CHECK(weightedDiameter(graph) >= before);
    }

    TEST_CASE("shortcut edge shortens the diameter") {
        WeightedGraph graph = makePath({3.0, 3.0, 3.0});
        graph.addEdge(0, 3, 1.0);
        CHECK(weightedDiameter(graph) == doctest::Approx(4.0));
    }
}

// ============================================================================
// normalizedDegree Tests
// ============================================================================

TEST_SUITE("normalizedDegree") {
    TEST_CASE("degree is divided by max plus min degree") {
        // Star: center degree 3, leaves degree 1
        WeightedGraph graph;
        for (int i = 0; i < 4; ++i) graph.addNode();
        graph.addEdge(0, 1, 1.0);
        graph.addEdge(0, 2, 1.0);
        graph.addEdge(0, 3, 1.0);

        auto degree = normalizedDegree(graph);
        CHECK(degree[0] == doctest::Approx(0.75));
        CHECK(degree[1] == doctest::Approx(0.25));
    }

    TEST_CASE("ring level rooms and corridors") {
        RoomGraph roomGraph(test_levels::ringRooms());
        auto degree = normalizedDegree(roomGraph.graph());
        REQUIRE(degree.size() == 8);
        for (size_t i = 0; i < 6; ++i) CHECK(degree[i] == doctest::Approx(0.4));
        CHECK(degree[6] == doctest::Approx(0.6));
        CHECK(degree[7] == doctest::Approx(0.6));
    }

    TEST_CASE("graph without edges is all zero") {
        WeightedGraph graph;
        graph.addNode();
        graph.addNode();
        auto degree = normalizedDegree(graph);
        CHECK(degree[0] == 0.0);
        CHECK(degree[1] == 0.0);
    }
}

// ============================================================================
// intervalFit Tests
// ============================================================================

TEST_SUITE("intervalFit") {
    TEST_CASE("interval distance uses absolute values") {
        CHECK(intervalDistance(0.1, 0.3, 0.2) == doctest::Approx(0.2));
        CHECK(intervalDistance(0.1, 0.3, -0.2) == doctest::Approx(0.2));
        CHECK(intervalDistance(0.1, 0.3, 0.5) == doctest::Approx(0.6));
    }

    TEST_CASE("values inside the interval score best") {
        auto fit = intervalFit({0.1, 0.2, 0.5}, 0.1, 0.3);
        CHECK(fit[0] == doctest::Approx(1.0));
        CHECK(fit[1] == doctest::Approx(1.0));
        CHECK(fit[2] == doctest::Approx(0.0));
    }

    TEST_CASE("fit is rescaled between 0 and 1") {
        auto fit = intervalFit({0.0, 0.4, 0.6, 0.9}, 0.8, 0.9);
        for (double f : fit) {
            CHECK(f >= 0.0);
            CHECK(f <= 1.0);
        }
        CHECK(fit[3] == doctest::Approx(1.0));
        CHECK(fit[0] == doctest::Approx(0.0));
        CHECK(fit[2] > fit[1]);
    }

    TEST_CASE("equal distances all score 1") {
        auto fit = intervalFit({0.4, 0.4, 0.4}, 0.1, 0.3);
        CHECK(fit == std::vector<double>{1.0, 1.0, 1.0});
        CHECK(intervalFit({}, 0.1, 0.3).empty());
    }
}
