// Tests for Room geometry, WeightedGraph and RoomGraph

#include <doctest/doctest.h>
#include "TestLevels.h"
#include "level_populator/RoomGraph.h"
#include "level_populator/WeightedGraph.h"
#include <cmath>

using namespace level_populator;

// ============================================================================
// Room Tests
// ============================================================================

TEST_SUITE("Room") {
    TEST_CASE("sizes and center") {
        Room room{2, 4, 5, 9, false};
        CHECK(room.sizeX() == 4);
        CHECK(room.sizeY() == 6);
        CHECK(room.center().x == doctest::Approx(3.5));
        CHECK(room.center().y == doctest::Approx(6.5));
    }

    TEST_CASE("containsTile is inclusive") {
        Room room{1, 1, 3, 3, false};
        CHECK(room.containsTile(1, 1));
        CHECK(room.containsTile(3, 3));
        CHECK_FALSE(room.containsTile(4, 3));
        CHECK_FALSE(room.containsTile(0, 2));
    }

    TEST_CASE("touching rectangles are adjacent") {
        Room a{0, 0, 3, 3, false};
        CHECK(a.isAdjacentTo(Room{4, 0, 6, 3, false}));   // shared side
        CHECK(a.isAdjacentTo(Room{4, 4, 6, 6, false}));   // shared corner
        CHECK(a.isAdjacentTo(Room{2, 2, 6, 6, false}));   // overlap
        CHECK_FALSE(a.isAdjacentTo(Room{5, 0, 6, 3, false}));
        CHECK_FALSE(a.isAdjacentTo(Room{0, 5, 3, 6, false}));
    }

    TEST_CASE("adjacency at the int limit") {
        Room edge{2147483640, 0, 2147483647, 3, false};
        CHECK(edge.isAdjacentTo(Room{2147483630, 0, 2147483639, 3, false}));
        CHECK_FALSE(edge.isAdjacentTo(Room{0, 0, 3, 3, false}));
        CHECK_FALSE(Room{0, 0, 3, 3, false}.isAdjacentTo(edge));
    }

    TEST_CASE("adjacency is symmetric") {
        Room a{0, 0, 3, 3, false};
        Room b{4, 2, 8, 4, true};
        CHECK(a.isAdjacentTo(b) == b.isAdjacentTo(a));
    }
}

// ============================================================================
// WeightedGraph Tests
// ============================================================================

TEST_SUITE("WeightedGraph") {
    TEST_CASE("edges are undirected") {
        WeightedGraph graph;
        graph.addNode();
        graph.addNode();
        graph.addEdge(0, 1, 2.5);

        CHECK(graph.edgeCount() == 1);
        CHECK(graph.hasEdge(0, 1));
        CHECK(graph.hasEdge(1, 0));
        CHECK(graph.degree(0) == 1);
        CHECK(graph.degree(1) == 1);
    }

    TEST_CASE("re-adding an edge replaces its weight") {
        WeightedGraph graph;
        graph.addNode();
        graph.addNode();
        graph.addEdge(0, 1, 2.5);
        graph.addEdge(1, 0, 4.0);

        CHECK(graph.edgeCount() == 1);
        CHECK(graph.neighbors(0)[0].weight == doctest::Approx(4.0));
        CHECK(graph.neighbors(1)[0].weight == doctest::Approx(4.0));
    }

    TEST_CASE("shortest paths take the cheaper detour") {
        WeightedGraph graph;
        for (int i = 0; i < 4; ++i) graph.addNode();
        graph.addEdge(0, 1, 10.0);
        graph.addEdge(0, 2, 1.0);
        graph.addEdge(2, 1, 2.0);

        auto dist = graph.shortestPaths(0);
        CHECK(dist[0] == doctest::Approx(0.0));
        CHECK(dist[1] == doctest::Approx(3.0));
        CHECK(dist[2] == doctest::Approx(1.0));
        CHECK(dist[3] == WeightedGraph::kUnreachable);
    }

    TEST_CASE("edges lists each edge once with the smaller index first") {
        WeightedGraph graph;
        for (int i = 0; i < 3; ++i) graph.addNode();
        graph.addEdge(2, 0, 1.0);
        graph.addEdge(1, 2, 2.0);

        auto edges = graph.edges();
        REQUIRE(edges.size() == 2);
        for (const auto& [endpoints, weight] : edges) {
            CHECK(endpoints.first < endpoints.second);
        }
    }
}

// ============================================================================
// RoomGraph Tests
// ============================================================================

TEST_SUITE("RoomGraph") {
    TEST_CASE("ring level links rooms through corridors") {
        RoomGraph roomGraph(test_levels::ringRooms());
        const WeightedGraph& graph = roomGraph.graph();

        CHECK(roomGraph.areaCount() == 8);
        CHECK(roomGraph.resourceCount() == 0);
        CHECK(graph.edgeCount() == 9);

        CHECK(graph.hasEdge(0, 4));
        CHECK(graph.hasEdge(0, 5));
        CHECK(graph.hasEdge(1, 5));
        CHECK(graph.hasEdge(1, 6));
        CHECK(graph.hasEdge(2, 4));
        CHECK(graph.hasEdge(2, 7));
        CHECK(graph.hasEdge(3, 6));
        CHECK(graph.hasEdge(3, 7));
        CHECK(graph.hasEdge(6, 7));  // corridors meet at a corner
        CHECK_FALSE(graph.hasEdge(4, 5));
        CHECK_FALSE(graph.hasEdge(0, 3));
    }

    TEST_CASE("edge weight is the distance between centers") {
        RoomGraph roomGraph(test_levels::ringRooms());
        for (const auto& link : roomGraph.graph().neighbors(0)) {
            if (link.node == 4) {
                CHECK(link.weight == doctest::Approx(std::sqrt(30.5)));
            }
        }
    }

    TEST_CASE("resource links to every containing area") {
        RoomGraph roomGraph(test_levels::ringRooms());
        size_t node = roomGraph.addResource(6, 3, 's');

        CHECK(node == 8);
        CHECK(roomGraph.resourceCount() == 1);
        CHECK(roomGraph.graph().degree(node) == 2);
        CHECK(roomGraph.graph().hasEdge(0, node));
        CHECK(roomGraph.graph().hasEdge(4, node));
        CHECK(isResource(roomGraph.node(node)));
        CHECK(nodePosition(roomGraph.node(node)).x == doctest::Approx(6.0));
    }

    TEST_CASE("resource outside every room stays isolated") {
        RoomGraph roomGraph(test_levels::ringRooms());
        size_t node = roomGraph.addResource(0, 0, 'a');
        CHECK(roomGraph.graph().degree(node) == 0);
    }

    TEST_CASE("fromPopulatedGrid adds a node per resource tile") {
        auto rooms = test_levels::ringRooms();
        auto grid = test_levels::carve(19, 19, rooms);
        grid.set(2, 2, 's');
        grid.set(14, 14, 'h');

        auto roomGraph = RoomGraph::fromPopulatedGrid(rooms, grid);
        CHECK(roomGraph.areaCount() == 8);
        CHECK(roomGraph.resourceCount() == 2);
        CHECK(roomGraph.graph().hasEdge(0, 8));
        CHECK(roomGraph.graph().hasEdge(3, 9));
    }
}
