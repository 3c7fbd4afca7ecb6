#include <gtest/gtest.h>
#include <butterfly/network_graph.hpp>
#include "test_helpers.hpp"

using namespace butterfly;

class NetworkGraphTest : public ::testing::Test {};

TEST_F(NetworkGraphTest, ConnectRejectsSelfLoopsDuplicatesAndUnknowns) {
    auto graph = test_utils::create_test_graph(3, {});

    EXPECT_TRUE(graph.connect(0, 1));
    EXPECT_FALSE(graph.connect(1, 0));
    EXPECT_FALSE(graph.connect(2, 2));
    EXPECT_FALSE(graph.connect(0, 99));
    EXPECT_EQ(graph.connection_count(), 1u);
    EXPECT_TRUE(graph.connected(1, 0));
}

TEST_F(NetworkGraphTest, DegreesAndDisconnect) {
    auto graph = test_utils::create_test_graph(4, {{0, 1}, {0, 2}, {0, 3}});
    EXPECT_EQ(graph.degree(0), 3u);
    EXPECT_EQ(graph.max_degree(), 3u);

    EXPECT_TRUE(graph.disconnect(2, 0));
    EXPECT_FALSE(graph.disconnect(2, 0));
    EXPECT_EQ(graph.degree(0), 2u);
    EXPECT_EQ(graph.connection_count(), 2u);
}

TEST_F(NetworkGraphTest, ConnectionsAreSortedAndNormalised) {
    auto graph = test_utils::create_test_graph(4, {{3, 1}, {2, 0}, {1, 0}});
    auto conns = graph.connections();
    ASSERT_EQ(conns.size(), 3u);
    EXPECT_EQ(conns[0], Connection(0, 1));
    EXPECT_EQ(conns[1], Connection(0, 2));
    EXPECT_EQ(conns[2], Connection(1, 3));
}

TEST_F(NetworkGraphTest, BfsDistancesOnPath) {
    auto graph = test_utils::create_test_graph(5, {{0, 1}, {1, 2}, {2, 3}});
    auto dist = graph.distances_from(0);
    ASSERT_EQ(dist.size(), 5u);
    EXPECT_EQ(dist[0], 0);
    EXPECT_EQ(dist[1], 1);
    EXPECT_EQ(dist[3], 3);
    EXPECT_EQ(dist[4], -1);
}

TEST_F(NetworkGraphTest, ComponentsSplitIsolatedParts) {
    auto graph = test_utils::create_test_graph(6, {{0, 1}, {1, 2}, {3, 4}});
    auto comps = graph.components();
    ASSERT_EQ(comps.size(), 3u);
    EXPECT_EQ(comps[0], (std::vector<OrganismId>{0, 1, 2}));
    EXPECT_EQ(comps[1], (std::vector<OrganismId>{3, 4}));
    EXPECT_EQ(comps[2], (std::vector<OrganismId>{5}));
}
