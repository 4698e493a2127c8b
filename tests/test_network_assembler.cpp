#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

#include "core/NetworkAssembler.hpp"

using namespace BgcNet;

static ClusterProfile profile_of(const std::string& id, const std::vector<std::string>& families) {
    ClusterProfile profile;
    profile.cluster_id = id;
    for (size_t i = 0; i < families.size(); ++i) {
        profile.domains.push_back(families[i]);
        profile.instances[families[i]].push_back(families[i] + "_" + id + "_" + std::to_string(i));
    }
    return profile;
}

static NetworkEdge edge_with(const std::string& a, const std::string& b, double distance) {
    NetworkEdge e;
    e.cluster_a = a;
    e.cluster_b = b;
    e.distance = distance;
    e.log_score = NetworkAssembler::log_score(distance);
    e.squared_similarity = (1.0 - distance) * (1.0 - distance);
    return e;
}

// ============================================================================
// Scores, ranking and filtering
// ============================================================================

TEST(NetworkAssemblerTest, LogScore) {
    double identical = NetworkAssembler::log_score(0.0);
    EXPECT_EQ(identical, 0.0);
    EXPECT_FALSE(std::signbit(identical));

    EXPECT_TRUE(std::isinf(NetworkAssembler::log_score(1.0)));
    EXPECT_GT(NetworkAssembler::log_score(1.0), 0.0);
    EXPECT_DOUBLE_EQ(NetworkAssembler::log_score(0.5), 1.0);
    EXPECT_DOUBLE_EQ(NetworkAssembler::log_score(0.75), 2.0);
}

TEST(NetworkAssemblerTest, PairCountDoesNotOverflowInt) {
    EXPECT_EQ(NetworkAssembler::pair_count(0), 0u);
    EXPECT_EQ(NetworkAssembler::pair_count(1), 0u);
    EXPECT_EQ(NetworkAssembler::pair_count(4), 6u);

    std::size_t large = NetworkAssembler::pair_count(70000);
    EXPECT_EQ(large, 2449965000u);
    EXPECT_GT(large, static_cast<std::size_t>(std::numeric_limits<int>::max()));
}

TEST(NetworkAssemblerTest, SortIsStableWithInfiniteScoresLast) {
    std::vector<NetworkEdge> edges = {
        edge_with("a", "b", 1.0),
        edge_with("a", "c", 0.5),
        edge_with("a", "d", 1.0),
        edge_with("b", "c", 0.1),
        edge_with("b", "d", 0.5),
    };

    NetworkAssembler::sort_edges(edges);

    ASSERT_EQ(edges.size(), 5u);
    EXPECT_EQ(edges[0].cluster_a + edges[0].cluster_b, "bc");
    EXPECT_EQ(edges[1].cluster_a + edges[1].cluster_b, "ac");
    EXPECT_EQ(edges[2].cluster_a + edges[2].cluster_b, "bd");
    EXPECT_EQ(edges[3].cluster_a + edges[3].cluster_b, "ab");
    EXPECT_EQ(edges[4].cluster_a + edges[4].cluster_b, "ad");
}

TEST(NetworkAssemblerTest, FilterKeepsStrictlyAboveCutoff) {
    std::vector<NetworkEdge> edges = {
        edge_with("a", "b", 0.2),  // 0.64
        edge_with("a", "c", 0.5),  // 0.25
        edge_with("b", "c", 0.9),  // 0.01
    };

    std::vector<NetworkEdge> kept = NetworkAssembler::filter_edges(edges, 0.3);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].cluster_b, "b");

    EXPECT_EQ(NetworkAssembler::filter_edges(edges, 0.25).size(), 1u);
    EXPECT_EQ(NetworkAssembler::filter_edges(edges, 0.0).size(), 3u);
    EXPECT_TRUE(NetworkAssembler::filter_edges(edges, 1.0).empty());
}

TEST(NetworkAssemblerTest, FilterRetainsTableOrder) {
    std::vector<NetworkEdge> edges(3);
    const double squared[] = {0.9, 0.6, 0.2};
    for (int i = 0; i < 3; ++i) {
        edges[i].cluster_a = "x" + std::to_string(i);
        edges[i].squared_similarity = squared[i];
    }

    std::vector<NetworkEdge> kept = NetworkAssembler::filter_edges(edges, 0.5);
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].cluster_a, "x0");
    EXPECT_EQ(kept[1].cluster_a, "x1");
}

TEST(NetworkAssemblerTest, ZeroCutoffExcludesUnrelatedPairs) {
    std::vector<NetworkEdge> edges = {edge_with("a", "b", 1.0), edge_with("a", "c", 0.999)};
    std::vector<NetworkEdge> kept = NetworkAssembler::filter_edges(edges, 0.0);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].cluster_b, "c");
}

// ============================================================================
// Assembly
// ============================================================================

class AssembleTest : public ::testing::Test {
protected:
    void SetUp() override {
        profiles["c1"] = profile_of("c1", {"PF1", "PF2"});
        profiles["c2"] = profile_of("c2", {"PF1", "PF2"});
        profiles["c3"] = profile_of("c3", {});
        profiles["c4"] = profile_of("c4", {"PF3", "PF1", "PF4", "PF2", "PF5", "PF6"});
        groups["c1"] = "NRPS";
        groups["c2"] = "PKS";
    }

    std::map<std::string, ClusterProfile> profiles;
    GroupMap groups;
    DistanceConfig config;
};

TEST_F(AssembleTest, RanksPairsAndFillsMatrix) {
    DistanceCalculator calculator(config);
    NetworkAssembler assembler(calculator);

    ClusterNetwork network = assembler.assemble("sampleA", {"c1", "c2", "c3"}, profiles, groups);

    EXPECT_EQ(network.name, "sampleA");
    EXPECT_EQ(network.size(), 3);
    EXPECT_EQ(network.num_empty_pairs, 2);
    ASSERT_EQ(network.edges.size(), 3u);

    const NetworkEdge& best = network.edges[0];
    EXPECT_EQ(best.cluster_a, "c1");
    EXPECT_EQ(best.cluster_b, "c2");
    EXPECT_EQ(best.group_a, "NRPS");
    EXPECT_EQ(best.group_b, "PKS");
    EXPECT_NEAR(best.distance, 0.2, 1e-12);
    EXPECT_NEAR(best.log_score, 0.321928, 1e-6);
    EXPECT_NEAR(best.squared_similarity, 0.64, 1e-12);

    // Ties at +inf keep pair order
    EXPECT_EQ(network.edges[1].cluster_a, "c1");
    EXPECT_EQ(network.edges[1].cluster_b, "c3");
    EXPECT_EQ(network.edges[1].group_b, "NA");
    EXPECT_TRUE(std::isinf(network.edges[1].log_score));
    EXPECT_EQ(network.edges[2].cluster_a, "c2");
    EXPECT_EQ(network.edges[2].cluster_b, "c3");

    ASSERT_EQ(network.dist_matrix.rows(), 3);
    for (int i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(network.dist_matrix(i, i), 0.0);
        for (int j = 0; j < 3; ++j) {
            EXPECT_DOUBLE_EQ(network.dist_matrix(i, j), network.dist_matrix(j, i));
        }
    }
    EXPECT_NEAR(network.dist_matrix(0, 1), 0.2, 1e-12);
    EXPECT_DOUBLE_EQ(network.dist_matrix(2, 0), 1.0);

    EXPECT_EQ(network.filter(0.5).size(), 1u);
}

TEST_F(AssembleTest, UnknownClusterThrows) {
    DistanceCalculator calculator(config);
    NetworkAssembler assembler(calculator);
    EXPECT_THROW(assembler.assemble("x", {"c1", "missing"}, profiles, groups), std::out_of_range);
}

TEST_F(AssembleTest, FewerThanTwoClustersGiveNoEdges) {
    DistanceCalculator calculator(config);
    NetworkAssembler assembler(calculator);

    ClusterNetwork single = assembler.assemble("x", {"c1"}, profiles, groups);
    EXPECT_TRUE(single.edges.empty());
    EXPECT_EQ(single.dist_matrix.rows(), 1);

    ClusterNetwork none = assembler.assemble("x", {}, profiles, groups);
    EXPECT_TRUE(none.empty());
}

TEST_F(AssembleTest, ThreadCountDoesNotChangeResult) {
    for (int k = 0; k < 12; ++k) {
        std::string id = "g" + std::to_string(k);
        std::vector<std::string> families;
        for (int f = 0; f < 3 + k % 5; ++f) {
            families.push_back("PF" + std::to_string((f * (k + 1)) % 7));
        }
        profiles[id] = profile_of(id, families);
    }
    std::vector<std::string> ids;
    for (const auto& kv : profiles) {
        ids.push_back(kv.first);
    }

    DistanceCalculator calculator(config);
    ClusterNetwork serial = NetworkAssembler(calculator, 1).assemble("all_vs_all", ids, profiles, groups);
    ClusterNetwork parallel = NetworkAssembler(calculator, 4).assemble("all_vs_all", ids, profiles, groups);

    ASSERT_EQ(serial.edges.size(), parallel.edges.size());
    for (size_t e = 0; e < serial.edges.size(); ++e) {
        EXPECT_EQ(serial.edges[e].cluster_a, parallel.edges[e].cluster_a);
        EXPECT_EQ(serial.edges[e].cluster_b, parallel.edges[e].cluster_b);
        EXPECT_EQ(serial.edges[e].distance, parallel.edges[e].distance);
    }
    EXPECT_TRUE(serial.dist_matrix == parallel.dist_matrix);
    EXPECT_EQ(serial.num_empty_pairs, parallel.num_empty_pairs);
}
