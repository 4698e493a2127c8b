/**
 * @file test_cluster_processor.cpp
 * @brief End-to-end tests of ClusterProcessor on a small input tree
 *
 * Layout:
 *   input/sampleA/c1_domtable.txt   PF00001 PF00002
 *   input/sampleA/c2_domtable.txt   PF00001 PF00002
 *   input/sampleB/c3_domtable.txt   PF00003
 *   input/sampleB/c4_domtable.txt   malformed
 */

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "core/ClusterProcessor.hpp"
#include "io/ClusterWriter.hpp"
#include "test_utils.hpp"

using namespace BgcNet;
using BgcNet::Testing::TempDir;
using BgcNet::Testing::domtable_line;
using BgcNet::Testing::make_hit;

namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

class ClusterProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string two_domains = domtable_line("Condensation", "PF00001.5", "cds1", 50.0, 0, 100) +
                                  domtable_line("AMP-binding", "PF00002.2", "cds1", 40.0, 200, 300) +
                                  // overlaps the first hit by 90%, weaker
                                  domtable_line("Weak", "PF00009.1", "cds1", 5.0, 10, 100);
        tmp_.write("input/sampleA/c1_domtable.txt", "# hmmscan\n" + two_domains);
        tmp_.write("input/sampleA/c2_domtable.txt", two_domains);
        tmp_.write("input/sampleB/c3_domtable.txt", domtable_line("Thioesterase", "PF00003.1", "cds7", 80.0, 5, 90));
        tmp_.write("input/sampleB/c4_domtable.txt", "this line has far too few columns\n");
        tmp_.write("groups.tsv", "c1\tNRPS\nbroken line without tab\nc2\tPKS\textra\n");
        fs::create_directories(tmp_.path() / "alignments");

        config_.input_dir = tmp_.file("input");
        config_.output_dir = tmp_.file("output");
        config_.groups_path = tmp_.file("groups.tsv");
        config_.alignment_dir = tmp_.file("alignments");
        config_.sim_cutoffs = {"0", "0.5"};
        config_.threads = 2;
    }

    std::string output(const std::string& name) const { return tmp_.file("output/" + name); }

    TempDir tmp_;
    Config config_;
};

TEST_F(ClusterProcessorTest, DiscoversClustersBySample) {
    ClusterProcessor processor(config_);
    EXPECT_EQ(processor.discover_clusters(), 4);

    const auto& clusters = processor.clusters();
    ASSERT_EQ(clusters.size(), 4u);
    EXPECT_EQ(clusters[0].cluster_id, "c1");
    EXPECT_EQ(clusters[0].sample, "sampleA");
    EXPECT_EQ(clusters[3].cluster_id, "c4");
    EXPECT_EQ(clusters[3].sample, "sampleB");

    ASSERT_EQ(processor.samples().size(), 2u);
    std::vector<std::string> sample_a = {"c1", "c2"};
    EXPECT_EQ(processor.samples().at("sampleA"), sample_a);
}

TEST_F(ClusterProcessorTest, DuplicateClusterIdIsKeptOnce) {
    tmp_.write("input/sampleC/c1_domtable.txt", domtable_line("X", "PF00005.1", "cds1", 1.0, 0, 10));
    ClusterProcessor processor(config_);
    EXPECT_EQ(processor.discover_clusters(), 4);
    EXPECT_EQ(processor.samples().count("sampleC"), 0u);
}

TEST_F(ClusterProcessorTest, EquallyNamedDirectoriesAreSeparateSamples) {
    TempDir tmp;
    std::string two_domains = domtable_line("Condensation", "PF00001.5", "cds1", 50.0, 0, 100) +
                              domtable_line("AMP-binding", "PF00002.2", "cds1", 40.0, 200, 300);
    tmp.write("input/runA/s/c1_domtable.txt", two_domains);
    tmp.write("input/runB/s/c2_domtable.txt", two_domains);
    config_.input_dir = tmp.file("input");
    config_.output_dir = tmp.file("output");

    ClusterProcessor processor(config_);
    EXPECT_EQ(processor.discover_clusters(), 2);
    ASSERT_EQ(processor.samples().size(), 2u);
    EXPECT_EQ(processor.samples().count("runA_s"), 1u);
    EXPECT_EQ(processor.samples().count("runB_s"), 1u);

    processor.process_all_clusters();
    std::vector<NetworkResult> networks = processor.build_networks();

    // Neither sample has two clusters; only the combined network is built
    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0].name, ClusterProcessor::kAllVsAll);
    EXPECT_EQ(networks[0].num_clusters, 2);
}

TEST_F(ClusterProcessorTest, UnstatableEntryIsSkipped) {
    fs::create_symlink("loop_domtable.txt", tmp_.path() / "input/sampleA/loop_domtable.txt");

    ClusterProcessor processor(config_);
    EXPECT_EQ(processor.discover_clusters(), 4);
    EXPECT_EQ(processor.samples().at("sampleA").size(), 2u);
}

TEST_F(ClusterProcessorTest, ProcessesClustersAndWritesProfiles) {
    ClusterProcessor processor(config_);
    processor.discover_clusters();
    std::vector<ClusterResult> results = processor.process_all_clusters();

    ASSERT_EQ(results.size(), 4u);
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ(results[0].num_hits, 3);
    EXPECT_EQ(results[0].num_removed, 1);
    EXPECT_EQ(results[0].num_domains, 2);
    EXPECT_FALSE(results[3].success);
    EXPECT_NE(results[3].error_message.find("line 1"), std::string::npos);

    EXPECT_EQ(processor.profiles().size(), 3u);
    EXPECT_EQ(processor.profiles().count("c4"), 0u);

    std::vector<std::string> pfs = read_lines(output("c1.pfs"));
    ASSERT_EQ(pfs.size(), 1u);
    EXPECT_EQ(pfs[0], "PF00001 PF00002");

    std::vector<std::string> pfd = read_lines(output("c1.pfd"));
    ASSERT_EQ(pfd.size(), 2u);
    EXPECT_EQ(pfd[0].substr(0, 6), "c1\t50\t");
    EXPECT_NE(pfd[1].find("\tPF00002.2\tAMP-binding\tcds1"), std::string::npos);

    EXPECT_FALSE(fs::exists(output("c4.pfd")));
}

TEST_F(ClusterProcessorTest, FailFastStopsOnMalformedCluster) {
    config_.fail_fast = true;
    ClusterProcessor processor(config_);
    processor.discover_clusters();
    EXPECT_THROW(processor.process_all_clusters(), std::runtime_error);
}

TEST_F(ClusterProcessorTest, BuildsSampleAndAllVsAllNetworks) {
    ClusterProcessor processor(config_);
    processor.discover_clusters();
    EXPECT_EQ(processor.load_groups(), 2);
    processor.process_all_clusters();

    std::vector<NetworkResult> networks = processor.build_networks();

    // sampleB has a single usable cluster
    ASSERT_EQ(networks.size(), 2u);
    EXPECT_EQ(networks[0].name, "sampleA");
    EXPECT_EQ(networks[0].num_pairs, 1);
    EXPECT_EQ(networks[1].name, ClusterProcessor::kAllVsAll);
    EXPECT_EQ(networks[1].num_clusters, 3);
    EXPECT_EQ(networks[1].num_pairs, 3);
    std::vector<size_t> rows = {3, 1};
    EXPECT_EQ(networks[1].rows_per_cutoff, rows);

    std::vector<std::string> sample_a = read_lines(output("networkfile_domain_dist_sampleA_c0.network"));
    ASSERT_EQ(sample_a.size(), 1u);
    EXPECT_EQ(sample_a[0], "c1\tc2\tNRPS\tPKS\t0.321928\t0.200000\t0.640000");

    std::vector<std::string> all = read_lines(output("networkfile_domain_dist_all_vs_all_c0.network"));
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].substr(0, 6), "c1\tc2\t");
    EXPECT_NE(all[1].find("\tNA\t"), std::string::npos);

    EXPECT_EQ(read_lines(output("networkfile_domain_dist_all_vs_all_c0.5.network")).size(), 1u);
    EXPECT_FALSE(fs::exists(output("networkfile_domain_dist_sampleB_c0.network")));

    std::vector<std::string> matrix = read_lines(output("distances_domain_dist_all_vs_all.csv"));
    ASSERT_EQ(matrix.size(), 4u);
    EXPECT_EQ(matrix[0], "cluster_id,c1,c2,c3");
    EXPECT_EQ(matrix[1].substr(0, 21), "c1,0.000000,0.200000,");
}

TEST_F(ClusterProcessorTest, DistanceMatrixCanBeDisabled) {
    config_.output_distance_matrix = false;
    ClusterProcessor processor(config_);
    processor.discover_clusters();
    processor.process_all_clusters();
    processor.build_networks();

    EXPECT_TRUE(fs::exists(output("networkfile_domain_dist_sampleA_c0.network")));
    EXPECT_FALSE(fs::exists(output("distances_domain_dist_sampleA.csv")));
}

TEST_F(ClusterProcessorTest, SeqdistUsesDistoutFiles) {
    tmp_.write("alignments/PF00001.fasta.hat2",
               " 1\n 2\n 1\n 1. =PF00001_c1_cds1_0_100\n 2. =PF00001_c2_cds1_0_100\n0.2\n");
    // PF00002 has no distance file; PF00003 has a single instance and needs none
    config_.distance_modes = {DistanceMode::SEQDIST};

    ClusterProcessor processor(config_);
    processor.discover_clusters();
    processor.process_all_clusters();
    EXPECT_EQ(processor.load_domain_distances(), 1);

    const DomainDistanceMatrix& dms = processor.domain_distances();
    EXPECT_DOUBLE_EQ(dms.lookup("PF00001", "PF00001_c2_cds1_0_100", "PF00001_c1_cds1_0_100"), 0.2);
    EXPECT_FALSE(dms.has_family("PF00002"));

    DistanceCalculator calculator(config_.distance_config(DistanceMode::SEQDIST), &dms);
    ClusterPairDistance d = calculator.compute(processor.profiles().at("c1"), processor.profiles().at("c2"));
    EXPECT_NEAR(d.dds_sum, 1.1, 1e-12);
    EXPECT_NEAR(d.distance, 1.0 - 0.36 - 0.64 * std::exp(-0.55), 1e-12);

    std::vector<NetworkResult> networks = processor.build_networks();
    ASSERT_EQ(networks.size(), 2u);
    EXPECT_EQ(networks[0].mode, DistanceMode::SEQDIST);
    EXPECT_TRUE(fs::exists(output("networkfile_seqdist_sampleA_c0.network")));
}

TEST_F(ClusterProcessorTest, MalformedDistanceFileIsSkippedOrFatal) {
    tmp_.write("alignments/PF00001.fasta.hat2", " 1\n 2\n 1\n 1. =a\n 2. =b\n");
    config_.distance_modes = {DistanceMode::SEQDIST};

    ClusterProcessor processor(config_);
    processor.discover_clusters();
    processor.process_all_clusters();
    EXPECT_EQ(processor.load_domain_distances(), 0);

    // Only sampleA, so cluster processing itself succeeds under fail_fast
    Config strict = config_;
    strict.input_dir = tmp_.file("input/sampleA");
    strict.fail_fast = true;

    ClusterProcessor fatal(strict);
    fatal.discover_clusters();
    fatal.process_all_clusters();
    EXPECT_THROW(fatal.load_domain_distances(), std::runtime_error);
}

TEST_F(ClusterProcessorTest, UnstatableDistanceFileIsSkippedOrFatal) {
    // Self-referencing link: stat fails with ELOOP
    fs::create_symlink("PF00001.fasta.hat2", tmp_.path() / "alignments/PF00001.fasta.hat2");
    config_.distance_modes = {DistanceMode::SEQDIST};

    ClusterProcessor processor(config_);
    processor.discover_clusters();
    processor.process_all_clusters();
    EXPECT_EQ(processor.load_domain_distances(), 0);
    EXPECT_FALSE(processor.domain_distances().has_family("PF00001"));

    Config strict = config_;
    strict.input_dir = tmp_.file("input/sampleA");
    strict.fail_fast = true;

    ClusterProcessor fatal(strict);
    fatal.discover_clusters();
    fatal.process_all_clusters();
    EXPECT_THROW(fatal.load_domain_distances(), std::runtime_error);
}

TEST(ClusterWriterTest, PfdKeepsScoreDecimals) {
    TempDir tmp;
    ClusterWriter writer(tmp.file("out"));
    writer.write_cluster("bgc1", {make_hit("cds1", 0, 100, 1234.5678), make_hit("cds1", 200, 300, 50.0)},
                         {"PF00001", "PF00001"});

    std::vector<std::string> pfd = read_lines(writer.pfd_path("bgc1"));
    ASSERT_EQ(pfd.size(), 2u);
    EXPECT_EQ(pfd[0].substr(0, 15), "bgc1\t1234.5678\t");
    EXPECT_EQ(pfd[1].substr(0, 8), "bgc1\t50\t");
}

TEST(ReadGroupsTest, SkipsMalformedLines) {
    TempDir tmp;
    std::string path = tmp.write("groups.tsv", "# cluster\tgroup\nc1\tNRPS\r\n\tno_id\nc2\nc3\tPKS\tother\n");
    GroupMap groups = ClusterProcessor::read_groups(path);

    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups.at("c1"), "NRPS");
    EXPECT_EQ(groups.at("c3"), "PKS");
    EXPECT_THROW(ClusterProcessor::read_groups(tmp.file("missing.tsv")), std::runtime_error);
}
