#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "ClusterProfile.hpp"
#include "DataStructs.hpp"
#include "PairwiseDistance.hpp"

namespace BgcNet {

/// Cluster id -> group label (e.g. product class).
using GroupMap = std::map<std::string, std::string>;

/**
 * @brief All pairwise relationships of a cluster collection.
 */
class ClusterNetwork {
public:
    std::string name;                      ///< Sample name or "all_vs_all"
    DistanceMode mode = DistanceMode::DOMAIN_DIST;
    std::vector<std::string> cluster_ids;  ///< Row/column order of dist_matrix
    Eigen::MatrixXd dist_matrix;           ///< Symmetric NxN distances, zero diagonal
    std::vector<NetworkEdge> edges;        ///< One edge per unordered pair, ascending log score

    // Statistics
    int num_empty_pairs = 0;  ///< Pairs involving a cluster without domains

    ClusterNetwork() = default;

    bool empty() const { return cluster_ids.empty(); }

    int size() const { return static_cast<int>(cluster_ids.size()); }

    /**
     * @brief Edges whose squared similarity is strictly above the cutoff, in table order.
     */
    std::vector<NetworkEdge> filter(double cutoff) const;
};

/**
 * @brief Computes, ranks and filters the pairwise distances of a cluster collection.
 *
 * Pairs are evaluated in parallel into a pre-sized table and sorted only after
 * every evaluation has finished, so the output does not depend on thread
 * scheduling.
 */
class NetworkAssembler {
public:
    /**
     * @param calculator Shared, read-only distance calculator.
     * @param num_threads OpenMP threads; <= 0 uses the OpenMP default.
     */
    NetworkAssembler(const DistanceCalculator& calculator, int num_threads = 1)
        : calculator_(calculator), num_threads_(num_threads) {}

    /**
     * @brief Builds the network of the given clusters.
     *
     * @param name Network name used for output files.
     * @param cluster_ids Clusters in input order; ties in the ranking keep pair order.
     * @param profiles Profiles of at least every listed cluster.
     * @param groups Group labels; clusters without one are labelled "NA".
     * @throws std::out_of_range if a listed cluster has no profile.
     */
    ClusterNetwork assemble(const std::string& name, const std::vector<std::string>& cluster_ids,
                            const std::map<std::string, ClusterProfile>& profiles, const GroupMap& groups) const;

    /**
     * @brief -log2(similarity) for a distance; +infinity when similarity is 0.
     */
    static double log_score(double distance);

    /// Number of unordered pairs among n clusters.
    static std::size_t pair_count(int n);

    /**
     * @brief Stable ascending sort by log score; infinite scores go last.
     */
    static void sort_edges(std::vector<NetworkEdge>& edges);

    /**
     * @brief Edges whose squared similarity is strictly above the cutoff.
     */
    static std::vector<NetworkEdge> filter_edges(const std::vector<NetworkEdge>& edges, double cutoff);

private:
    const DistanceCalculator& calculator_;
    int num_threads_;
};

}  // namespace BgcNet
