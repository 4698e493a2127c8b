#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "core/NetworkAssembler.hpp"

namespace BgcNet {

/**
 * @brief Writes network tables and dense distance matrices.
 *
 * Network rows (tab separated, no header):
 * ```
 * clusterA  clusterB  groupA  groupB  log_score  distance  squared_similarity
 * ```
 * Numbers use 6 decimals; an infinite log score is written as "inf".
 */
class NetworkWriter {
public:
    explicit NetworkWriter(const std::string& output_dir);

    /// `networkfile_<mode>_<name>_c<cutoff>.network`
    std::string network_path(const ClusterNetwork& network, const std::string& cutoff) const;

    /// `distances_<mode>_<name>.csv`
    std::string matrix_path(const ClusterNetwork& network) const;

    /**
     * @brief Writes the edges whose squared similarity is strictly above the cutoff.
     * @return Number of rows written.
     * @throws std::runtime_error if the file cannot be written.
     */
    size_t write_network(const std::string& path, const std::vector<NetworkEdge>& edges, double cutoff) const;

    /**
     * @brief CSV with a header row of cluster ids and one row per cluster.
     * @throws std::runtime_error if the file cannot be written.
     */
    void write_distance_matrix(const std::string& path, const ClusterNetwork& network) const;

    static void write_edge(std::ostream& os, const NetworkEdge& edge);

private:
    std::string output_dir_;
};

}  // namespace BgcNet
