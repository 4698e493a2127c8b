#pragma once

#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace BgcNet {

/**
 * @brief Writes the per-cluster domain outputs.
 *
 * ```
 * output/
 *   <cluster>.pfd   # Resolved hit table, one hit per line (tab separated)
 *   <cluster>.pfs   # Family keys in order, space separated, single line
 * ```
 * .pfd columns: cluster, score, gene id, start, stop, strand, accession,
 * family name, CDS id.
 */
class ClusterWriter {
public:
    /**
     * @param output_dir Output root, created if missing.
     * @throws std::runtime_error if the directory cannot be created.
     */
    explicit ClusterWriter(const std::string& output_dir);

    /**
     * @brief Writes both files of one cluster.
     * @throws std::runtime_error if a file cannot be written.
     */
    void write_cluster(const std::string& cluster_id, const std::vector<DomainHit>& hits,
                       const std::vector<std::string>& domains) const;

    void write_pfd(const std::string& path, const std::vector<DomainHit>& hits) const;
    void write_pfs(const std::string& path, const std::vector<std::string>& domains) const;

    std::string pfd_path(const std::string& cluster_id) const { return output_dir_ + "/" + cluster_id + ".pfd"; }
    std::string pfs_path(const std::string& cluster_id) const { return output_dir_ + "/" + cluster_id + ".pfs"; }

private:
    std::string output_dir_;
};

}  // namespace BgcNet
