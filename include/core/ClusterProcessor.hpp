#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/ClusterProfile.hpp"
#include "core/Config.hpp"
#include "core/DomainDistanceMatrix.hpp"
#include "core/NetworkAssembler.hpp"
#include "io/ClusterWriter.hpp"

namespace BgcNet {

/**
 * @brief One domain table found under the input directory.
 */
struct ClusterInput {
    std::string cluster_id;     ///< File name without "_domtable.txt"
    std::string sample;         ///< Directory path below the input root, '/' as '_'
    std::string domtable_path;
};

/**
 * @brief Outcome of processing one cluster.
 */
struct ClusterResult {
    std::string cluster_id;
    std::string sample;
    int num_hits = 0;       ///< Hits read from the domain table
    int num_removed = 0;    ///< Hits dropped by overlap resolution
    int num_domains = 0;    ///< Domains in the profile
    int num_families = 0;   ///< Distinct families in the profile
    double elapsed_ms = 0.0;
    bool success = false;
    std::string error_message;
};

/**
 * @brief Outcome of one network build.
 */
struct NetworkResult {
    std::string name;
    DistanceMode mode = DistanceMode::DOMAIN_DIST;
    int num_clusters = 0;
    int num_pairs = 0;
    int num_empty_pairs = 0;
    std::vector<size_t> rows_per_cutoff;  ///< Same order as Config::sim_cutoffs
    double elapsed_ms = 0.0;
};

/**
 * @brief Drives a whole run: discovery, per-cluster profiling, domain
 * distances and network construction.
 *
 * Typical use:
 *   ClusterProcessor processor(config);
 *   processor.discover_clusters();
 *   processor.load_groups();
 *   auto results = processor.process_all_clusters();
 *   processor.load_domain_distances();
 *   auto networks = processor.build_networks();
 *   processor.print_summary(results, networks);
 *
 * Thread-safety:
 * - Clusters are processed in parallel; each iteration owns its result slot
 * - Shared state (profiles, DMS) is only written between parallel sections
 */
class ClusterProcessor {
public:
    static constexpr const char* kAllVsAll = "all_vs_all";
    static constexpr const char* kDistoutSuffix = ".fasta.hat2";
    static constexpr const char* kAlignmentSuffix = ".algn";

    explicit ClusterProcessor(const Config& config);

    /**
     * @brief Finds every `<cluster>_domtable.txt` below the input directory.
     *
     * Each directory holding tables is one sample, keyed by its path below the
     * input directory so equally named directories stay apart. Entries that
     * cannot be stat'ed are skipped with a warning. A cluster id that appears
     * twice is kept once (first path in sorted order) with a warning.
     *
     * @return Number of clusters found.
     * @throws std::runtime_error if the input directory cannot be read.
     */
    int discover_clusters();

    /**
     * @brief Loads the optional group table.
     * @return Number of group assignments loaded.
     */
    int load_groups();

    /**
     * @brief Reads, resolves, profiles and writes every discovered cluster (parallel).
     *
     * @return One result per cluster, in discovery order.
     * @throws std::runtime_error with fail_fast if any cluster failed.
     */
    std::vector<ClusterResult> process_all_clusters();

    /**
     * @brief Processes one cluster (called by OpenMP worker threads).
     *
     * @param input Cluster to process.
     * @param writer Shared writer; each cluster writes its own files.
     * @param profile Receives the profile on success.
     */
    ClusterResult process_single_cluster(const ClusterInput& input, const ClusterWriter& writer,
                                         ClusterProfile& profile) const;

    /**
     * @brief Loads per-family distances for every family of the processed clusters.
     *
     * A family with a single instance overall needs no file. A missing or
     * malformed file leaves that family's pairs at the fallback distance.
     *
     * @return Number of families loaded.
     * @throws std::runtime_error with fail_fast if a file was malformed.
     */
    int load_domain_distances();

    /**
     * @brief Builds and writes the per-sample and all-vs-all networks for each mode.
     */
    std::vector<NetworkResult> build_networks();

    void print_summary(const std::vector<ClusterResult>& results, const std::vector<NetworkResult>& networks) const;

    /**
     * @brief Parses a group table ("cluster<TAB>group"); malformed lines are skipped.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static GroupMap read_groups(const std::string& path);

    /// Path of a family's domain distance file for the configured source.
    std::string family_distance_path(const std::string& family) const;

    const std::vector<ClusterInput>& clusters() const { return clusters_; }
    const std::map<std::string, std::vector<std::string>>& samples() const { return samples_; }
    const std::map<std::string, ClusterProfile>& profiles() const { return profiles_; }
    const GroupMap& groups() const { return groups_; }
    const DomainDistanceMatrix& domain_distances() const { return dms_; }

private:
    NetworkResult build_network(const NetworkAssembler& assembler, const std::string& name,
                                const std::vector<std::string>& cluster_ids, DistanceMode mode) const;

    Config config_;

    std::vector<ClusterInput> clusters_;                       ///< Discovery order (sample, cluster id)
    std::map<std::string, std::vector<std::string>> samples_;  ///< Sample -> sorted cluster ids
    std::map<std::string, ClusterProfile> profiles_;           ///< Successfully processed clusters
    GroupMap groups_;
    DomainDistanceMatrix dms_;
};

}  // namespace BgcNet
