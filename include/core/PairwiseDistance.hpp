#pragma once

#include <string>
#include <vector>

#include "ClusterProfile.hpp"
#include "DataStructs.hpp"
#include "DomainDistanceMatrix.hpp"
#include "Types.hpp"

namespace BgcNet {

/**
 * @brief Parameters of a cluster-to-cluster distance computation.
 *
 * The weights and neighbourhood apply to DOMAIN_DIST only; SEQDIST uses
 * fixed coefficients (kSeqJaccardWeight, kSeqDdsWeight).
 */
struct DistanceConfig {
    DistanceMode mode = DistanceMode::DOMAIN_DIST;  ///< Distance measure
    double jaccard_weight = 0.4;                    ///< Weight of the modified Jaccard index
    double dds_weight = 0.2;                        ///< Weight of the duplication score
    double gk_weight = 0.4;                         ///< Weight of the synteny score
    int nbhood = 4;                                 ///< Synteny neighbourhood width
};

/**
 * @brief Computes the distance between two cluster profiles.
 *
 * Holds only read-only state (configuration and a pointer to the domain
 * distance matrix), so one instance can be shared by all worker threads.
 *
 * Every result lies in [0, 1]. Comparing against a profile without domains
 * returns 1.
 */
class DistanceCalculator {
public:
    static constexpr double kSeqJaccardWeight = 0.36;
    static constexpr double kSeqDdsWeight = 0.64;

    /**
     * @param config Distance configuration.
     * @param dms Domain distances, required for SEQDIST; must outlive the calculator.
     */
    explicit DistanceCalculator(const DistanceConfig& config, const DomainDistanceMatrix* dms = nullptr);

    /**
     * @brief Distance between two profiles using the configured mode.
     */
    ClusterPairDistance compute(const ClusterProfile& a, const ClusterProfile& b) const;

    /**
     * @brief Family-sequence distance (DOMAIN_DIST).
     *
     * distance = 1 - wj * Jaccard' - wd * DDS - wg * GK, floored at 0, where
     * Jaccard' = |A & B| / (2 * min(|A|, |B|) - |A & B|) over family sets.
     */
    static ClusterPairDistance domain_distance(const std::vector<std::string>& a, const std::vector<std::string>& b,
                                               const DistanceConfig& config);

    /**
     * @brief Sequence-identity distance (SEQDIST).
     *
     * distance = 1 - 0.36 * Jaccard - 0.64 * DDS, where DDS = exp(-sum / S)
     * accumulates per family either a single-pair dissimilarity, a fixed 1 for
     * an unpartnered single copy, or the optimal assignment cost between copies.
     */
    static ClusterPairDistance sequence_distance(const ClusterProfile& a, const ClusterProfile& b,
                                                 const DomainDistanceMatrix& dms);

    /**
     * @brief Duplication score exp(-sum|cA - cB| / sum max(cA, cB)) over all families.
     */
    static double duplication_score(const std::vector<std::string>& a, const std::vector<std::string>& b);

    /**
     * @brief Goodman-Kruskal synteny score for one orientation.
     *
     * Zero unless the sequences share more than one family; otherwise
     * (1 + gamma) / 2 with gamma computed over ordered family pairs taken
     * within the neighbourhood window.
     */
    static double goodman_kruskal(const std::vector<std::string>& a, const std::vector<std::string>& b, int nbhood);

    /**
     * @brief Best synteny score over both orientations of either cluster.
     */
    static double synteny_score(const std::vector<std::string>& a, const std::vector<std::string>& b, int nbhood);

    const DistanceConfig& config() const { return config_; }

    /**
     * @brief Parse a mode name ("domain_dist", "seqdist"), case-insensitive.
     * @throws std::invalid_argument for unknown names.
     */
    static DistanceMode string_to_mode(const std::string& str);

private:
    DistanceConfig config_;
    const DomainDistanceMatrix* dms_;
};

}  // namespace BgcNet
