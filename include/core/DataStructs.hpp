#pragma once

#include <cstdint>
#include <string>

#include "Types.hpp"

namespace BgcNet {

/**
 * @brief One protein-domain occurrence reported by the domain search.
 *
 * Coordinates are the envelope positions on the CDS translation. Never
 * modified after the reader creates it.
 */
struct DomainHit {
    std::string cluster_id;   ///< Owning cluster (domain table stem)
    double score = 0.0;       ///< Domain bit score
    std::string gene_id;      ///< Gene identifier parsed from the CDS header, may be empty
    int32_t start = 0;        ///< Envelope start
    int32_t stop = 0;         ///< Envelope end
    Strand strand = Strand::UNKNOWN;
    std::string accession;    ///< Family accession as reported (e.g. PF00550.12)
    std::string family_name;  ///< Family name (e.g. PP-binding)
    std::string cds_id;       ///< Full CDS header, used to group hits on the same coding region

    /**
     * @brief Family key used by cluster profiles.
     *
     * The accession without its version suffix; the family name when the
     * accession is missing ("-").
     */
    std::string family() const {
        if (accession.empty() || accession == "-") {
            return family_name;
        }
        auto dot = accession.find('.');
        return dot == std::string::npos ? accession : accession.substr(0, dot);
    }

    /**
     * @brief Identifier of this specific occurrence, unique across clusters.
     *
     * Sequence files handed to the aligner must use this as the record name
     * so distance matrices can be keyed back to hits.
     */
    std::string instance_id() const {
        return family() + "_" + cluster_id + "_" + cds_id + "_" + std::to_string(start) + "_" +
               std::to_string(stop);
    }

    int32_t length() const { return stop - start; }
};

/**
 * @brief Distance between two cluster profiles and its components.
 */
struct ClusterPairDistance {
    double distance = 1.0;  ///< Combined distance in [0, 1]
    double jaccard = 0.0;   ///< Jaccard term (modified in domain_dist mode)
    double dds = 0.0;       ///< Domain duplication score
    double synteny = 0.0;   ///< Goodman-Kruskal synteny score (domain_dist only)
    double dds_sum = 0.0;   ///< seqdist: summed per-family dissimilarity
    double dds_norm = 0.0;  ///< seqdist: summed max copy counts (S)
    bool empty_profile = false;  ///< True if either profile had no domains
};

/**
 * @brief One row of a cluster network.
 */
struct NetworkEdge {
    std::string cluster_a;
    std::string cluster_b;
    std::string group_a;
    std::string group_b;
    double log_score = 0.0;          ///< -log2(similarity), +inf when similarity is 0
    double distance = 1.0;
    double squared_similarity = 0.0;  ///< (1 - distance)^2
};

}  // namespace BgcNet
