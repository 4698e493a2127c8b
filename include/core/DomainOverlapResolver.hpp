#pragma once

#include <string>
#include <vector>

#include "DataStructs.hpp"

namespace BgcNet {

/**
 * @brief Result of overlap resolution for one cluster.
 */
struct ResolvedDomains {
    std::vector<DomainHit> hits;       ///< Retained hits, ascending by start
    std::vector<std::string> domains;  ///< Family keys in the same order
    int num_removed = 0;               ///< Hits dropped because of overlap
};

/**
 * @brief Removes lower-scoring domain hits that overlap another hit on the
 * same CDS by more than a configured fraction.
 *
 * All pairs sharing a CDS are compared, not only neighbours. Removal
 * decisions are collected against the unmodified input first and applied
 * afterwards, so the outcome does not depend on input order. Hits with equal
 * scores are both kept.
 */
class DomainOverlapResolver {
public:
    explicit DomainOverlapResolver(double overlap_cutoff = 0.1) : overlap_cutoff_(overlap_cutoff) {}

    /**
     * @brief Filters the hits of one cluster.
     *
     * @param hits Unordered hits of a single cluster.
     * @return Retained hits sorted by start (stable for equal starts) and
     *         their family keys.
     */
    ResolvedDomains resolve(const std::vector<DomainHit>& hits) const;

    /**
     * @brief Number of positions shared by two intervals.
     *
     * Zero or negative when the intervals only touch or are disjoint.
     */
    static int32_t overlap_length(int32_t a_start, int32_t a_stop, int32_t b_start, int32_t b_stop);

    /**
     * @brief True if either hit loses more than `cutoff` of its own length to the other.
     */
    static bool overlaps_significantly(const DomainHit& a, const DomainHit& b, double cutoff);

    double overlap_cutoff() const { return overlap_cutoff_; }

private:
    double overlap_cutoff_;
};

}  // namespace BgcNet
