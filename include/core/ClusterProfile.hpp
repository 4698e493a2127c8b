#pragma once

#include <map>
#include <string>
#include <vector>

#include "DataStructs.hpp"

namespace BgcNet {

/**
 * @brief Domain content of one cluster after overlap resolution.
 *
 * Two views of the same retained hits:
 * - `domains`: family keys in synteny order, duplicates kept
 * - `instances`: family key -> specific instance ids, in the same order
 *
 * Each instance id corresponds to exactly one position in `domains`.
 */
class ClusterProfile {
public:
    std::string cluster_id;
    std::vector<std::string> domains;
    std::map<std::string, std::vector<std::string>> instances;

    ClusterProfile() = default;

    /**
     * @brief Builds the profile from hits already in synteny order.
     */
    static ClusterProfile from_hits(const std::string& cluster_id, const std::vector<DomainHit>& ordered_hits);

    bool empty() const { return domains.empty(); }

    /**
     * @brief Number of retained domains (with duplicates).
     */
    int size() const { return static_cast<int>(domains.size()); }

    int num_families() const { return static_cast<int>(instances.size()); }

    /**
     * @brief Copy count of a family, 0 if absent.
     */
    int copy_count(const std::string& family) const;

    /**
     * @brief Instance ids of a family, empty if absent.
     */
    const std::vector<std::string>& instances_of(const std::string& family) const;
};

}  // namespace BgcNet
