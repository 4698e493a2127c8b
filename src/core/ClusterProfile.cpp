#include "core/ClusterProfile.hpp"

namespace BgcNet {

ClusterProfile ClusterProfile::from_hits(const std::string& cluster_id, const std::vector<DomainHit>& ordered_hits) {
    ClusterProfile profile;
    profile.cluster_id = cluster_id;
    profile.domains.reserve(ordered_hits.size());

    for (const auto& hit : ordered_hits) {
        std::string family = hit.family();
        profile.instances[family].push_back(hit.instance_id());
        profile.domains.push_back(std::move(family));
    }

    return profile;
}

int ClusterProfile::copy_count(const std::string& family) const {
    auto it = instances.find(family);
    return it == instances.end() ? 0 : static_cast<int>(it->second.size());
}

const std::vector<std::string>& ClusterProfile::instances_of(const std::string& family) const {
    static const std::vector<std::string> kNone;
    auto it = instances.find(family);
    return it == instances.end() ? kNone : it->second;
}

}  // namespace BgcNet
