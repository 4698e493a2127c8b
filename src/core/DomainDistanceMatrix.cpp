#include "core/DomainDistanceMatrix.hpp"

#include <algorithm>
#include <cmath>

namespace BgcNet {

void DomainDistanceMatrix::set_distance(const std::string& family, const std::string& id_a,
                                        const std::string& id_b, double distance) {
    if (std::isnan(distance)) {
        return;
    }
    double clamped = std::max(0.0, std::min(1.0, distance));
    families_[family][make_key(id_a, id_b)] = clamped;
}

void DomainDistanceMatrix::add_family(const std::string& family, const std::vector<DomainPairDistance>& pairs) {
    families_[family];  // a family with no reported pairs is still known
    for (const auto& p : pairs) {
        set_distance(family, p.id_a, p.id_b, p.distance);
    }
}

std::optional<double> DomainDistanceMatrix::find(const std::string& family, const std::string& id_a,
                                                 const std::string& id_b) const {
    auto fit = families_.find(family);
    if (fit == families_.end()) {
        return std::nullopt;
    }
    auto pit = fit->second.find(make_key(id_a, id_b));
    if (pit == fit->second.end()) {
        return std::nullopt;
    }
    return pit->second;
}

size_t DomainDistanceMatrix::num_pairs() const {
    size_t total = 0;
    for (const auto& kv : families_) {
        total += kv.second.size();
    }
    return total;
}

}  // namespace BgcNet
