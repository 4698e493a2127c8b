#include "core/PairwiseDistance.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "core/Assignment.hpp"

namespace BgcNet {

using FamilyPair = std::pair<std::string, std::string>;

// ============================================================================
// Helper Functions
// ============================================================================

static std::set<std::string> to_set(const std::vector<std::string>& seq) {
    return std::set<std::string>(seq.begin(), seq.end());
}

static int intersection_size(const std::set<std::string>& a, const std::set<std::string>& b) {
    int shared = 0;
    for (const auto& x : a) {
        if (b.count(x)) {
            shared++;
        }
    }
    return shared;
}

/**
 * @brief Ordered family pairs (seq[i], seq[j]) with i < j < i + nbhood.
 *
 * Start positions stop nbhood short of the end, so sequences not longer
 * than nbhood contribute no pairs.
 */
static std::set<FamilyPair> neighbourhood_pairs(const std::vector<std::string>& seq, int nbhood) {
    std::set<FamilyPair> pairs;
    const int n = static_cast<int>(seq.size());
    for (int i = 0; i < n - nbhood; ++i) {
        for (int j = i + 1; j < i + nbhood; ++j) {
            pairs.emplace(seq[i], seq[j]);
        }
    }
    return pairs;
}

static double clamp_unit(double x) {
    return std::max(0.0, std::min(1.0, x));
}

// ============================================================================
// DistanceCalculator
// ============================================================================

DistanceCalculator::DistanceCalculator(const DistanceConfig& config, const DomainDistanceMatrix* dms)
    : config_(config), dms_(dms) {
    if (config_.mode == DistanceMode::SEQDIST && dms_ == nullptr) {
        throw std::invalid_argument("seqdist mode requires a domain distance matrix");
    }
}

ClusterPairDistance DistanceCalculator::compute(const ClusterProfile& a, const ClusterProfile& b) const {
    switch (config_.mode) {
        case DistanceMode::DOMAIN_DIST:
            return domain_distance(a.domains, b.domains, config_);
        case DistanceMode::SEQDIST:
            return sequence_distance(a, b, *dms_);
        default:
            throw std::logic_error("Unhandled distance mode");
    }
}

double DistanceCalculator::duplication_score(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::map<std::string, int> count_a, count_b;
    for (const auto& f : a) count_a[f]++;
    for (const auto& f : b) count_b[f]++;

    std::set<std::string> families = to_set(a);
    families.insert(b.begin(), b.end());

    double diff = 0.0;
    double norm = 0.0;
    for (const auto& f : families) {
        int ca = count_a.count(f) ? count_a[f] : 0;
        int cb = count_b.count(f) ? count_b[f] : 0;
        diff += std::abs(ca - cb);
        norm += std::max(ca, cb);
    }

    if (norm <= 0.0) {
        return 0.0;
    }
    return std::exp(-diff / norm);
}

double DistanceCalculator::goodman_kruskal(const std::vector<std::string>& a, const std::vector<std::string>& b,
                                           int nbhood) {
    if (intersection_size(to_set(a), to_set(b)) <= 1) {
        return 0.0;
    }

    std::set<FamilyPair> pairs_a = neighbourhood_pairs(a, nbhood);
    std::set<FamilyPair> pairs_b = neighbourhood_pairs(b, nbhood);

    std::set<FamilyPair> all_pairs = pairs_a;
    all_pairs.insert(pairs_b.begin(), pairs_b.end());

    double same = 0.0;      // Ns
    double reversed = 0.0;  // Nr
    for (const auto& p : all_pairs) {
        FamilyPair rev(p.second, p.first);
        bool in_a = pairs_a.count(p) > 0;
        bool in_b = pairs_b.count(p) > 0;
        if (in_a && in_b) {
            same += 1.0;
        } else if (in_a && pairs_b.count(rev)) {
            reversed += 1.0;
        } else if (pairs_a.count(rev) && in_b) {
            reversed += 1.0;
        }
    }

    double gamma = 0.0;
    if (same + reversed > 0.0) {
        gamma = std::abs(reversed - same) / (reversed + same);
    }
    return (1.0 + gamma) / 2.0;
}

double DistanceCalculator::synteny_score(const std::vector<std::string>& a, const std::vector<std::string>& b,
                                         int nbhood) {
    std::vector<std::string> a_rev(a.rbegin(), a.rend());
    std::vector<std::string> b_rev(b.rbegin(), b.rend());

    // Reversing either side keeps the score independent of argument order
    return std::max({goodman_kruskal(a, b, nbhood), goodman_kruskal(a_rev, b, nbhood),
                     goodman_kruskal(a, b_rev, nbhood)});
}

ClusterPairDistance DistanceCalculator::domain_distance(const std::vector<std::string>& a,
                                                        const std::vector<std::string>& b,
                                                        const DistanceConfig& config) {
    ClusterPairDistance result;
    if (a.empty() || b.empty()) {
        result.distance = 1.0;
        result.empty_profile = true;
        return result;
    }

    std::set<std::string> set_a = to_set(a);
    std::set<std::string> set_b = to_set(b);
    const int shared = intersection_size(set_a, set_b);
    const int smaller = static_cast<int>(std::min(set_a.size(), set_b.size()));

    result.jaccard = static_cast<double>(shared) / static_cast<double>(2 * smaller - shared);
    result.dds = duplication_score(a, b);
    result.synteny = synteny_score(a, b, config.nbhood);

    double distance = 1.0 - config.jaccard_weight * result.jaccard - config.dds_weight * result.dds -
                      config.gk_weight * result.synteny;
    result.distance = clamp_unit(distance);
    return result;
}

ClusterPairDistance DistanceCalculator::sequence_distance(const ClusterProfile& a, const ClusterProfile& b,
                                                          const DomainDistanceMatrix& dms) {
    ClusterPairDistance result;
    if (a.empty() || b.empty()) {
        result.distance = 1.0;
        result.empty_profile = true;
        return result;
    }

    std::set<std::string> families;
    int shared = 0;
    for (const auto& kv : a.instances) {
        families.insert(kv.first);
        if (b.instances.count(kv.first)) {
            shared++;
        }
    }
    for (const auto& kv : b.instances) {
        families.insert(kv.first);
    }

    const int union_size = static_cast<int>(families.size());
    result.jaccard = static_cast<double>(shared) / static_cast<double>(union_size);

    double dds_sum = 0.0;
    double norm = 0.0;
    for (const auto& family : families) {
        const auto& set_a = a.instances_of(family);
        const auto& set_b = b.instances_of(family);
        const int na = static_cast<int>(set_a.size());
        const int nb = static_cast<int>(set_b.size());

        if (na == 1 && nb == 1) {
            dds_sum += dms.lookup(family, set_a[0], set_b[0]);
            norm += 1.0;
        } else if (na + nb == 1) {
            // Single copy without a partner
            dds_sum += 1.0;
            norm += 1.0;
        } else {
            const int n = std::max(na, nb);
            Eigen::MatrixXd cost = Eigen::MatrixXd::Zero(n, n);
            for (int i = 0; i < na; ++i) {
                for (int j = 0; j < nb; ++j) {
                    cost(i, j) = dms.lookup(family, set_a[i], set_b[j]);
                }
            }
            dds_sum += solve_assignment(cost).total_cost;
            norm += static_cast<double>(n);
        }
    }

    result.dds_sum = dds_sum;
    result.dds_norm = norm;
    result.dds = std::exp(-dds_sum / norm);

    double distance = 1.0 - kSeqJaccardWeight * result.jaccard - kSeqDdsWeight * result.dds;
    result.distance = clamp_unit(distance);
    return result;
}

DistanceMode DistanceCalculator::string_to_mode(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "domain_dist" || lower == "domain") return DistanceMode::DOMAIN_DIST;
    if (lower == "seqdist" || lower == "seq") return DistanceMode::SEQDIST;

    throw std::invalid_argument("Unknown distance mode: " + str);
}

}  // namespace BgcNet
