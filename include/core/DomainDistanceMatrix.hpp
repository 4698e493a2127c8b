#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BgcNet {

/**
 * @brief A dissimilarity between two specific domain instances.
 */
struct DomainPairDistance {
    std::string id_a;
    std::string id_b;
    double distance;  ///< 1 - identity, in [0, 1]
};

/**
 * @brief Sequence dissimilarities between specific domain instances, per family.
 *
 * Pair keys are order-independent. Filled once before any cluster comparison
 * and only read afterwards, so concurrent lookups need no locking.
 */
class DomainDistanceMatrix {
public:
    /// Dissimilarity used for pairs the alignment did not report.
    static constexpr double kMissingPairDistance = 0.9;

    DomainDistanceMatrix() = default;

    /**
     * @brief Stores the dissimilarity of a pair, clamped to [0, 1].
     */
    void set_distance(const std::string& family, const std::string& id_a, const std::string& id_b, double distance);

    /**
     * @brief Stores every pair of one family.
     */
    void add_family(const std::string& family, const std::vector<DomainPairDistance>& pairs);

    /**
     * @brief Stored dissimilarity, if the pair was reported.
     */
    std::optional<double> find(const std::string& family, const std::string& id_a, const std::string& id_b) const;

    /**
     * @brief Dissimilarity with the fallback policy applied.
     *
     * 0 for an instance against itself, the stored value if present,
     * kMissingPairDistance otherwise.
     */
    double lookup(const std::string& family, const std::string& id_a, const std::string& id_b) const {
        if (id_a == id_b) {
            return 0.0;
        }
        return find(family, id_a, id_b).value_or(kMissingPairDistance);
    }

    bool has_family(const std::string& family) const { return families_.count(family) > 0; }

    size_t num_families() const { return families_.size(); }

    size_t num_pairs() const;

    bool empty() const { return families_.empty(); }

private:
    using PairKey = std::pair<std::string, std::string>;

    static PairKey make_key(const std::string& id_a, const std::string& id_b) {
        return id_a < id_b ? PairKey(id_a, id_b) : PairKey(id_b, id_a);
    }

    std::unordered_map<std::string, std::map<PairKey, double>> families_;
};

}  // namespace BgcNet
