#include "core/DomainOverlapResolver.hpp"

#include <algorithm>
#include <unordered_map>

namespace BgcNet {

int32_t DomainOverlapResolver::overlap_length(int32_t a_start, int32_t a_stop, int32_t b_start, int32_t b_stop) {
    return std::min(a_stop, b_stop) - std::max(a_start, b_start);
}

static double overlap_fraction(int32_t overlap, int32_t length) {
    if (length <= 0) {
        return 0.0;
    }
    return static_cast<double>(overlap) / static_cast<double>(length);
}

bool DomainOverlapResolver::overlaps_significantly(const DomainHit& a, const DomainHit& b, double cutoff) {
    int32_t overlap = overlap_length(a.start, a.stop, b.start, b.stop);
    if (overlap <= 0) {
        return false;
    }
    return overlap_fraction(overlap, a.length()) > cutoff || overlap_fraction(overlap, b.length()) > cutoff;
}

ResolvedDomains DomainOverlapResolver::resolve(const std::vector<DomainHit>& hits) const {
    const size_t n = hits.size();

    // Group hit indices by CDS; only hits on the same coding region compete
    std::unordered_map<std::string, std::vector<size_t>> by_cds;
    for (size_t i = 0; i < n; ++i) {
        by_cds[hits[i].cds_id].push_back(i);
    }

    // Phase 1: decide removals against the unmodified input
    std::vector<uint8_t> keep(n, 1);
    for (const auto& kv : by_cds) {
        const auto& idx = kv.second;
        for (size_t p = 0; p < idx.size(); ++p) {
            for (size_t q = p + 1; q < idx.size(); ++q) {
                const DomainHit& a = hits[idx[p]];
                const DomainHit& b = hits[idx[q]];
                if (!overlaps_significantly(a, b, overlap_cutoff_)) {
                    continue;
                }
                // Equal scores are left alone
                if (a.score > b.score) {
                    keep[idx[q]] = 0;
                } else if (a.score < b.score) {
                    keep[idx[p]] = 0;
                }
            }
        }
    }

    // Phase 2: apply
    ResolvedDomains result;
    result.hits.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (keep[i]) {
            result.hits.push_back(hits[i]);
        }
    }
    result.num_removed = static_cast<int>(n - result.hits.size());

    std::stable_sort(result.hits.begin(), result.hits.end(),
                     [](const DomainHit& x, const DomainHit& y) { return x.start < y.start; });

    result.domains.reserve(result.hits.size());
    for (const auto& hit : result.hits) {
        result.domains.push_back(hit.family());
    }

    return result;
}

}  // namespace BgcNet
