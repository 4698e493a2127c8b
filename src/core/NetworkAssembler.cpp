#include "core/NetworkAssembler.hpp"

#include <omp.h>

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "utils/Logger.hpp"

namespace BgcNet {

static const std::string kUnknownGroup = "NA";

static const std::string& group_of(const GroupMap& groups, const std::string& cluster_id) {
    auto it = groups.find(cluster_id);
    return it == groups.end() ? kUnknownGroup : it->second;
}

double NetworkAssembler::log_score(double distance) {
    double similarity = 1.0 - distance;
    if (similarity <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    // + 0.0 turns -0.0 (similarity 1) into 0.0
    return -std::log2(similarity) + 0.0;
}

std::size_t NetworkAssembler::pair_count(int n) {
    if (n < 2) {
        return 0;
    }
    return static_cast<std::size_t>(n) * static_cast<std::size_t>(n - 1) / 2;
}

void NetworkAssembler::sort_edges(std::vector<NetworkEdge>& edges) {
    // operator< on doubles already orders +inf after every finite value
    std::stable_sort(edges.begin(), edges.end(),
                     [](const NetworkEdge& x, const NetworkEdge& y) { return x.log_score < y.log_score; });
}

std::vector<NetworkEdge> NetworkAssembler::filter_edges(const std::vector<NetworkEdge>& edges, double cutoff) {
    std::vector<NetworkEdge> kept;
    for (const auto& e : edges) {
        if (e.squared_similarity > cutoff) {
            kept.push_back(e);
        }
    }
    return kept;
}

std::vector<NetworkEdge> ClusterNetwork::filter(double cutoff) const {
    return NetworkAssembler::filter_edges(edges, cutoff);
}

ClusterNetwork NetworkAssembler::assemble(const std::string& name, const std::vector<std::string>& cluster_ids,
                                          const std::map<std::string, ClusterProfile>& profiles,
                                          const GroupMap& groups) const {
    ClusterNetwork network;
    network.name = name;
    network.mode = calculator_.config().mode;
    network.cluster_ids = cluster_ids;

    const int n = static_cast<int>(cluster_ids.size());
    network.dist_matrix = Eigen::MatrixXd::Zero(n, n);

    // Resolve profiles up front so workers only touch immutable pointers
    std::vector<const ClusterProfile*> members(n);
    for (int i = 0; i < n; ++i) {
        auto it = profiles.find(cluster_ids[i]);
        if (it == profiles.end()) {
            throw std::out_of_range("No profile for cluster " + cluster_ids[i]);
        }
        members[i] = &it->second;
    }

    // Enumerate unordered pairs in input order
    std::vector<std::pair<int, int>> pairs;
    pairs.reserve(pair_count(n));
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            pairs.emplace_back(i, j);
        }
    }

    const std::ptrdiff_t num_pairs = static_cast<std::ptrdiff_t>(pairs.size());
    std::vector<NetworkEdge> edges(pairs.size());
    int empty_pairs = 0;

    int num_threads = num_threads_ > 0 ? num_threads_ : omp_get_max_threads();

#pragma omp parallel for schedule(dynamic) num_threads(num_threads) reduction(+ : empty_pairs)
    for (std::ptrdiff_t k = 0; k < num_pairs; ++k) {
        const int i = pairs[k].first;
        const int j = pairs[k].second;

        ClusterPairDistance d = calculator_.compute(*members[i], *members[j]);
        if (d.empty_profile) {
            empty_pairs++;
        }

        NetworkEdge& edge = edges[k];
        edge.cluster_a = cluster_ids[i];
        edge.cluster_b = cluster_ids[j];
        edge.group_a = group_of(groups, cluster_ids[i]);
        edge.group_b = group_of(groups, cluster_ids[j]);
        edge.distance = d.distance;
        edge.log_score = log_score(d.distance);
        double similarity = 1.0 - d.distance;
        edge.squared_similarity = similarity * similarity;

        // Each (i, j) cell is written by exactly one iteration
        network.dist_matrix(i, j) = d.distance;
        network.dist_matrix(j, i) = d.distance;
    }

    sort_edges(edges);
    network.edges = std::move(edges);
    network.num_empty_pairs = empty_pairs;

    LOG_DEBUG("Network " + name + " (" + mode_to_string(network.mode) + "): " + std::to_string(n) + " clusters, " +
              std::to_string(num_pairs) + " pairs");

    return network;
}

}  // namespace BgcNet
