#include "io/NetworkWriter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace BgcNet {

NetworkWriter::NetworkWriter(const std::string& output_dir) : output_dir_(output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir_ + ": " + ec.message());
    }
}

std::string NetworkWriter::network_path(const ClusterNetwork& network, const std::string& cutoff) const {
    return output_dir_ + "/networkfile_" + mode_to_string(network.mode) + "_" + network.name + "_c" + cutoff +
           ".network";
}

std::string NetworkWriter::matrix_path(const ClusterNetwork& network) const {
    return output_dir_ + "/distances_" + mode_to_string(network.mode) + "_" + network.name + ".csv";
}

void NetworkWriter::write_edge(std::ostream& os, const NetworkEdge& edge) {
    os << edge.cluster_a << "\t" << edge.cluster_b << "\t" << edge.group_a << "\t" << edge.group_b << "\t";
    if (std::isinf(edge.log_score)) {
        os << "inf";
    } else {
        os << std::fixed << std::setprecision(6) << edge.log_score;
    }
    os << "\t" << std::fixed << std::setprecision(6) << edge.distance << "\t" << edge.squared_similarity << "\n";
}

size_t NetworkWriter::write_network(const std::string& path, const std::vector<NetworkEdge>& edges,
                                    double cutoff) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    size_t written = 0;
    for (const auto& edge : NetworkAssembler::filter_edges(edges, cutoff)) {
        write_edge(ofs, edge);
        written++;
    }

    if (!ofs) {
        throw std::runtime_error("Failed writing " + path);
    }
    return written;
}

void NetworkWriter::write_distance_matrix(const std::string& path, const ClusterNetwork& network) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    ofs << "cluster_id";
    for (const auto& id : network.cluster_ids) {
        ofs << "," << id;
    }
    ofs << "\n";

    const int n = network.size();
    for (int i = 0; i < n; ++i) {
        ofs << network.cluster_ids[i];
        for (int j = 0; j < n; ++j) {
            ofs << "," << std::fixed << std::setprecision(6) << network.dist_matrix(i, j);
        }
        ofs << "\n";
    }

    if (!ofs) {
        throw std::runtime_error("Failed writing " + path);
    }
}

}  // namespace BgcNet
