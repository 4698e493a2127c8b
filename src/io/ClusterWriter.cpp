#include "io/ClusterWriter.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace BgcNet {

ClusterWriter::ClusterWriter(const std::string& output_dir) : output_dir_(output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir_ + ": " + ec.message());
    }
}

void ClusterWriter::write_cluster(const std::string& cluster_id, const std::vector<DomainHit>& hits,
                                  const std::vector<std::string>& domains) const {
    write_pfd(pfd_path(cluster_id), hits);
    write_pfs(pfs_path(cluster_id), domains);
}

void ClusterWriter::write_pfd(const std::string& path, const std::vector<DomainHit>& hits) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    ofs << std::setprecision(10);
    for (const auto& hit : hits) {
        ofs << hit.cluster_id << "\t" << hit.score << "\t" << hit.gene_id << "\t" << hit.start << "\t" << hit.stop
            << "\t" << strand_to_string(hit.strand) << "\t" << hit.accession << "\t" << hit.family_name << "\t"
            << hit.cds_id << "\n";
    }

    if (!ofs) {
        throw std::runtime_error("Failed writing " + path);
    }
}

void ClusterWriter::write_pfs(const std::string& path, const std::vector<std::string>& domains) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    for (size_t i = 0; i < domains.size(); ++i) {
        if (i > 0) ofs << " ";
        ofs << domains[i];
    }
    ofs << "\n";

    if (!ofs) {
        throw std::runtime_error("Failed writing " + path);
    }
}

}  // namespace BgcNet
