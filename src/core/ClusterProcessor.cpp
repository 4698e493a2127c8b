#include "core/ClusterProcessor.hpp"

#include <omp.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

#include "core/DomainOverlapResolver.hpp"
#include "core/Errors.hpp"
#include "io/DistoutReader.hpp"
#include "io/DomtableReader.hpp"
#include "io/NetworkWriter.hpp"
#include "utils/AlignmentReader.hpp"
#include "utils/Logger.hpp"

namespace BgcNet {

namespace fs = std::filesystem;

static fs::path normalized(const fs::path& dir) {
    fs::path p = fs::absolute(dir).lexically_normal();
    if (p.filename().empty()) {
        p = p.parent_path();
    }
    return p;
}

// Sample key: directory path below the input root with separators as '_',
// or the root's own name for tables directly inside it.
static std::string sample_name(const fs::path& dir, const fs::path& root) {
    fs::path d = normalized(dir);
    fs::path rel = d.lexically_relative(root);
    if (rel.empty() || rel == ".") {
        return d.filename().string();
    }
    std::string key;
    for (const auto& part : rel) {
        if (!key.empty()) key += "_";
        key += part.string();
    }
    return key;
}

ClusterProcessor::ClusterProcessor(const Config& config) : config_(config) {
    omp_set_num_threads(config_.threads);
    LOG_INFO("ClusterProcessor initialized with " + std::to_string(config_.threads) + " threads, overlap cutoff " +
             std::to_string(config_.overlap_cutoff));
}

int ClusterProcessor::discover_clusters() {
    Utils::ScopedLogger scoped("Discover domain tables in " + config_.input_dir);

    clusters_.clear();
    samples_.clear();

    std::vector<ClusterInput> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(config_.input_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot read input directory " + config_.input_dir + ": " + ec.message());
    }
    const fs::path root = normalized(config_.input_dir);
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            if (entry_ec) {
                LOG_WARNING("Cannot stat " + entry.path().string() + ": " + entry_ec.message() + ", skipped");
            }
            continue;
        }
        std::string cluster_id = DomtableReader::cluster_id_from_path(entry.path().string());
        if (cluster_id.empty()) {
            continue;
        }
        found.push_back({cluster_id, sample_name(entry.path().parent_path(), root), entry.path().string()});
    }

    // Directory iteration order is unspecified
    std::sort(found.begin(), found.end(),
              [](const ClusterInput& a, const ClusterInput& b) { return a.domtable_path < b.domtable_path; });

    std::set<std::string> seen;
    for (auto& input : found) {
        if (!seen.insert(input.cluster_id).second) {
            LOG_WARNING("Duplicate cluster id " + input.cluster_id + " in " + input.domtable_path + ", skipped");
            continue;
        }
        clusters_.push_back(std::move(input));
    }

    std::sort(clusters_.begin(), clusters_.end(), [](const ClusterInput& a, const ClusterInput& b) {
        return a.sample != b.sample ? a.sample < b.sample : a.cluster_id < b.cluster_id;
    });
    for (const auto& input : clusters_) {
        samples_[input.sample].push_back(input.cluster_id);
    }

    LOG_INFO("Found " + std::to_string(clusters_.size()) + " clusters in " + std::to_string(samples_.size()) +
             " samples");
    return static_cast<int>(clusters_.size());
}

GroupMap ClusterProcessor::read_groups(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open groups file: " + path);
    }

    GroupMap groups;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t tab = line.find('\t');
        if (tab == std::string::npos || tab == 0 || tab + 1 >= line.size()) {
            LOG_WARNING("Skipping malformed group line " + std::to_string(line_no) + " in " + path);
            continue;
        }
        std::string cluster = line.substr(0, tab);
        std::string group = line.substr(tab + 1);
        size_t next_tab = group.find('\t');
        if (next_tab != std::string::npos) {
            group = group.substr(0, next_tab);
        }
        groups[cluster] = group;
    }
    return groups;
}

int ClusterProcessor::load_groups() {
    if (config_.groups_path.empty()) {
        return 0;
    }
    groups_ = read_groups(config_.groups_path);
    LOG_INFO("Loaded " + std::to_string(groups_.size()) + " group assignments from " + config_.groups_path);
    return static_cast<int>(groups_.size());
}

ClusterResult ClusterProcessor::process_single_cluster(const ClusterInput& input, const ClusterWriter& writer,
                                                       ClusterProfile& profile) const {
    ClusterResult result;
    result.cluster_id = input.cluster_id;
    result.sample = input.sample;

    auto t_start = std::chrono::steady_clock::now();

    try {
        std::vector<DomainHit> hits = DomtableReader::read(input.domtable_path, input.cluster_id);
        result.num_hits = static_cast<int>(hits.size());

        DomainOverlapResolver resolver(config_.overlap_cutoff);
        ResolvedDomains resolved = resolver.resolve(hits);
        result.num_removed = resolved.num_removed;

        profile = ClusterProfile::from_hits(input.cluster_id, resolved.hits);
        result.num_domains = profile.size();
        result.num_families = profile.num_families();

        writer.write_cluster(input.cluster_id, resolved.hits, resolved.domains);

        if (profile.empty()) {
            LOG_WARNING("Cluster " + input.cluster_id + " has no domains; it is at distance 1 from every cluster");
        }
        result.success = true;
    } catch (const MalformedRecordError& e) {
        result.success = false;
        result.error_message = e.what();
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    auto t_end = std::chrono::steady_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    return result;
}

std::vector<ClusterResult> ClusterProcessor::process_all_clusters() {
    const int n = static_cast<int>(clusters_.size());
    LOG_INFO("Processing " + std::to_string(n) + " clusters with " + std::to_string(config_.threads) + " threads...");

    ClusterWriter writer(config_.output_dir);
    std::vector<ClusterResult> results(n);
    std::vector<ClusterProfile> profiles(n);

    auto t_start = std::chrono::steady_clock::now();

#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; i++) {
        results[i] = process_single_cluster(clusters_[i], writer, profiles[i]);

        if (results[i].success) {
            std::stringstream ss;
            ss << "Cluster " << results[i].cluster_id << " (" << results[i].sample << ") completed: "
               << results[i].num_domains << " domains, " << results[i].num_removed << " overlaps removed, "
               << results[i].elapsed_ms << " ms";
            LOG_DEBUG(ss.str());
        } else {
            LOG_ERROR("Cluster " + results[i].cluster_id + " failed: " + results[i].error_message);
        }
    }

    auto t_end = std::chrono::steady_clock::now();
    double total_elapsed = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    profiles_.clear();
    const ClusterResult* first_failure = nullptr;
    for (int i = 0; i < n; i++) {
        if (results[i].success) {
            profiles_.emplace(results[i].cluster_id, std::move(profiles[i]));
        } else if (!first_failure) {
            first_failure = &results[i];
        }
    }

    LOG_INFO("All clusters processed in " + std::to_string(total_elapsed) + " ms");

    if (config_.fail_fast && first_failure) {
        throw std::runtime_error("Cluster " + first_failure->cluster_id + " failed: " + first_failure->error_message);
    }
    return results;
}

std::string ClusterProcessor::family_distance_path(const std::string& family) const {
    const char* suffix = config_.dms_source == DmsSource::DISTOUT ? kDistoutSuffix : kAlignmentSuffix;
    return (fs::path(config_.alignment_dir) / (family + suffix)).string();
}

int ClusterProcessor::load_domain_distances() {
    Utils::ScopedLogger scoped("Load domain distances from " + config_.alignment_dir);

    // Families with at least two instances across all clusters
    std::map<std::string, int> instance_counts;
    for (const auto& kv : profiles_) {
        for (const auto& fam : kv.second.instances) {
            instance_counts[fam.first] += static_cast<int>(fam.second.size());
        }
    }
    std::vector<std::string> families;
    for (const auto& kv : instance_counts) {
        if (kv.second >= 2) {
            families.push_back(kv.first);
        }
    }

    const int n = static_cast<int>(families.size());
    std::vector<std::vector<DomainPairDistance>> family_pairs(n);
    std::vector<std::string> errors(n);
    std::vector<char> loaded(n, 0);

#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; i++) {
        const std::string path = family_distance_path(families[i]);
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        if (ec) {
            errors[i] = "Cannot stat " + path + ": " + ec.message();
            continue;
        }
        if (!exists) {
            LOG_WARNING("No distance file for " + families[i] + " (" + path + "); using fallback distance " +
                        std::to_string(DomainDistanceMatrix::kMissingPairDistance));
            continue;
        }
        try {
            if (config_.dms_source == DmsSource::DISTOUT) {
                family_pairs[i] = DistoutReader::read(path);
            } else {
                AlignmentReader alignment(path);
                family_pairs[i] = alignment.pairwise_dissimilarities();
            }
            loaded[i] = 1;
        } catch (const MalformedRecordError& e) {
            errors[i] = e.what();
        } catch (const std::exception& e) {
            errors[i] = e.what();
        }
    }

    int num_loaded = 0;
    std::string first_error;
    for (int i = 0; i < n; i++) {
        if (!errors[i].empty()) {
            LOG_ERROR("Skipping distances of " + families[i] + ": " + errors[i]);
            if (first_error.empty()) {
                first_error = errors[i];
            }
            continue;
        }
        if (loaded[i]) {
            dms_.add_family(families[i], family_pairs[i]);
            num_loaded++;
        }
    }

    LOG_INFO("Loaded distances for " + std::to_string(num_loaded) + " of " + std::to_string(n) +
             " multi-instance families (" + std::to_string(dms_.num_pairs()) + " pairs)");

    if (config_.fail_fast && !first_error.empty()) {
        throw std::runtime_error(first_error);
    }
    return num_loaded;
}

NetworkResult ClusterProcessor::build_network(const NetworkAssembler& assembler, const std::string& name,
                                              const std::vector<std::string>& cluster_ids, DistanceMode mode) const {
    auto t_start = std::chrono::steady_clock::now();

    ClusterNetwork network = assembler.assemble(name, cluster_ids, profiles_, groups_);

    NetworkWriter writer(config_.output_dir);
    NetworkResult result;
    result.name = name;
    result.mode = mode;
    result.num_clusters = network.size();
    result.num_pairs = static_cast<int>(network.edges.size());
    result.num_empty_pairs = network.num_empty_pairs;

    for (const auto& cutoff_str : config_.sim_cutoffs) {
        double cutoff = 0.0;
        if (!parse_cutoff(cutoff_str, cutoff)) {
            throw std::invalid_argument("Invalid similarity cutoff: " + cutoff_str);
        }
        std::string path = writer.network_path(network, cutoff_str);
        size_t rows = writer.write_network(path, network.edges, cutoff);
        result.rows_per_cutoff.push_back(rows);
        LOG_DEBUG("Wrote " + std::to_string(rows) + " edges to " + path);
    }

    if (config_.output_distance_matrix) {
        writer.write_distance_matrix(writer.matrix_path(network), network);
    }

    auto t_end = std::chrono::steady_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    LOG_INFO("Network " + mode_to_string(mode) + "/" + name + ": " + std::to_string(result.num_clusters) +
             " clusters, " + std::to_string(result.num_pairs) + " pairs");
    return result;
}

std::vector<NetworkResult> ClusterProcessor::build_networks() {
    std::vector<NetworkResult> results;

    for (DistanceMode mode : config_.distance_modes) {
        Utils::ScopedLogger scoped("Build " + mode_to_string(mode) + " networks");

        DistanceCalculator calculator(config_.distance_config(mode),
                                      mode == DistanceMode::SEQDIST ? &dms_ : nullptr);
        NetworkAssembler assembler(calculator, config_.threads);

        std::vector<std::string> all_ids;
        for (const auto& kv : samples_) {
            std::vector<std::string> ids;
            for (const auto& id : kv.second) {
                if (profiles_.count(id)) {
                    ids.push_back(id);
                }
            }
            all_ids.insert(all_ids.end(), ids.begin(), ids.end());

            if (ids.size() < 2) {
                LOG_INFO("Sample " + kv.first + " has fewer than two clusters; no network written");
                continue;
            }
            results.push_back(build_network(assembler, kv.first, ids, mode));
        }

        if (samples_.size() >= 2 && all_ids.size() >= 2) {
            results.push_back(build_network(assembler, kAllVsAll, all_ids, mode));
        }
    }
    return results;
}

void ClusterProcessor::print_summary(const std::vector<ClusterResult>& results,
                                     const std::vector<NetworkResult>& networks) const {
    int success_count = 0;
    int total_hits = 0;
    int total_removed = 0;
    int total_domains = 0;
    int empty_clusters = 0;
    double total_time = 0.0;

    for (const auto& r : results) {
        if (r.success) {
            success_count++;
            total_hits += r.num_hits;
            total_removed += r.num_removed;
            total_domains += r.num_domains;
            total_time += r.elapsed_ms;
            if (r.num_domains == 0) {
                empty_clusters++;
            }
        }
    }

    std::stringstream ss;
    ss << "\n=== Processing Summary ===\n"
       << "Total clusters: " << results.size() << "\n"
       << "Successful: " << success_count << "\n"
       << "Failed: " << (results.size() - success_count) << "\n"
       << "Clusters without domains: " << empty_clusters << "\n"
       << "Domain hits read: " << total_hits << "\n"
       << "  Removed as overlapping: " << total_removed << "\n"
       << "Domains kept: " << total_domains << "\n"
       << "Average domains per cluster: "
       << (success_count > 0 ? (total_domains / static_cast<double>(success_count)) : 0) << "\n"
       << "Total processing time: " << total_time << " ms\n";

    if (!networks.empty()) {
        ss << "\n=== Network Summary ===\n";
        for (const auto& n : networks) {
            ss << mode_to_string(n.mode) << "/" << n.name << ": " << n.num_clusters << " clusters, " << n.num_pairs
               << " pairs";
            if (n.num_empty_pairs > 0) {
                ss << " (" << n.num_empty_pairs << " with an empty cluster)";
            }
            for (size_t c = 0; c < n.rows_per_cutoff.size() && c < config_.sim_cutoffs.size(); ++c) {
                ss << ", c" << config_.sim_cutoffs[c] << "=" << n.rows_per_cutoff[c];
            }
            ss << ", " << std::fixed << std::setprecision(1) << n.elapsed_ms << " ms\n";
            ss.unsetf(std::ios::fixed);
        }
    }

    LOG_INFO(ss.str());
}

}  // namespace BgcNet
