#include "core/Config.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace BgcNet {

namespace fs = std::filesystem;

bool parse_cutoff(const std::string& text, double& value) {
    size_t pos = 0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::exception&) {
        return false;
    }
    return pos == text.size() && std::isfinite(value);
}

static bool parent_exists(const fs::path& p) {
    fs::path parent = p.parent_path();
    return parent.empty() || fs::is_directory(parent);
}

bool Config::uses_mode(DistanceMode mode) const {
    return std::find(distance_modes.begin(), distance_modes.end(), mode) != distance_modes.end();
}

bool Config::validate() const {
    bool valid = true;

    if (input_dir.empty()) {
        std::cerr << "Error: Input directory is required." << std::endl;
        valid = false;
    } else if (!fs::is_directory(input_dir)) {
        std::cerr << "Error: Input directory does not exist: " << input_dir << std::endl;
        valid = false;
    }

    if (output_dir.empty()) {
        std::cerr << "Error: Output directory must not be empty." << std::endl;
        valid = false;
    } else if (fs::exists(output_dir) && !fs::is_directory(output_dir)) {
        std::cerr << "Error: Output path exists and is not a directory: " << output_dir << std::endl;
        valid = false;
    } else if (!fs::exists(output_dir) && !parent_exists(fs::path(output_dir))) {
        std::cerr << "Error: Parent of output directory does not exist: " << output_dir << std::endl;
        valid = false;
    }

    if (!log_file.empty()) {
        if (fs::is_directory(log_file)) {
            std::cerr << "Error: Log file path is a directory: " << log_file << std::endl;
            valid = false;
        } else if (!parent_exists(fs::path(log_file))) {
            std::cerr << "Error: Parent of log file does not exist: " << log_file << std::endl;
            valid = false;
        }
    }

    if (!groups_path.empty() && !fs::is_regular_file(groups_path)) {
        std::cerr << "Error: Groups file does not exist: " << groups_path << std::endl;
        valid = false;
    }

    if (distance_modes.empty()) {
        std::cerr << "Error: At least one distance mode is required." << std::endl;
        valid = false;
    }

    if (uses_mode(DistanceMode::SEQDIST)) {
        if (alignment_dir.empty()) {
            std::cerr << "Error: seqdist requires an alignment directory." << std::endl;
            valid = false;
        } else if (!fs::is_directory(alignment_dir)) {
            std::cerr << "Error: Alignment directory does not exist: " << alignment_dir << std::endl;
            valid = false;
        }
    }

    for (double w : {jaccard_weight, dds_weight, gk_weight}) {
        if (!std::isfinite(w) || w < 0.0) {
            std::cerr << "Error: Distance weights must be finite and non-negative." << std::endl;
            valid = false;
            break;
        }
    }

    if (!(overlap_cutoff >= 0.0 && overlap_cutoff <= 1.0)) {
        std::cerr << "Error: Overlap cutoff must be between 0.0 and 1.0." << std::endl;
        valid = false;
    }

    if (nbhood < 1) {
        std::cerr << "Error: nbhood must be at least 1." << std::endl;
        valid = false;
    }

    if (sim_cutoffs.empty()) {
        std::cerr << "Error: At least one similarity cutoff is required." << std::endl;
        valid = false;
    }
    for (const auto& c : sim_cutoffs) {
        double value = 0.0;
        if (!parse_cutoff(c, value)) {
            std::cerr << "Error: Similarity cutoff is not a number: " << c << std::endl;
            valid = false;
        }
    }

    if (threads < 1) {
        std::cerr << "Error: threads must be positive." << std::endl;
        valid = false;
    }

    return valid;
}

std::string Config::get_log_path() const {
    if (!log_file.empty()) {
        return log_file;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm time_info;
    localtime_r(&now, &time_info);
    std::ostringstream os;
    os << output_dir << "/" << std::put_time(&time_info, "%Y%m%d_%H%M%S") << ".log";
    return os.str();
}

void Config::print() const {
    std::cout << "--- Configuration ---" << std::endl;
    std::cout << "Input Dir: " << input_dir << std::endl;
    std::cout << "Output Dir: " << output_dir << std::endl;
    std::cout << "Groups: " << (groups_path.empty() ? "None" : groups_path) << std::endl;
    std::cout << "Distance Modes: ";
    for (size_t i = 0; i < distance_modes.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << mode_to_string(distance_modes[i]);
    }
    std::cout << std::endl;
    if (uses_mode(DistanceMode::SEQDIST)) {
        std::cout << "Alignment Dir: " << alignment_dir << " ("
                  << (dms_source == DmsSource::DISTOUT ? "distout" : "percent identity") << ")" << std::endl;
    }
    std::cout << "Overlap Cutoff: " << overlap_cutoff << std::endl;
    std::cout << "Weights: Jaccard=" << jaccard_weight << ", DDS=" << dds_weight << ", GK=" << gk_weight << std::endl;
    std::cout << "Neighbourhood: " << nbhood << std::endl;
    std::cout << "Similarity Cutoffs: ";
    for (size_t i = 0; i < sim_cutoffs.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << sim_cutoffs[i];
    }
    std::cout << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "---------------------" << std::endl;
}

}  // namespace BgcNet
