#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "PairwiseDistance.hpp"
#include "Types.hpp"

namespace BgcNet {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Filled by ArgParser (CLI11 handles basic type and range checks) and
 * checked as a whole by validate().
 */
struct Config {
    // Input/Output
    std::string input_dir;              ///< Directory scanned for <cluster>_domtable.txt files (Required)
    std::string output_dir = "output";  ///< Root of .pfd/.pfs, network and matrix outputs
    std::string groups_path;            ///< Optional TSV "cluster<TAB>group"
    std::string alignment_dir;          ///< Per-family alignment artifacts (required for seqdist)

    DmsSource dms_source = DmsSource::DISTOUT;  ///< Where domain distances come from

    // Distance parameters
    std::vector<DistanceMode> distance_modes = {DistanceMode::DOMAIN_DIST};  ///< Networks to build
    double overlap_cutoff = 0.1;  ///< Overlap fraction above which the weaker hit is dropped
    double jaccard_weight = 0.4;  ///< domain_dist Jaccard weight
    double dds_weight = 0.2;      ///< domain_dist duplication weight
    double gk_weight = 0.4;       ///< domain_dist synteny weight
    int nbhood = 4;               ///< Synteny neighbourhood width

    // Network output
    std::vector<std::string> sim_cutoffs = {"0"};  ///< Squared-similarity cutoffs, one network file each
    bool output_distance_matrix = true;            ///< Also write the dense distance matrix CSV

    int threads = 1;         ///< Number of OpenMP threads
    bool fail_fast = false;  ///< Abort on the first malformed cluster or distance file

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< If empty, <output_dir>/<timestamp>.log

    /**
     * @brief Validates paths and parameter combinations.
     *
     * Every problem is reported on stderr, not just the first one.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    /**
     * @brief Returns the effective log file path.
     */
    std::string get_log_path() const;

    /**
     * @brief Distance parameters for one mode.
     */
    DistanceConfig distance_config(DistanceMode mode) const {
        DistanceConfig dc;
        dc.mode = mode;
        dc.jaccard_weight = jaccard_weight;
        dc.dds_weight = dds_weight;
        dc.gk_weight = gk_weight;
        dc.nbhood = nbhood;
        return dc;
    }

    bool uses_mode(DistanceMode mode) const;
};

/**
 * @brief Parses a similarity cutoff string; false if it is not a finite number.
 */
bool parse_cutoff(const std::string& text, double& value);

}  // namespace BgcNet
