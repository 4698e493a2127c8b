#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "utils/Logger.hpp"

namespace BgcNet {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * CLI11 handles type conversion and simple checks (existing paths, ranges,
     * allowed enum names); cross-field checks are left to Config::validate().
     *
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"bgc_net - domain-based distance networks of biosynthetic gene clusters"};

        // Input/Output
        app.add_option("-i,--input-dir", config.input_dir,
                       "Directory with <cluster>_domtable.txt files; each sub-directory is a sample (Required)")
            ->required()
            ->check(CLI::ExistingDirectory);

        app.add_option("-o,--output-dir", config.output_dir, "Output directory (Default: output)");

        app.add_option("-g,--groups", config.groups_path, "TSV mapping cluster id to group label (Optional)")
            ->check(CLI::ExistingFile);

        app.add_option("-a,--alignment-dir", config.alignment_dir,
                       "Per-family alignments / mafft distout files (Required for seqdist)");

        std::string dms_source_str = "distout";
        app.add_option("--dms-source", dms_source_str,
                       "Domain distance source: distout (<family>.fasta.hat2) or perc_id (<family>.algn)")
            ->check(CLI::IsMember({"distout", "perc_id"}, CLI::ignore_case));

        std::vector<std::string> mode_strs = {"domain_dist"};
        app.add_option("-m,--mode", mode_strs, "Distance mode(s): domain_dist, seqdist (Default: domain_dist)")
            ->delimiter(',')
            ->check(CLI::IsMember({"domain_dist", "seqdist"}, CLI::ignore_case));

        // Distance parameters
        app.add_option("-d,--domain-overlap-cutoff", config.overlap_cutoff,
                       "Overlap fraction at which the weaker domain is dropped (Default: 0.1)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("--jaccard-weight", config.jaccard_weight, "domain_dist Jaccard weight (Default: 0.4)")
            ->check(CLI::NonNegativeNumber);
        app.add_option("--dds-weight", config.dds_weight, "domain_dist duplication weight (Default: 0.2)")
            ->check(CLI::NonNegativeNumber);
        app.add_option("--gk-weight", config.gk_weight, "domain_dist synteny weight (Default: 0.4)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("--nbhood", config.nbhood, "Synteny neighbourhood width (Default: 4)")
            ->check(CLI::PositiveNumber);

        // Network output
        app.add_option("--sim-cutoffs", config.sim_cutoffs,
                       "Squared-similarity cutoffs, comma separated; one network file each (Default: 0)")
            ->delimiter(',');

        app.add_flag("--distance-matrix,!--no-distance-matrix", config.output_distance_matrix,
                     "Write the dense cluster distance matrix CSV (Default: enabled)");

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        app.add_flag("--fail-fast", config.fail_fast, "Abort on the first malformed input file");

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Log file (Default: <output-dir>/<timestamp>.log)");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help (ret=0) and errors (ret>0) both stop execution
            app.exit(e);
            return false;
        }

        config.log_level = Logger::string_to_level(log_level_str);

        config.dms_source = to_lower(dms_source_str) == "perc_id" ? DmsSource::PERCENT_IDENTITY : DmsSource::DISTOUT;

        config.distance_modes.clear();
        for (const auto& s : mode_strs) {
            DistanceMode mode = DistanceCalculator::string_to_mode(s);
            if (!config.uses_mode(mode)) {
                config.distance_modes.push_back(mode);
            }
        }

        return true;
    }

private:
    static std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s;
    }
};

}  // namespace Utils
}  // namespace BgcNet
