#include <filesystem>
#include <iostream>

#include "core/ClusterProcessor.hpp"
#include "core/Config.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    BgcNet::Utils::ResourceMonitor monitor;

    BgcNet::Config config;

    if (!BgcNet::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    auto& logger = BgcNet::Utils::Logger::instance();
    logger.set_log_level(config.log_level);

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec) {
        LOG_ERROR("Cannot create output directory " + config.output_dir + ": " + ec.message());
        return 1;
    }

    const std::string log_path = config.get_log_path();
    if (!logger.set_log_file(log_path)) {
        LOG_WARNING("Cannot open log file " + log_path + "; logging to console only");
    }

    config.print();
    LOG_INFO("Configuration valid. Log file: " + log_path);

    try {
        BgcNet::ClusterProcessor processor(config);

        BgcNet::Utils::ScopedLogger main_scope("Main Execution");

        LOG_INFO("[1] Discovering clusters...");
        int num_clusters = processor.discover_clusters();
        if (num_clusters == 0) {
            LOG_ERROR("No *_domtable.txt files found under " + config.input_dir + ". Exiting.");
            return 1;
        }
        processor.load_groups();

        LOG_INFO("[2] Processing " + std::to_string(num_clusters) + " clusters...");
        auto results = processor.process_all_clusters();

        if (config.uses_mode(BgcNet::DistanceMode::SEQDIST)) {
            LOG_INFO("[3] Loading domain distances...");
            processor.load_domain_distances();
        }

        LOG_INFO("[4] Building networks...");
        auto networks = processor.build_networks();

        processor.print_summary(results, networks);
        LOG_INFO("Output directory: " + config.output_dir);

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    LOG_INFO(monitor.format_stats("Total Execution"));

    return 0;
}
