#pragma once

#include <cstdint>
#include <string>

namespace BgcNet {

/**
 * @brief Cluster-to-cluster distance measure.
 *
 * - DOMAIN_DIST: Jaccard, duplication and synteny over the family sequence
 * - SEQDIST: Jaccard and sequence-identity-weighted duplication (needs a DMS)
 */
enum class DistanceMode {
    DOMAIN_DIST,
    SEQDIST
};

/**
 * @brief Where per-family domain distances come from.
 */
enum class DmsSource {
    DISTOUT,          ///< mafft --distout matrices (<family>.fasta.hat2)
    PERCENT_IDENTITY  ///< Percent identity computed over an MSA (<family>.algn)
};

/**
 * @brief Strand of the CDS carrying a domain hit.
 */
enum class Strand : uint8_t {
    FORWARD = 0,  ///< (+)
    REVERSE = 1,  ///< (-)
    UNKNOWN = 2   ///< Not encoded in the CDS header
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,  ///< Only errors
    LOG_WARN = 1,   ///< Errors and warnings
    LOG_INFO = 2,   ///< Normal operational messages
    LOG_DEBUG = 3   ///< Per-cluster and per-family detail
};

inline std::string mode_to_string(DistanceMode mode) {
    switch (mode) {
        case DistanceMode::DOMAIN_DIST:
            return "domain_dist";
        case DistanceMode::SEQDIST:
            return "seqdist";
        default:
            return "unknown";
    }
}

inline std::string strand_to_string(Strand s) {
    switch (s) {
        case Strand::FORWARD: return "+";
        case Strand::REVERSE: return "-";
        default: return "?";
    }
}

}  // namespace BgcNet
