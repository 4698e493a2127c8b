#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/DomainDistanceMatrix.hpp"

namespace BgcNet {

/**
 * @brief Reads mafft `--distout` (.hat2) distance files.
 *
 * ```
 *  1
 *    3
 *  1
 *    1. =PF00550_bgc1_cds1_10_80
 *    2. =PF00550_bgc2_cds4_12_82
 *    3. =PF00550_bgc2_cds9_5_77
 * 0.120 0.340
 * 0.560
 * ```
 * Line 2 is the sequence count N, lines 4..3+N name the sequences, and the
 * remaining tokens are the N(N-1)/2 upper-triangle distances in row order.
 */
class DistoutReader {
public:
    static constexpr const char* kSuffix = ".fasta.hat2";

    /**
     * @throws std::runtime_error if the file cannot be opened.
     * @throws MalformedRecordError if the file does not follow the layout above.
     */
    static std::vector<DomainPairDistance> read(const std::string& path);

    static std::vector<DomainPairDistance> parse(std::istream& in, const std::string& source = "<input>");
};

}  // namespace BgcNet
