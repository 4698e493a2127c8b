#pragma once

#include <optional>
#include <string>
#include <vector>
#include <htslib/faidx.h>

#include "core/DomainDistanceMatrix.hpp"

namespace BgcNet {

/**
 * @brief RAII wrapper around an aligned (MSA) FASTA file indexed with HTSlib faidx.
 *
 * The `.fai` index is created next to the file when missing. Records are
 * fetched on demand.
 *
 * Thread-safety: each thread should own its reader.
 *
 * Usage:
 *   AlignmentReader aln("domains/PF00550.algn");
 *   auto pairs = aln.pairwise_dissimilarities();
 */
class AlignmentReader {
public:
    /**
     * @param path Aligned FASTA file.
     * @throws std::runtime_error if the file cannot be opened or indexed.
     */
    explicit AlignmentReader(const std::string& path);

    ~AlignmentReader();

    AlignmentReader(const AlignmentReader&) = delete;
    AlignmentReader& operator=(const AlignmentReader&) = delete;
    AlignmentReader(AlignmentReader&&) noexcept;
    AlignmentReader& operator=(AlignmentReader&&) noexcept;

    int num_records() const;

    /// Record names in file order.
    std::vector<std::string> record_names() const;

    /**
     * @brief Full aligned sequence of a record, uppercased.
     * @throws std::out_of_range if the record does not exist.
     */
    std::string fetch(const std::string& name) const;

    /**
     * @brief Dissimilarity (1 - identity/100) for every unordered record pair.
     *
     * Pairs without any aligned residue are left out.
     * @throws MalformedRecordError if two records have different aligned lengths.
     */
    std::vector<DomainPairDistance> pairwise_dissimilarities() const;

    /**
     * @brief Percent identity of two aligned sequences.
     *
     * matches * 100 / min(len(a), len(b)) where lengths exclude leading and
     * trailing gaps and a position matches if both characters are equal and
     * not both gaps. Returns std::nullopt if either sequence is all gaps.
     *
     * @throws std::invalid_argument if the sequences differ in length.
     */
    static std::optional<double> percent_identity(const std::string& a, const std::string& b);

    const std::string& get_path() const { return path_; }

private:
    std::string path_;
    faidx_t* fai_;
};

}  // namespace BgcNet
