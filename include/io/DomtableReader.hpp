#pragma once

#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace BgcNet {

/**
 * @brief Reads hmmscan `--domtblout` tables into domain hits.
 *
 * Column layout (whitespace separated, 0-based):
 * ```
 * 0  target name   -> family_name
 * 1  accession     -> accession
 * 3  query name    -> cds_id   (loc:[2341:3538](+):gid:<gene>:pid::loc_tag:[...])
 * 13 domain score  -> score
 * 19 env from      -> start
 * 20 env to        -> stop
 * ```
 * The trailing description column may contain spaces; only the first 22
 * fields are required.
 */
class DomtableReader {
public:
    static constexpr const char* kSuffix = "_domtable.txt";
    static constexpr int kMinColumns = 22;

    /**
     * @brief Reads all hits of one cluster, in file order.
     *
     * @param path Domain table path.
     * @param cluster_id Cluster the hits belong to.
     * @throws std::runtime_error if the file cannot be opened.
     * @throws MalformedRecordError on the first unusable line.
     */
    static std::vector<DomainHit> read(const std::string& path, const std::string& cluster_id);

    /**
     * @brief Parses one non-comment line.
     * @throws MalformedRecordError if a field is missing or unusable.
     */
    static DomainHit parse_line(const std::string& line, const std::string& cluster_id,
                                const std::string& source = "<input>", int line_no = 0);

    /**
     * @brief Cluster id of a domain table: the file name without "_domtable.txt".
     *
     * Returns an empty string if the name does not carry the suffix.
     */
    static std::string cluster_id_from_path(const std::string& path);

    /// Gene id following the "gid" field of a CDS header, empty if absent.
    static std::string parse_gene_id(const std::string& cds_header);

    /// Strand marker "(+)" / "(-)" of a CDS header.
    static Strand parse_strand(const std::string& cds_header);
};

}  // namespace BgcNet
