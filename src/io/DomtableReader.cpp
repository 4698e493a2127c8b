#include "io/DomtableReader.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/Errors.hpp"

namespace BgcNet {

namespace fs = std::filesystem;

static double to_double(const std::string& field, const char* what, const std::string& source, int line_no) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(field, &pos);
    } catch (const std::exception&) {
        throw MalformedRecordError(source, line_no, std::string("non-numeric ") + what + " '" + field + "'");
    }
    if (pos != field.size() || !std::isfinite(value)) {
        throw MalformedRecordError(source, line_no, std::string("non-numeric ") + what + " '" + field + "'");
    }
    return value;
}

static int32_t to_int(const std::string& field, const char* what, const std::string& source, int line_no) {
    size_t pos = 0;
    long value = 0;
    try {
        value = std::stol(field, &pos);
    } catch (const std::exception&) {
        throw MalformedRecordError(source, line_no, std::string("invalid ") + what + " '" + field + "'");
    }
    if (pos != field.size() || value < 0 || value > INT32_MAX) {
        throw MalformedRecordError(source, line_no, std::string("invalid ") + what + " '" + field + "'");
    }
    return static_cast<int32_t>(value);
}

std::string DomtableReader::cluster_id_from_path(const std::string& path) {
    std::string name = fs::path(path).filename().string();
    const std::string suffix = kSuffix;
    if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return "";
    }
    return name.substr(0, name.size() - suffix.size());
}

std::string DomtableReader::parse_gene_id(const std::string& cds_header) {
    std::vector<std::string> parts;
    std::stringstream ss(cds_header);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (parts[i] == "gid") {
            return parts[i + 1];
        }
    }
    return "";
}

Strand DomtableReader::parse_strand(const std::string& cds_header) {
    if (cds_header.find("](+)") != std::string::npos) return Strand::FORWARD;
    if (cds_header.find("](-)") != std::string::npos) return Strand::REVERSE;
    return Strand::UNKNOWN;
}

DomainHit DomtableReader::parse_line(const std::string& line, const std::string& cluster_id, const std::string& source,
                                     int line_no) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (static_cast<int>(fields.size()) < kMinColumns && iss >> field) {
        fields.push_back(field);
    }
    if (static_cast<int>(fields.size()) < kMinColumns) {
        throw MalformedRecordError(source, line_no,
                                   "expected at least " + std::to_string(kMinColumns) + " columns, found " +
                                       std::to_string(fields.size()));
    }

    DomainHit hit;
    hit.cluster_id = cluster_id;
    hit.family_name = fields[0];
    hit.accession = fields[1];
    hit.cds_id = fields[3];
    hit.score = to_double(fields[13], "domain score", source, line_no);
    hit.start = to_int(fields[19], "envelope start", source, line_no);
    hit.stop = to_int(fields[20], "envelope end", source, line_no);
    hit.gene_id = parse_gene_id(hit.cds_id);
    hit.strand = parse_strand(hit.cds_id);

    if (hit.start > hit.stop) {
        throw MalformedRecordError(source, line_no,
                                   "envelope start " + fields[19] + " after end " + fields[20]);
    }
    if (hit.family().empty()) {
        throw MalformedRecordError(source, line_no, "missing family name and accession");
    }
    return hit;
}

std::vector<DomainHit> DomtableReader::read(const std::string& path, const std::string& cluster_id) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open domain table: " + path);
    }

    std::vector<DomainHit> hits;
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
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        hits.push_back(parse_line(line, cluster_id, path, line_no));
    }
    return hits;
}

}  // namespace BgcNet
