#include "io/DistoutReader.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/Errors.hpp"

namespace BgcNet {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static long parse_count(const std::string& text, const std::string& source, int line_no, const char* what) {
    std::string t = trim(text);
    size_t pos = 0;
    long value = -1;
    try {
        value = std::stol(t, &pos);
    } catch (const std::exception&) {
        throw MalformedRecordError(source, line_no, std::string("invalid ") + what + " '" + t + "'");
    }
    if (pos != t.size() || value < 0) {
        throw MalformedRecordError(source, line_no, std::string("invalid ") + what + " '" + t + "'");
    }
    return value;
}

std::vector<DomainPairDistance> DistoutReader::read(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open distance file: " + path);
    }
    return parse(in, path);
}

std::vector<DomainPairDistance> DistoutReader::parse(std::istream& in, const std::string& source) {
    std::string line;
    int line_no = 0;
    long num_seqs = -1;
    std::vector<std::string> headers;
    std::vector<double> distances;

    while (std::getline(in, line)) {
        line_no++;
        if (line_no == 1 || line_no == 3) {
            continue;
        }
        if (line_no == 2) {
            num_seqs = parse_count(line, source, line_no, "sequence count");
            headers.assign(num_seqs, "");
            continue;
        }

        if (line_no <= 3 + num_seqs) {
            // "   k. =header"; the header itself may contain '='
            size_t eq = line.find('=');
            size_t dot = line.find('.');
            if (eq == std::string::npos || dot == std::string::npos || dot > eq) {
                throw MalformedRecordError(source, line_no, "expected '<k>. =<name>'");
            }
            long k = parse_count(line.substr(0, dot), source, line_no, "sequence number");
            if (k < 1 || k > num_seqs || !headers[k - 1].empty()) {
                throw MalformedRecordError(source, line_no, "sequence number " + std::to_string(k) + " out of place");
            }
            std::string header = trim(line.substr(eq + 1));
            if (header.empty()) {
                throw MalformedRecordError(source, line_no, "empty sequence name");
            }
            headers[k - 1] = header;
            continue;
        }

        std::istringstream iss(line);
        std::string token;
        while (iss >> token) {
            size_t pos = 0;
            double d = 0.0;
            try {
                d = std::stod(token, &pos);
            } catch (const std::exception&) {
                throw MalformedRecordError(source, line_no, "non-numeric distance '" + token + "'");
            }
            if (pos != token.size() || !std::isfinite(d)) {
                throw MalformedRecordError(source, line_no, "non-numeric distance '" + token + "'");
            }
            distances.push_back(d);
        }
    }

    if (num_seqs < 0) {
        throw MalformedRecordError(source, 0, "missing sequence count");
    }
    if (line_no < 3 + num_seqs) {
        throw MalformedRecordError(source, 0,
                                   "declared " + std::to_string(num_seqs) + " sequences but the name block is truncated");
    }

    const size_t expected = static_cast<size_t>(num_seqs) * (num_seqs > 0 ? num_seqs - 1 : 0) / 2;
    if (distances.size() != expected) {
        throw MalformedRecordError(source, 0,
                                   "expected " + std::to_string(expected) + " distances, found " +
                                       std::to_string(distances.size()));
    }

    std::vector<DomainPairDistance> pairs;
    pairs.reserve(expected);
    size_t k = 0;
    for (long i = 0; i < num_seqs; ++i) {
        for (long j = i + 1; j < num_seqs; ++j) {
            pairs.push_back({headers[i], headers[j], distances[k++]});
        }
    }
    return pairs;
}

}  // namespace BgcNet
