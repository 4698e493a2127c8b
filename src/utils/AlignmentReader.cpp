#include "utils/AlignmentReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "core/Errors.hpp"

namespace BgcNet {

AlignmentReader::AlignmentReader(const std::string& path) : path_(path), fai_(nullptr) {
    // Builds <path>.fai when it does not exist yet
    fai_ = fai_load3(path.c_str(), nullptr, nullptr, FAI_CREATE);
    if (!fai_) {
        throw std::runtime_error("Failed to load or index alignment: " + path);
    }
}

AlignmentReader::~AlignmentReader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

AlignmentReader::AlignmentReader(AlignmentReader&& other) noexcept
    : path_(std::move(other.path_)), fai_(other.fai_) {
    other.fai_ = nullptr;
}

AlignmentReader& AlignmentReader::operator=(AlignmentReader&& other) noexcept {
    if (this != &other) {
        if (fai_) {
            fai_destroy(fai_);
        }
        path_ = std::move(other.path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

int AlignmentReader::num_records() const {
    return fai_ ? faidx_nseq(fai_) : 0;
}

std::vector<std::string> AlignmentReader::record_names() const {
    std::vector<std::string> names;
    const int n = num_records();
    names.reserve(n);
    for (int i = 0; i < n; ++i) {
        names.emplace_back(faidx_iseq(fai_, i));
    }
    return names;
}

std::string AlignmentReader::fetch(const std::string& name) const {
    if (!fai_ || !faidx_has_seq(fai_, name.c_str())) {
        throw std::out_of_range("No record '" + name + "' in " + path_);
    }

    const int seq_len = faidx_seq_len(fai_, name.c_str());
    if (seq_len <= 0) {
        return "";
    }

    int len = 0;
    char* seq = faidx_fetch_seq(fai_, name.c_str(), 0, seq_len - 1, &len);
    if (!seq || len < 0) {
        if (seq) free(seq);
        throw std::runtime_error("Failed to fetch record '" + name + "' from " + path_);
    }

    std::string result(seq, len);
    free(seq);

    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::optional<double> AlignmentReader::percent_identity(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Aligned sequences differ in length (" + std::to_string(a.size()) + " vs " +
                                    std::to_string(b.size()) + ")");
    }

    auto core_length = [](const std::string& s) -> size_t {
        size_t first = s.find_first_not_of('-');
        if (first == std::string::npos) return 0;
        size_t last = s.find_last_not_of('-');
        return last - first + 1;
    };

    const size_t aligned_length = std::min(core_length(a), core_length(b));
    if (aligned_length == 0) {
        return std::nullopt;
    }

    size_t matches = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] == b[i] && a[i] != '-') {
            matches++;
        }
    }
    return static_cast<double>(matches) * 100.0 / static_cast<double>(aligned_length);
}

std::vector<DomainPairDistance> AlignmentReader::pairwise_dissimilarities() const {
    std::vector<std::string> names = record_names();
    std::vector<std::string> seqs;
    seqs.reserve(names.size());
    for (const auto& name : names) {
        seqs.push_back(fetch(name));
    }

    for (size_t i = 1; i < names.size(); ++i) {
        if (seqs[i].size() != seqs[0].size()) {
            throw MalformedRecordError(path_, 0,
                                       "record '" + names[i] + "' has aligned length " +
                                           std::to_string(seqs[i].size()) + ", expected " +
                                           std::to_string(seqs[0].size()));
        }
    }

    std::vector<DomainPairDistance> pairs;
    for (size_t i = 0; i < names.size(); ++i) {
        for (size_t j = i + 1; j < names.size(); ++j) {
            std::optional<double> pid = percent_identity(seqs[i], seqs[j]);
            if (pid) {
                pairs.push_back({names[i], names[j], 1.0 - *pid / 100.0});
            }
        }
    }
    return pairs;
}

}  // namespace BgcNet
