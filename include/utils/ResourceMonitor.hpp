#pragma once

#include <sys/resource.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace BgcNet {
namespace Utils {

/**
 * @brief Wall time and memory probe for pipeline stages and tests.
 *
 * Memory is the jemalloc "stats.allocated" counter when built with
 * USE_JEMALLOC, otherwise the process peak resident set size.
 */
class ResourceMonitor {
public:
    ResourceMonitor() { reset(); }

    void reset() { start_time_ = std::chrono::steady_clock::now(); }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    // Bytes; 0 when no source is available
    size_t get_memory_usage() const {
#ifdef USE_JEMALLOC
        size_t allocated = 0;
        size_t sz = sizeof(size_t);
        // epoch must be advanced to refresh the cached stats
        uint64_t epoch = 1;
        size_t epoch_sz = sizeof(epoch);
        mallctl("epoch", &epoch, &epoch_sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &allocated, &sz, nullptr, 0) != 0) {
            return 0;
        }
        return allocated;
#else
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) != 0) {
            return 0;
        }
        // ru_maxrss is in kilobytes on Linux
        return static_cast<size_t>(usage.ru_maxrss) * 1024;
#endif
    }

    static const char* memory_label() {
#ifdef USE_JEMALLOC
        return "Allocated";
#else
        return "Peak RSS";
#endif
    }

    std::string format_stats(const std::string& label = "Execution") const {
        std::ostringstream os;
        os << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s, "
           << memory_label() << ": " << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
        return os.str();
    }

    void print_stats(const std::string& label = "Execution") const { std::cout << format_stats(label) << std::endl; }

private:
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace BgcNet
