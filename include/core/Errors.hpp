#pragma once

#include <stdexcept>
#include <string>

namespace BgcNet {

/**
 * @brief An input record is missing a field or carries an unusable value.
 *
 * Carries the file and line so the offending record can be located.
 */
class MalformedRecordError : public std::runtime_error {
public:
    MalformedRecordError(const std::string& source, int line, const std::string& reason)
        : std::runtime_error(format(source, line, reason)), source_(source), line_(line) {}

    const std::string& source() const { return source_; }

    /// 1-based line number, 0 if the error is not tied to a line.
    int line() const { return line_; }

private:
    std::string source_;
    int line_;

    static std::string format(const std::string& source, int line, const std::string& reason) {
        std::string msg = "Malformed record in " + source;
        if (line > 0) {
            msg += " (line " + std::to_string(line) + ")";
        }
        return msg + ": " + reason;
    }
};

}  // namespace BgcNet
