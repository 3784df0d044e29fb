#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace strategy {

// One tagged console line, assembled in a buffer and written on destruction so
// concurrent market tasks never interleave mid-line:
//   log_info("Orders") << "Placed BUY " << size << " @ " << price;
class LogLine {
public:
    LogLine(std::ostream& out, std::string tag);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    std::ostream& out_;
    std::string tag_;
    std::ostringstream buffer_;
};

inline LogLine log_info(const std::string& tag) {
    return LogLine(std::cout, tag);
}

inline LogLine log_error(const std::string& tag) {
    return LogLine(std::cerr, tag);
}

// Serializes multi-line console output (cycle reports) against log lines.
void write_block(std::ostream& out, const std::string& text);

} // namespace strategy
