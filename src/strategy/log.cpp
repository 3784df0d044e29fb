#include "strategy/log.hpp"

#include <mutex>
#include <utility>

namespace strategy {
namespace {

std::mutex& console_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

LogLine::LogLine(std::ostream& out, std::string tag)
    : out_(out),
      tag_(std::move(tag)) {}

LogLine::~LogLine() {
    std::lock_guard<std::mutex> lock(console_mutex());
    out_ << '[' << tag_ << "] " << buffer_.str() << std::endl;
}

void write_block(std::ostream& out, const std::string& text) {
    std::lock_guard<std::mutex> lock(console_mutex());
    out << text << std::flush;
}

} // namespace strategy
