/**
 * LogBuffer — ring of the node's most recent output lines.
 */

#include "logs/log_buffer.h"

#include <ctime>

#include <spdlog/fmt/fmt.h>

namespace nodeward {

LogBuffer::LogBuffer(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void LogBuffer::append(std::string text) {
    // Strip the CR left behind by CRLF output.
    if (!text.empty() && text.back() == '\r') text.pop_back();

    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(LogLine{std::chrono::system_clock::now(), std::move(text)});
    while (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

void LogBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

std::vector<LogLine> LogBuffer::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {lines_.begin(), lines_.end()};
}

std::string LogBuffer::text() const {
    std::string out;
    for (const auto& line : lines()) {
        out += format_line(line);
        out += '\n';
    }
    return out;
}

std::size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

std::string LogBuffer::format_line(const LogLine& line) {
    std::time_t t = std::chrono::system_clock::to_time_t(line.timestamp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    return fmt::format("[{} UTC] {}", stamp, line.text);
}

}  // namespace nodeward
