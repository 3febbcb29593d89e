#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace nodeward {

struct LogLine {
    std::chrono::system_clock::time_point timestamp;
    std::string                           text;
};

/**
 * Bounded, append-only store of captured output lines.
 *
 * Once `capacity` lines are held, each append evicts the oldest one.
 * Safe to use from the output reader threads and the API thread at once.
 */
class LogBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit LogBuffer(std::size_t capacity = kDefaultCapacity);

    /// Stamps `text` with the current time and stores it.
    void append(std::string text);

    /// Drops every line.
    void clear();

    [[nodiscard]] std::vector<LogLine> lines() const;

    /// All lines rendered as `[YYYY-MM-DD HH:MM:SS UTC] text`, one per row.
    [[nodiscard]] std::string text() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

    static std::string format_line(const LogLine& line);

private:
    const std::size_t   capacity_;
    mutable std::mutex  mutex_;
    std::deque<LogLine> lines_;
};

}  // namespace nodeward
