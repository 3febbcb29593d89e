#include <catch2/catch.hpp>

#include <thread>
#include <vector>

#include "logs/log_buffer.h"

namespace log_buffer_tests {

using namespace nodeward;

TEST_CASE("LogBuffer keeps lines in insertion order", "[logs]") {
    LogBuffer logs;
    logs.append("first");
    logs.append("second");

    auto lines = logs.lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].text == "first");
    CHECK(lines[1].text == "second");
    CHECK(lines[0].timestamp <= lines[1].timestamp);
}

TEST_CASE("LogBuffer evicts the oldest line past capacity", "[logs]") {
    LogBuffer logs;
    REQUIRE(logs.capacity() == 1000);

    for (int i = 0; i < 1001; ++i) {
        logs.append("line " + std::to_string(i));
    }

    auto lines = logs.lines();
    REQUIRE(lines.size() == 1000);
    CHECK(lines.front().text == "line 1");
    CHECK(lines.back().text == "line 1000");
}

TEST_CASE("LogBuffer clear empties it regardless of size", "[logs]") {
    LogBuffer logs(10);
    for (int i = 0; i < 25; ++i) logs.append("x");
    CHECK(logs.size() == 10);

    logs.clear();
    CHECK(logs.size() == 0);
    CHECK(logs.text().empty());
}

TEST_CASE("LogBuffer renders timestamped text", "[logs]") {
    LogBuffer logs;
    logs.append("STDOUT: hello\r");

    auto text = logs.text();
    REQUIRE(text.size() > 2);
    CHECK(text.front() == '[');
    CHECK(text.find(" UTC] STDOUT: hello\n") != std::string::npos);
    CHECK(text.find('\r') == std::string::npos);
}

TEST_CASE("LogBuffer tolerates concurrent appenders", "[logs]") {
    LogBuffer logs(500);
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&logs] {
            for (int i = 0; i < 300; ++i) logs.append("w");
        });
    }
    for (auto& w : writers) w.join();
    CHECK(logs.size() == 500);
}

}  // namespace log_buffer_tests
