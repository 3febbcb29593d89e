#include <catch2/catch.hpp>

#include "core/node_config.h"
#include "core/run_state.h"

namespace node_config_tests {

using namespace nodeward;
using json = nlohmann::json;

TEST_CASE("NodeConfig accepts the port range boundaries", "[config][validation]") {
    CHECK(NodeConfig{"data/node1", 1, 65535}.validate().is_ok());
    CHECK(NodeConfig{"data/node1", 65535, 1}.validate().is_ok());
}

TEST_CASE("NodeConfig rejects ports outside 1-65535", "[config][validation]") {
    struct Case {
        int api;
        int p2p;
    };
    static constexpr Case cases[] = {{0, 2000}, {65536, 2000}, {8080, 0}, {8080, 70000}, {-1, 2000}};

    for (const auto& c : cases) {
        auto status = NodeConfig{"data/node1", c.api, c.p2p}.validate();
        INFO("api=" << c.api << " p2p=" << c.p2p);
        REQUIRE_FALSE(status.is_ok());
        CHECK(status.error().code == ErrorCode::InvalidConfig);
        CHECK(status.error().kind() == ErrorKind::Validation);
    }
}

TEST_CASE("NodeConfig rejects a blank data path", "[config][validation]") {
    auto status = NodeConfig{"   ", 8080, 2000}.validate();
    REQUIRE_FALSE(status.is_ok());
    CHECK(status.error().message == "Database path is not set.");
}

TEST_CASE("NodeConfig parses the UI payload", "[config][json]") {
    auto parsed = NodeConfig::from_json(
        json{{"dbPath", "  data/data1/node1 "}, {"apiPort", 8080}, {"p2pPort", "2000"}});
    REQUIRE(parsed.is_ok());
    CHECK(parsed.value().db_path == "data/data1/node1");
    CHECK(parsed.value().api_port == 8080);
    CHECK(parsed.value().p2p_port == 2000);
}

TEST_CASE("NodeConfig rejects non-numeric ports", "[config][json]") {
    for (const json& port : {json("80a"), json(""), json(12.5), json(nullptr), json("99999")}) {
        auto parsed = NodeConfig::from_json(json{{"dbPath", "d"}, {"apiPort", port}, {"p2pPort", 2000}});
        INFO(port.dump());
        REQUIRE_FALSE(parsed.is_ok());
        CHECK(parsed.error().code == ErrorCode::InvalidConfig);
    }
    CHECK_FALSE(NodeConfig::from_json(json{{"dbPath", "d"}, {"apiPort", 8080}}).is_ok());
    CHECK_FALSE(NodeConfig::from_json(json::array()).is_ok());
}

TEST_CASE("Run state transitions follow the lifecycle", "[config][state]") {
    CHECK(is_valid_transition(RunState::Stopped, RunState::Starting));
    CHECK(is_valid_transition(RunState::Stopped, RunState::Updating));
    CHECK(is_valid_transition(RunState::Starting, RunState::Stopped));
    CHECK(is_valid_transition(RunState::Updating, RunState::Stopped));
    CHECK_FALSE(is_valid_transition(RunState::Running, RunState::Updating));
    CHECK_FALSE(is_valid_transition(RunState::Updating, RunState::Running));
    CHECK_FALSE(is_valid_transition(RunState::Stopped, RunState::Running));
    CHECK_FALSE(is_valid_transition(RunState::Stopping, RunState::Running));
}

}  // namespace node_config_tests
