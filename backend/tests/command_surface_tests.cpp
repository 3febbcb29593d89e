#include <catch2/catch.hpp>

#include <asio.hpp>
#include <chrono>
#include <thread>

#include "api/command_surface.h"
#include "api/event_journal.h"
#include "api/local_api.h"
#include "config/settings_store.h"
#include "node/supervisor.h"
#include "test_helpers.h"

namespace command_surface_tests {

using namespace nodeward;
using namespace nodeward::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

struct Fixture {
    TempDir        dir;
    SettingsStore  settings{dir.path() / "settings.json", dir.path() / "default"};
    Supervisor     supervisor{Downloader(file_url(dir.path() / "latest.json"), "openhash", "tests"),
                              1000ms};
    EventJournal   journal{supervisor.events()};
    CommandSurface commands{supervisor, settings, journal};

    json start_args(const json& api_port = 8080) const {
        return {{"config",
                 {{"dbPath", settings.current_data_path().string()},
                  {"apiPort", api_port},
                  {"p2pPort", 2000}}}};
    }
};

TEST_CASE_METHOD(Fixture, "Every UI command is registered", "[api]") {
    for (const char* name : {"get_default_data_path", "get_current_data_path", "set_custom_data_path",
                             "check_executable_exists", "start_node", "stop_node",
                             "check_and_download_update", "get_process_status", "get_logs",
                             "clear_logs", "get_status", "get_events"}) {
        INFO(name);
        CHECK(commands.has_command(name));
    }
    CHECK(commands.command_names().size() == 12);
}

TEST_CASE_METHOD(Fixture, "Data path commands round-trip", "[api]") {
    CHECK(commands.invoke("get_default_data_path", nullptr)["result"] ==
          (dir.path() / "default").string());

    auto custom = (dir.path() / "node1").string();
    auto set = commands.invoke("set_custom_data_path", {{"path", custom}});
    CHECK(set["ok"] == true);
    CHECK(commands.invoke("get_current_data_path", nullptr)["result"] == custom);
}

TEST_CASE_METHOD(Fixture, "Node commands drive the supervisor", "[api]") {
    REQUIRE(settings.set_custom_data_path((dir.path() / "node").string()).is_ok());
    CHECK(commands.invoke("check_executable_exists", json::object())["result"] == false);
    write_fake_node(settings.current_data_path(), kIdleNode);
    CHECK(commands.invoke("check_executable_exists",
                          {{"dbPath", settings.current_data_path().string()}})["result"] == true);

    auto started = commands.invoke("start_node", start_args());
    REQUIRE(started["ok"] == true);
    CHECK(started["result"] == true);
    CHECK(commands.invoke("get_process_status", nullptr)["result"] == true);

    auto twice = commands.invoke("start_node", start_args());
    CHECK(twice["ok"] == false);
    CHECK(twice["kind"] == "ConflictError");
    CHECK(twice["error"] == "Node is already running");

    auto update = commands.invoke("check_and_download_update", json::object());
    CHECK(update["ok"] == false);
    CHECK(update["error"] == "Busy");

    CHECK(commands.invoke("stop_node", nullptr)["result"] == true);
    CHECK(commands.invoke("get_process_status", nullptr)["result"] == false);

    auto logs = commands.invoke("get_logs", nullptr)["result"].get<std::string>();
    CHECK(logs.find("OpenHash node started successfully") != std::string::npos);
    CHECK(commands.invoke("clear_logs", nullptr)["ok"] == true);
    CHECK(commands.invoke("get_logs", nullptr)["result"] == "");

    auto events = commands.invoke("get_events", {{"after", 0}})["result"];
    REQUIRE(events.size() == 4);
    CHECK(events[0]["event"] == "status_changed");
    CHECK(events[0]["payload"]["state"] == "starting");
    CHECK(events[3]["payload"]["state"] == "stopped");

    auto later = commands.invoke("get_events", {{"after", events[1]["seq"]}})["result"];
    CHECK(later.size() == 2);
}

TEST_CASE_METHOD(Fixture, "Invalid start payloads are validation errors", "[api]") {
    auto reply = commands.invoke("start_node", start_args("abc"));
    CHECK(reply["ok"] == false);
    CHECK(reply["kind"] == "ValidationError");
    CHECK(reply["error"] == "Please enter a valid API port (1-65535).");
    CHECK(supervisor.query_status() == RunState::Stopped);
}

TEST_CASE_METHOD(Fixture, "Unknown commands are reported", "[api]") {
    auto reply = commands.invoke("format_disk", nullptr);
    CHECK(reply["ok"] == false);
    CHECK(reply["kind"] == "NotFoundError");
}

TEST_CASE_METHOD(Fixture, "Update progress reaches the event journal", "[api][update]") {
    auto asset = dir.path() / "asset.bin";
    write_file(asset, std::string(300000, 'x'));
    write_file(dir.path() / "latest.json",
               json{{"tag_name", "v1.0.0"},
                    {"assets", {{{"name", "openhash"},
                                 {"browser_download_url", file_url(asset)},
                                 {"size", 300000}}}}}
                   .dump());

    auto reply = commands.invoke("check_and_download_update", json::object());
    REQUIRE(reply["ok"] == true);
    supervisor.wait_for_update();

    auto events = commands.invoke("get_events", json::object())["result"];
    REQUIRE(events.size() >= 4);
    CHECK(events[0]["payload"]["state"] == "updating");
    CHECK(events[1]["event"] == "download_progress");
    CHECK(events[events.size() - 1]["event"] == "download_complete");
    CHECK(events[events.size() - 2]["payload"]["state"] == "stopped");
    CHECK(journal.last_seq() == events[events.size() - 1]["seq"].get<uint64_t>());
    CHECK(commands.invoke("get_events", json{{"after", journal.last_seq()}})["result"].empty());

    auto status = commands.invoke("get_status", nullptr)["result"];
    CHECK(status["state"] == "stopped");
    CHECK(status["executable"] == true);
    CHECK(status["installed"]["version"] == "v1.0.0");
}

TEST_CASE_METHOD(Fixture, "LocalAPI routes HTTP requests to commands", "[api][http]") {
    asio::io_context io;
    LocalAPI api(io, 0, commands);
    CHECK(api.port() != 0);

    LocalAPI::Request request;
    request.method = "GET";
    LocalAPI::split_target("/invoke/get_process_status", request);
    auto response = api.route(request);
    CHECK(response.status == 200);
    CHECK(response.body["result"] == false);

    request = {};
    request.method = "POST";
    request.body = R"({"path": ")" + (dir.path() / "picked").string() + R"("})";
    LocalAPI::split_target("/invoke/set_custom_data_path", request);
    CHECK(api.route(request).body["ok"] == true);
    CHECK(settings.current_data_path() == dir.path() / "picked");

    request = {};
    request.method = "GET";
    LocalAPI::split_target("/events?after=0", request);
    CHECK(request.query.at("after") == "0");
    CHECK(api.route(request).body["result"].is_array());

    request = {};
    request.method = "POST";
    request.body = "{broken";
    LocalAPI::split_target("/invoke/start_node", request);
    CHECK(api.route(request).status == 400);

    request = {};
    request.method = "GET";
    LocalAPI::split_target("/invoke/nope", request);
    CHECK(api.route(request).status == 404);

    request = {};
    request.method = "DELETE";
    LocalAPI::split_target("/status", request);
    CHECK(api.route(request).status == 405);
}

TEST_CASE_METHOD(Fixture, "LocalAPI answers over a socket", "[api][http]") {
    asio::io_context io;
    LocalAPI api(io, 0, commands);
    api.start();
    std::thread server([&io] { io.run(); });

    asio::io_context client_io;
    asio::ip::tcp::socket socket(client_io);
    socket.connect({asio::ip::address_v4::loopback(), api.port()});
    std::string request = "GET /status HTTP/1.1\r\nHost: localhost\r\n\r\n";
    asio::write(socket, asio::buffer(request));

    asio::error_code ec;
    asio::streambuf reply;
    asio::read(socket, reply, ec);
    std::string text(asio::buffers_begin(reply.data()), asio::buffers_end(reply.data()));

    api.stop();
    server.join();

    CHECK(text.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    auto body = json::parse(text.substr(text.find("\r\n\r\n") + 4));
    CHECK(body["ok"] == true);
    CHECK(body["result"]["state"] == "stopped");
}

TEST_CASE_METHOD(Fixture, "An idle connection neither blocks nor outlives its deadline", "[api][http]") {
    asio::io_context io;
    LocalAPI api(io, 0, commands, 300ms);
    api.start();
    std::thread server([&io] { io.run(); });  // a single io thread

    asio::io_context client_io;
    asio::ip::tcp::socket idle(client_io);
    idle.connect({asio::ip::address_v4::loopback(), api.port()});
    auto opened = std::chrono::steady_clock::now();

    asio::ip::tcp::socket socket(client_io);
    socket.connect({asio::ip::address_v4::loopback(), api.port()});
    std::string request = "GET /status HTTP/1.1\r\nHost: localhost\r\n\r\n";
    asio::write(socket, asio::buffer(request));

    asio::error_code ec;
    asio::streambuf reply;
    asio::read(socket, reply, ec);
    std::string text(asio::buffers_begin(reply.data()), asio::buffers_end(reply.data()));
    CHECK(text.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);

    asio::streambuf nothing;
    asio::read(idle, nothing, ec);
    auto idle_for = std::chrono::steady_clock::now() - opened;
    CHECK(ec == asio::error::eof);
    CHECK(nothing.size() == 0);
    CHECK(idle_for >= 250ms);
    CHECK(idle_for < 5s);

    api.stop();
    server.join();
}

}  // namespace command_surface_tests
