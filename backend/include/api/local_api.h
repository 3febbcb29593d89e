#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace nodeward {

class CommandSurface;

/**
 * Minimal localhost-only HTTP API consumed by the UI.
 *
 *   GET  /status                 — health check (state, data path, installed version)
 *   GET  /events?after=<seq>     — journaled events newer than seq
 *   GET  /invoke/<command>       — commands without arguments
 *   POST /invoke/<command>       — JSON body carries the arguments
 *
 * One request per connection. Each connection is read asynchronously on its
 * own strand and dropped when the request has not arrived within the read
 * timeout. Commands may block (start/stop), so the io_context should be run
 * from more than one thread.
 */
class LocalAPI {
public:
    struct Request {
        std::string                        method;
        std::string                        path;
        std::map<std::string, std::string> query;
        std::string                        body;
    };

    struct Response {
        int            status = 200;
        nlohmann::json body;
    };

    static constexpr std::size_t kMaxHeaderSize = 8 * 1024;
    static constexpr std::size_t kMaxBodySize   = 64 * 1024;
    static constexpr std::chrono::milliseconds kReadTimeout{10000};

    LocalAPI(asio::io_context& io, uint16_t port, CommandSurface& commands,
             std::chrono::milliseconds read_timeout = kReadTimeout);

    void start();

    /// Closes the listener. Safe to call from any thread.
    void stop();

    /// Bound port; differs from the requested one when that was 0.
    [[nodiscard]] uint16_t port() const;

    /// Routes an already parsed request. Exposed for tests.
    Response route(const Request& request) const;

    /// Splits `/path?a=1&b=2` into path and query map.
    static void split_target(const std::string& target, Request& request);

private:
    class Session;

    void do_accept();

    asio::io_context&         io_;
    asio::ip::tcp::acceptor   acceptor_;
    CommandSurface&           commands_;
    std::chrono::milliseconds read_timeout_;
};

}  // namespace nodeward
