/**
 * LocalAPI — HTTP server on localhost for the UI.
 *
 * Exposes the CommandSurface as JSON endpoints on 127.0.0.1:<api_port>.
 * Requests are read asynchronously under a per-connection deadline.
 */

#include "api/local_api.h"

#include <cctype>
#include <istream>
#include <memory>
#include <sstream>

#include <spdlog/spdlog.h>

#include "api/command_surface.h"

using json = nlohmann::json;

namespace nodeward {

namespace {

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        default:  return "Internal Server Error";
    }
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

LocalAPI::Response error_response(int status, const std::string& message) {
    return {status, {{"ok", false}, {"error", message}, {"kind", "ValidationError"}}};
}

}  // namespace

/// One connection: reads a single request, answers it and closes.
class LocalAPI::Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::ip::tcp::socket socket, const LocalAPI& api)
        : socket_(std::move(socket)),
          deadline_(socket_.get_executor()),
          buffer_(kMaxHeaderSize + kMaxBodySize),
          api_(api) {}

    void start() {
        auto self = shared_from_this();
        asio::dispatch(socket_.get_executor(), [self] {
            self->arm_deadline();
            self->read_head();
        });
    }

private:
    void arm_deadline() {
        auto self = shared_from_this();
        deadline_.expires_after(api_.read_timeout_);
        deadline_.async_wait([self](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted || !self->reading_) return;
            spdlog::debug("[LocalAPI] Request not received in time, closing");
            asio::error_code ignored;
            self->socket_.close(ignored);
        });
    }

    void read_head() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
                               [self](const asio::error_code& ec, std::size_t header_len) {
                                   if (ec) {
                                       self->drop(ec);
                                       return;
                                   }
                                   self->on_head(header_len);
                               });
    }

    void on_head(std::size_t header_len) {
        std::string head(asio::buffers_begin(buffer_.data()),
                         asio::buffers_begin(buffer_.data()) +
                             static_cast<std::ptrdiff_t>(header_len));
        buffer_.consume(header_len);

        std::istringstream lines(head);
        std::string request_line;
        std::getline(lines, request_line);

        Request request;
        std::string target, version;
        std::istringstream(request_line) >> request.method >> target >> version;

        std::size_t content_length = 0;
        bool bad_length = false;
        std::string header;
        while (std::getline(lines, header) && header != "\r") {
            auto colon = header.find(':');
            if (colon == std::string::npos) continue;
            if (lower(header.substr(0, colon)) == "content-length") {
                try {
                    content_length = std::stoul(header.substr(colon + 1));
                } catch (const std::exception&) {
                    bad_length = true;
                }
            }
        }

        if (request.method.empty() || target.empty() || bad_length) {
            respond(error_response(400, "Malformed request"));
            return;
        }
        if (content_length > kMaxBodySize) {
            respond(error_response(413, "Request body too large"));
            return;
        }
        split_target(target, request);

        if (buffer_.size() >= content_length) {
            on_body(std::move(request), content_length);
            return;
        }
        auto self = shared_from_this();
        asio::async_read(socket_, buffer_, asio::transfer_exactly(content_length - buffer_.size()),
                         [self, request = std::move(request), content_length](
                             const asio::error_code& ec, std::size_t) mutable {
                             if (ec) {
                                 self->drop(ec);
                                 return;
                             }
                             self->on_body(std::move(request), content_length);
                         });
    }

    void on_body(Request request, std::size_t content_length) {
        request.body.assign(asio::buffers_begin(buffer_.data()),
                            asio::buffers_begin(buffer_.data()) +
                                static_cast<std::ptrdiff_t>(content_length));
        buffer_.consume(content_length);
        respond(api_.route(request));
    }

    void respond(const Response& response) {
        reading_ = false;
        deadline_.cancel();

        auto payload = response.body.dump();
        std::ostringstream out;
        out << "HTTP/1.1 " << response.status << ' ' << reason_phrase(response.status) << "\r\n"
            << "Content-Type: application/json\r\n"
            << "Content-Length: " << payload.size() << "\r\n"
            << "Connection: close\r\n\r\n"
            << payload;
        reply_ = out.str();

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(reply_),
                          [self](const asio::error_code& ec, std::size_t) {
                              if (ec) spdlog::debug("[LocalAPI] Write failed: {}", ec.message());
                              asio::error_code ignored;
                              self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
                          });
    }

    void drop(const asio::error_code& ec) {
        spdlog::debug("[LocalAPI] Dropped connection: {}", ec.message());
        reading_ = false;
        deadline_.cancel();
    }

    asio::ip::tcp::socket socket_;
    asio::steady_timer    deadline_;
    asio::streambuf       buffer_;
    const LocalAPI&       api_;
    bool                  reading_ = true;
    std::string           reply_;
};

LocalAPI::LocalAPI(asio::io_context& io, uint16_t port, CommandSurface& commands,
                   std::chrono::milliseconds read_timeout)
    : io_(io),
      acceptor_(asio::make_strand(io),
                asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), port)),
      commands_(commands),
      read_timeout_(read_timeout) {}

void LocalAPI::start() {
    spdlog::info("[LocalAPI] Listening on 127.0.0.1:{}", port());
    asio::post(acceptor_.get_executor(), [this] { do_accept(); });
}

void LocalAPI::stop() {
    asio::post(acceptor_.get_executor(), [this] {
        asio::error_code ec;
        acceptor_.close(ec);
        if (ec) spdlog::warn("[LocalAPI] Closing acceptor: {}", ec.message());
    });
}

uint16_t LocalAPI::port() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void LocalAPI::do_accept() {
    // Each connection gets its own strand so sessions run in parallel while
    // the acceptor stays serialized with stop().
    acceptor_.async_accept(asio::make_strand(io_),
                           [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
                               if (ec == asio::error::operation_aborted) return;
                               if (ec) {
                                   spdlog::warn("[LocalAPI] Accept failed: {}", ec.message());
                               } else {
                                   std::make_shared<Session>(std::move(socket), *this)->start();
                               }
                               if (acceptor_.is_open()) do_accept();
                           });
}

LocalAPI::Response LocalAPI::route(const Request& request) const {
    spdlog::debug("[LocalAPI] {} {}", request.method, request.path);

    if (request.method != "GET" && request.method != "POST") {
        return error_response(405, "Method not allowed");
    }

    if (request.path == "/status") {
        return {200, commands_.invoke("get_status", nullptr)};
    }

    if (request.path == "/events") {
        json args = json::object();
        auto it = request.query.find("after");
        if (it != request.query.end()) {
            try {
                args["after"] = std::stoull(it->second);
            } catch (const std::exception&) {
                return error_response(400, "Invalid 'after' parameter");
            }
        }
        return {200, commands_.invoke("get_events", args)};
    }

    const std::string prefix = "/invoke/";
    if (request.path.compare(0, prefix.size(), prefix) == 0) {
        auto command = request.path.substr(prefix.size());
        if (!commands_.has_command(command)) {
            return error_response(404, "Unknown command: " + command);
        }

        json args = json::object();
        if (!request.body.empty()) {
            args = json::parse(request.body, nullptr, false);
            if (args.is_discarded()) return error_response(400, "Request body is not valid JSON");
        }
        return {200, commands_.invoke(command, args)};
    }

    return error_response(404, "Not found: " + request.path);
}

void LocalAPI::split_target(const std::string& target, Request& request) {
    auto q = target.find('?');
    request.path = target.substr(0, q);
    if (q == std::string::npos) return;

    std::istringstream params(target.substr(q + 1));
    std::string pair;
    while (std::getline(params, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            request.query[pair] = "";
        } else {
            request.query[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }
}

}  // namespace nodeward
