#pragma once

#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>
#include <conduit/support/log.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::http {

/**
 * Minimal blocking HTTP/1.1 server.
 * One detached thread per accepted connection, one request per connection.
 * Connection threads share the handler and logger, not the Server, so they may
 * outlive it.
 */
class Server {
public:
    using RequestHandler = std::function<Response(Request)>;

    static constexpr std::size_t kMaxRequestSize = 1 << 20;

    Server(RequestHandler handler, support::log::Logger logger);

    // Blocks until stop() is called. Throws std::runtime_error when the socket
    // cannot be set up.
    void listen(const std::string& host, int port);
    void stop() { running_ = false; }

    // Parses a complete raw request (head and body). std::nullopt when the
    // request line is malformed.
    static std::optional<Request> parse_request(std::string_view raw);

    // Bytes expected for a request whose head ends at `head_end`, from Content-Length.
    static std::size_t expected_size(std::string_view raw, std::size_t head_end);

    // Reads one request from `client_fd`, writes the response and closes the descriptor.
    static void serve_connection(const RequestHandler& handler, const support::log::Logger& logger, int client_fd,
                                 const std::string& remote_addr);

private:
    std::shared_ptr<const RequestHandler> handler_;
    support::log::Logger logger_;
    std::atomic<bool> running_{false};
};

} // namespace conduit::http
