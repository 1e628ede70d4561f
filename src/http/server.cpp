#include <conduit/http/server.hpp>
#include <conduit/support/str.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace conduit::http {

namespace str = support::str;

Server::Server(RequestHandler handler, support::log::Logger logger)
    : handler_(std::make_shared<const RequestHandler>(std::move(handler))), logger_(std::move(logger))
{
}

void Server::listen(const std::string& host, int port)
{
    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        throw std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno));
    }

    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        logger_->warn("SO_REUSEADDR not set: {}", std::strerror(errno));
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        close(server_fd);
        throw std::runtime_error("Invalid listen address " + host);
    }

    if (bind(server_fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        close(server_fd);
        throw std::runtime_error("Failed to bind to " + host + ":" + std::to_string(port));
    }

    if (::listen(server_fd, SOMAXCONN) < 0) {
        close(server_fd);
        throw std::runtime_error("Failed to listen");
    }

    logger_->info("Server listening on http://{}:{}", host, port);

    running_ = true;
    while (running_) {
        sockaddr_in client_address{};
        socklen_t client_len = sizeof(client_address);
        int client_fd = accept(server_fd, reinterpret_cast<sockaddr*>(&client_address), &client_len);
        if (client_fd < 0) {
            if (errno != EINTR) {
                logger_->warn("accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_address.sin_addr, ip, sizeof(ip));

        std::thread([handler = handler_, logger = logger_, client_fd, remote = std::string(ip)]() {
            serve_connection(*handler, logger, client_fd, remote);
        }).detach();
    }

    close(server_fd);
}

void Server::serve_connection(const RequestHandler& handler, const support::log::Logger& logger, int client_fd,
                              const std::string& remote_addr)
{
    std::string raw;
    char buffer[4096];

    while (raw.size() < kMaxRequestSize) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read <= 0) {
            break;
        }
        raw.append(buffer, static_cast<std::size_t>(bytes_read));

        const auto head_end = raw.find("\r\n\r\n");
        if (head_end == std::string::npos) {
            continue;
        }
        if (raw.size() >= expected_size(raw, head_end)) {
            break;
        }
    }

    if (raw.empty()) {
        close(client_fd);
        return;
    }

    std::string raw_response;
    if (auto request = parse_request(raw)) {
        const bool is_head = request->method() == Method::Head;
        request->set_header("X-Remote-Addr", remote_addr);
        Response res;
        try {
            res = handler(std::move(*request));
        } catch (const std::exception& e) {
            logger->error("Handler failed for {}: {}", remote_addr, e.what());
            res = Response::text("Internal Server Error", StatusCode::InternalServerError);
        } catch (...) {
            logger->error("Handler failed for {} with a non-standard exception", remote_addr);
            res = Response::text("Internal Server Error", StatusCode::InternalServerError);
        }
        raw_response = res.to_string(is_head);
    } else {
        logger->warn("Malformed request from {}", remote_addr);
        raw_response = Response::text("Bad Request", StatusCode::BadRequest).to_string();
    }

    std::size_t sent = 0;
    while (sent < raw_response.size()) {
        ssize_t n = send(client_fd, raw_response.data() + sent, raw_response.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            logger->debug("send to {} failed: {}", remote_addr, std::strerror(errno));
            break;
        }
        sent += static_cast<std::size_t>(n);
    }
    close(client_fd);
}

std::size_t Server::expected_size(std::string_view raw, std::size_t head_end)
{
    std::size_t content_length = 0;
    std::istringstream stream{std::string(raw.substr(0, head_end))};
    std::string line;
    while (std::getline(stream, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (str::iequals(str::trim(line.substr(0, colon)), "content-length")) {
            try {
                content_length = std::stoul(str::trim(line.substr(colon + 1)));
            } catch (const std::logic_error&) {
                content_length = 0;
            }
        }
    }
    return head_end + 4 + content_length;
}

std::optional<Request> Server::parse_request(std::string_view raw)
{
    const auto head_end = raw.find("\r\n\r\n");
    const auto head = raw.substr(0, head_end);

    std::istringstream stream{std::string(head)};
    std::string line;

    // Request line
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream line_stream(line);
    std::string method, target, version;
    line_stream >> method >> target >> version;
    if (method.empty() || target.empty()) {
        return std::nullopt;
    }

    Request req;
    req.set_method(method);
    req.set_path(target);

    // Headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            req.set_header(str::trim(line.substr(0, colon)), str::trim(line.substr(colon + 1)));
        }
    }

    // Body
    if (head_end != std::string_view::npos) {
        req.set_body(std::string(raw.substr(head_end + 4)));
    }
    return req;
}

} // namespace conduit::http
