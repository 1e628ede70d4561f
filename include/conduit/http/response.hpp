// include/conduit/http/response.hpp
#pragma once
#include <conduit/http/headers.hpp>
#include <conduit/http/status_code.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace conduit::http {

class Response {
public:
    Response() = default;

    explicit Response(StatusCode status, std::string body = "")
        : status_(status), body_(std::move(body)) {}

    Response(StatusCode status, Headers headers, std::string body = "")
        : status_(status), headers_(std::move(headers)), body_(std::move(body)) {}

    // Status
    StatusCode status() const { return status_; }
    void set_status(StatusCode status) { status_ = status; }
    void set_status(int status) { status_ = static_cast<StatusCode>(status); }

    // Body
    const std::string& body() const { return body_; }
    void set_body(std::string body) { body_ = std::move(body); }
    void clear_body() { body_.clear(); }

    // Headers
    const Headers& headers() const { return headers_; }
    Headers& headers() { return headers_; }
    void set_header(std::string name, std::string value) { headers_.set(std::move(name), std::move(value)); }
    std::string header(std::string_view name, std::string fallback = {}) const { return headers_.get_or(name, std::move(fallback)); }

    void content_type(std::string type) { set_header("Content-Type", std::move(type)); }
    void location(std::string url) { set_header("Location", std::move(url)); }

    // Response building helpers
    static Response ok(std::string body = "")
    {
        return Response{StatusCode::OK, std::move(body)};
    }

    static Response text(std::string body, StatusCode status = StatusCode::OK)
    {
        Response res{status, std::move(body)};
        res.content_type("text/plain; charset=utf-8");
        return res;
    }

    static Response html(std::string body, StatusCode status = StatusCode::OK)
    {
        Response res{status, std::move(body)};
        res.content_type("text/html; charset=utf-8");
        return res;
    }

    // Invalid UTF-8 in strings is written as U+FFFD instead of failing.
    static Response json(const nlohmann::json& data, StatusCode status = StatusCode::OK)
    {
        Response res{status, data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
        res.content_type("application/json; charset=utf-8");
        return res;
    }

    static Response redirect(std::string url, StatusCode status = StatusCode::Found)
    {
        Response res{status};
        res.location(std::move(url));
        return res;
    }

    // HTTP/1.1 wire form. Content-Length is added when absent; the body is left out
    // for statuses that cannot carry one and when `omit_body` is set (HEAD).
    std::string to_string(bool omit_body = false) const;

    friend bool operator==(const Response& lhs, const Response& rhs)
    {
        return lhs.status_ == rhs.status_ && lhs.headers_ == rhs.headers_ && lhs.body_ == rhs.body_;
    }

private:
    StatusCode status_ = StatusCode::OK;
    Headers headers_;
    std::string body_;
};

} // namespace conduit::http
