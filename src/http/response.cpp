#include <conduit/http/response.hpp>

#include <sstream>

namespace conduit::http {

std::string Response::to_string(bool omit_body) const
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code(status_);

    const auto reason = reason_phrase(status_);
    if (!reason.empty()) {
        oss << " " << reason;
    }
    oss << "\r\n";

    const bool with_body = allows_body(status_);
    for (const auto& [name, value] : headers_) {
        oss << name << ": " << value << "\r\n";
    }
    if (with_body && !headers_.contains("Content-Length")) {
        oss << "Content-Length: " << body_.size() << "\r\n";
    }
    oss << "\r\n";

    if (with_body && !omit_body) {
        oss << body_;
    }
    return oss.str();
}

} // namespace conduit::http
