#pragma once

#include <conduit/core/environment.hpp>
#include <conduit/http/error_view.hpp>
#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>
#include <conduit/support/log.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <memory>

namespace conduit::http {

// Single point where failures become responses.
//
// Logging always carries every diagnostic available. What reaches the client
// depends on the environment: in production an error document holds only
// `error` and the generic reason phrase of the status.
class ErrorNormalizer {
public:
    ErrorNormalizer(core::Environment environment, std::shared_ptr<const ErrorView> view, support::log::Logger logger);

    // Warns about a successful response without Content-Type (304 excepted).
    void inspect(const Response& response) const;

    // Converts the in-flight failure into a response. Never throws.
    Response normalize(std::exception_ptr failure, const Request& request) const;

    // JSON error document for `failure` (null for non-std::exception throws).
    nlohmann::json document(const std::exception* failure, StatusCode status) const;

    static StatusCode status_of(const std::exception* failure);

    const core::Environment& environment() const { return environment_; }

private:
    Response respond(const std::exception* failure, const std::string& type_name, const Request& request) const;
    void log_failure(const std::exception* failure, const std::string& type_name) const;

    core::Environment environment_;
    std::shared_ptr<const ErrorView> view_;
    support::log::Logger logger_;
};

} // namespace conduit::http
