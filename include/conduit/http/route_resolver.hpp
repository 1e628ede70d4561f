#pragma once

#include <conduit/http/middleware.hpp>
#include <conduit/http/request.hpp>

#include <optional>

namespace conduit::http {

// Answers "which handler, if any, serves this method and path". Called concurrently
// for distinct requests once registration is over, so implementations must not
// mutate shared state from route().
class RouteResolver {
public:
    virtual ~RouteResolver() = default;

    // std::nullopt means no route matched; that is not an error.
    [[nodiscard]] virtual std::optional<Handler> route(const Request& request) const = 0;
};

} // namespace conduit::http
