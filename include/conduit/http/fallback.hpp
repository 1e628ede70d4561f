#pragma once

#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>

namespace conduit::http {

// Terminal handler for requests the router could not match.
//   GET, POST, PUT, PATCH, DELETE -> throws Abort::not_found()
//   OPTIONS                       -> 200 with "Allow: OPTIONS"
//   anything else                 -> 501
class FallbackHandler {
public:
    Response operator()(const Request& request) const;
};

} // namespace conduit::http
