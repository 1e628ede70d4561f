#pragma once

#include <conduit/http/method.hpp>
#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>

namespace conduit::http {

// Form field that overrides the request method, e.g. "_method=DELETE" from an HTML form.
inline constexpr const char* kMethodOverrideField = "_method";

// Applies the method override and rewrites HEAD to GET. Returns the method the
// client asked for (after the override) so the response can be finalized for it.
Method normalize_method(Request& request);

// HEAD responses never carry a body (RFC 9110, 9.3.2); status and headers are kept.
void finalize_response(Method original_method, Response& response);

} // namespace conduit::http
