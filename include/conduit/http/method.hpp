#pragma once

#include <string>
#include <string_view>

namespace conduit::http {

enum class Method {
    Get,
    Head,
    Post,
    Put,
    Patch,
    Delete,
    Options,
    Connect,
    Trace,
    Other
};

// Parse a method token. Case-insensitive; unknown tokens map to Method::Other.
[[nodiscard]] Method parse_method(std::string_view token);

// Canonical upper-case token. Method::Other has no canonical token and yields "".
[[nodiscard]] std::string_view to_string(Method method);

} // namespace conduit::http
