#include <conduit/http/method.hpp>
#include <conduit/support/str.hpp>

#include <array>
#include <utility>

namespace conduit::http {

namespace {

constexpr std::array<std::pair<std::string_view, Method>, 9> kMethods = {{
    {"GET", Method::Get},
    {"HEAD", Method::Head},
    {"POST", Method::Post},
    {"PUT", Method::Put},
    {"PATCH", Method::Patch},
    {"DELETE", Method::Delete},
    {"OPTIONS", Method::Options},
    {"CONNECT", Method::Connect},
    {"TRACE", Method::Trace},
}};

} // namespace

Method parse_method(std::string_view token)
{
    const auto upper = support::str::to_upper(support::str::trim(token));
    for (const auto& [name, method] : kMethods) {
        if (upper == name) {
            return method;
        }
    }
    return Method::Other;
}

std::string_view to_string(Method method)
{
    for (const auto& [name, m] : kMethods) {
        if (m == method) {
            return name;
        }
    }
    return {};
}

} // namespace conduit::http
