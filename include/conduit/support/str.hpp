#pragma once

#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

namespace conduit::support::str {

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);
std::string replace_all(std::string_view s, std::string_view from, std::string_view to);

bool iequals(std::string_view a, std::string_view b);
bool icontains(std::string_view haystack, std::string_view needle);

std::vector<std::string> split(std::string_view s, char delim);
std::string join(const std::vector<std::string>& parts, std::string_view separator);

// Decodes %XX escapes and '+' (form encoding). Malformed escapes are kept verbatim.
std::string url_decode(std::string_view s);

std::string html_escape(std::string_view s);

// Human readable name of a dynamic type ("conduit::http::Abort" rather than the mangled form).
std::string demangle(const std::type_info& type);

} // namespace conduit::support::str
