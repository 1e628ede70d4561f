#include <conduit/http/request.hpp>
#include <conduit/support/str.hpp>

namespace conduit::http {

namespace str = support::str;

namespace {

std::unordered_map<std::string, std::string> parse_urlencoded(std::string_view text)
{
    std::unordered_map<std::string, std::string> out;
    if (text.empty()) {
        return out;
    }
    for (const auto& pair : str::split(text, '&')) {
        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            out[str::url_decode(pair)] = "";
        } else {
            out[str::url_decode(pair.substr(0, eq))] = str::url_decode(pair.substr(eq + 1));
        }
    }
    return out;
}

} // namespace

Request::Request(Method method, std::string path)
{
    set_method(method);
    set_path(std::move(path));
}

Request::Request(std::string method, std::string path)
{
    set_method(std::move(method));
    set_path(std::move(path));
}

void Request::set_method(Method method)
{
    method_ = method;
    if (method != Method::Other) {
        method_name_ = std::string{to_string(method)};
    }
}

void Request::set_method(std::string method)
{
    method_name_ = str::to_upper(str::trim(method));
    method_ = parse_method(method_name_);
}

void Request::set_path(std::string path)
{
    const auto query_pos = path.find('?');
    if (query_pos != std::string::npos) {
        query_string_ = path.substr(query_pos + 1);
        path.erase(query_pos);
    }
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    path_ = std::move(path);
}

void Request::set_query_string(std::string query)
{
    query_string_ = std::move(query);
}

std::string Request::query(const std::string& key, std::string fallback) const
{
    auto params = parse_urlencoded(query_string_);
    auto it = params.find(key);
    return it != params.end() ? it->second : fallback;
}

void Request::set_header(std::string name, std::string value)
{
    headers_.set(std::move(name), std::move(value));
    form_parsed_ = false;
}

std::string Request::header(std::string_view name, std::string fallback) const
{
    return headers_.get_or(name, std::move(fallback));
}

void Request::set_body(std::string body)
{
    body_ = std::move(body);
    form_parsed_ = false;
}

nlohmann::json Request::json() const
{
    if (body_.empty()) {
        return nlohmann::json::object();
    }
    // Malformed bodies read as an empty document rather than failing the request.
    auto parsed = nlohmann::json::parse(body_, nullptr, false);
    return parsed.is_discarded() ? nlohmann::json::object() : parsed;
}

bool Request::is_json() const
{
    return str::icontains(header("content-type"), "application/json");
}

const std::unordered_map<std::string, std::string>& Request::form() const
{
    parse_form();
    return form_;
}

std::optional<std::string> Request::field(const std::string& name) const
{
    const auto& fields = form();
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Request::set_field(std::string name, std::string value)
{
    explicit_fields_[std::move(name)] = std::move(value);
    form_parsed_ = false;
}

std::string Request::param(const std::string& key, std::string fallback) const
{
    auto it = params_.find(key);
    return it != params_.end() ? it->second : fallback;
}

void Request::parse_form() const
{
    if (form_parsed_) {
        return;
    }
    form_.clear();

    if (is_json()) {
        const auto doc = json();
        if (doc.is_object()) {
            for (const auto& [key, value] : doc.items()) {
                form_[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    } else if (str::icontains(header("content-type"), "application/x-www-form-urlencoded")) {
        form_ = parse_urlencoded(body_);
    }

    for (const auto& [name, value] : explicit_fields_) {
        form_[name] = value;
    }

    form_parsed_ = true;
}

} // namespace conduit::http
