#include <conduit/http/abort.hpp>
#include <conduit/support/str.hpp>

#include <utility>

namespace conduit::http {

namespace {

Abort::Details with_defaults(StatusCode status, Abort::Details details)
{
    if (details.reason.empty()) {
        details.reason = std::string{reason_phrase(status)};
    }
    if (details.identifier.empty()) {
        details.identifier = std::to_string(code(status));
    }
    return details;
}

} // namespace

std::string loggable(const Debuggable& debuggable)
{
    std::vector<std::string> parts;
    parts.push_back(debuggable.readable_name() + ": " + debuggable.reason());
    parts.push_back("Identifier: " + debuggable.full_identifier());

    auto add_list = [&parts](const char* label, const std::vector<std::string>& items) {
        if (!items.empty()) {
            parts.push_back(std::string{label} + ": " + support::str::join(items, ", "));
        }
    };
    add_list("Possible Causes", debuggable.possible_causes());
    add_list("Suggested Fixes", debuggable.suggested_fixes());
    add_list("Documentation Links", debuggable.documentation_links());
    add_list("Stack Overflow Questions", debuggable.stack_overflow_questions());
    add_list("GitHub Issues", debuggable.github_issues());

    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out += ' ';
        }
        out += '[' + part + ']';
    }
    return out;
}

Abort::Abort(StatusCode status, Details details)
    : std::runtime_error(with_defaults(status, details).reason)
    , status_(status)
    , details_(with_defaults(status, std::move(details)))
{
}

Abort::Abort(StatusCode status) : Abort(status, Details{}) {}

Abort::Abort(StatusCode status, std::string reason)
    : Abort(status, Details{.reason = std::move(reason)})
{
}

Abort Abort::named(StatusCode status, std::string identifier, std::string reason)
{
    return Abort{status, Details{.reason = std::move(reason), .identifier = std::move(identifier)}};
}

Abort Abort::bad_request(std::string reason)
{
    return named(StatusCode::BadRequest, "badRequest", std::move(reason));
}

Abort Abort::unauthorized(std::string reason)
{
    return named(StatusCode::Unauthorized, "unauthorized", std::move(reason));
}

Abort Abort::forbidden(std::string reason)
{
    return named(StatusCode::Forbidden, "forbidden", std::move(reason));
}

Abort Abort::not_found(std::string reason)
{
    return named(StatusCode::NotFound, "notFound", std::move(reason));
}

Abort Abort::server_error(std::string reason)
{
    return named(StatusCode::InternalServerError, "serverError", std::move(reason));
}

} // namespace conduit::http
