#pragma once

#include <conduit/http/status_code.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace conduit::http {

// Failure capability: carries the HTTP status and metadata meant for the client.
class AbortError {
public:
    virtual ~AbortError() = default;

    [[nodiscard]] virtual StatusCode status() const = 0;
    [[nodiscard]] virtual nlohmann::json metadata() const { return nullptr; }
};

// Failure capability: carries developer diagnostics for logs and, outside
// production, for error documents.
class Debuggable {
public:
    virtual ~Debuggable() = default;

    // Stable name of the failure type, e.g. "Abort".
    [[nodiscard]] virtual std::string type_identifier() const = 0;
    [[nodiscard]] virtual std::string readable_name() const { return type_identifier(); }
    [[nodiscard]] virtual std::string reason() const = 0;
    [[nodiscard]] virtual std::string identifier() const = 0;

    [[nodiscard]] virtual std::vector<std::string> possible_causes() const { return {}; }
    [[nodiscard]] virtual std::vector<std::string> suggested_fixes() const { return {}; }
    [[nodiscard]] virtual std::vector<std::string> documentation_links() const { return {}; }
    [[nodiscard]] virtual std::vector<std::string> stack_overflow_questions() const { return {}; }
    [[nodiscard]] virtual std::vector<std::string> github_issues() const { return {}; }

    [[nodiscard]] std::string full_identifier() const { return type_identifier() + "." + identifier(); }
};

// One-line log rendering: "[Name: reason] [Identifier: id] [Possible Causes: a, b] ..."
// with empty lists left out.
[[nodiscard]] std::string loggable(const Debuggable& debuggable);

// Stock failure raised by handlers and the fallback. Abortable and debuggable.
class Abort : public std::runtime_error, public AbortError, public Debuggable {
public:
    struct Details {
        std::string reason;
        std::string identifier;
        nlohmann::json metadata = nullptr;
        std::vector<std::string> possible_causes;
        std::vector<std::string> suggested_fixes;
        std::vector<std::string> documentation_links;
        std::vector<std::string> stack_overflow_questions;
        std::vector<std::string> github_issues;
    };

    explicit Abort(StatusCode status);
    Abort(StatusCode status, Details details);
    Abort(StatusCode status, std::string reason);

    static Abort bad_request(std::string reason = {});
    static Abort unauthorized(std::string reason = {});
    static Abort forbidden(std::string reason = {});
    static Abort not_found(std::string reason = {});
    static Abort server_error(std::string reason = {});

    StatusCode status() const override { return status_; }
    nlohmann::json metadata() const override { return details_.metadata; }

    std::string type_identifier() const override { return "Abort"; }
    std::string reason() const override { return details_.reason; }
    std::string identifier() const override { return details_.identifier; }
    std::vector<std::string> possible_causes() const override { return details_.possible_causes; }
    std::vector<std::string> suggested_fixes() const override { return details_.suggested_fixes; }
    std::vector<std::string> documentation_links() const override { return details_.documentation_links; }
    std::vector<std::string> stack_overflow_questions() const override { return details_.stack_overflow_questions; }
    std::vector<std::string> github_issues() const override { return details_.github_issues; }

private:
    static Abort named(StatusCode status, std::string identifier, std::string reason);

    StatusCode status_;
    Details details_;
};

} // namespace conduit::http
