#include <conduit/http/error_normalizer.hpp>
#include <conduit/http/abort.hpp>
#include <conduit/support/str.hpp>

#include <cxxabi.h>

#include <typeinfo>

namespace conduit::http {

namespace {

void set_if_not_empty(nlohmann::json& doc, const char* key, const std::vector<std::string>& items)
{
    if (!items.empty()) {
        doc[key] = items;
    }
}

std::string current_exception_type_name()
{
    if (const std::type_info* type = abi::__cxa_current_exception_type()) {
        return support::str::demangle(*type);
    }
    return "unknown";
}

} // namespace

ErrorNormalizer::ErrorNormalizer(core::Environment environment, std::shared_ptr<const ErrorView> view,
                                 support::log::Logger logger)
    : environment_(std::move(environment))
    , view_(std::move(view))
    , logger_(std::move(logger))
{
}

void ErrorNormalizer::inspect(const Response& response) const
{
    if (response.status() != StatusCode::NotModified && !response.headers().contains("Content-Type")) {
        logger_->warn("Response had no 'Content-Type' header.");
    }
}

Response ErrorNormalizer::normalize(std::exception_ptr failure, const Request& request) const
{
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        return respond(&e, support::str::demangle(typeid(e)), request);
    } catch (...) {
        return respond(nullptr, current_exception_type_name(), request);
    }
}

StatusCode ErrorNormalizer::status_of(const std::exception* failure)
{
    if (const auto* abort = dynamic_cast<const AbortError*>(failure)) {
        return abort->status();
    }
    return StatusCode::InternalServerError;
}

nlohmann::json ErrorNormalizer::document(const std::exception* failure, StatusCode status) const
{
    nlohmann::json doc = nlohmann::json::object();
    doc["error"] = true;

    if (environment_.is_production()) {
        doc["reason"] = std::string{reason_phrase(status)};
        return doc;
    }

    doc["reason"] = std::string{reason_phrase(status)};
    if (const auto* abort = dynamic_cast<const AbortError*>(failure)) {
        doc["reason"] = std::string{reason_phrase(abort->status())};
        doc["metadata"] = abort->metadata();
    }
    if (const auto* debuggable = dynamic_cast<const Debuggable*>(failure)) {
        doc["reason"] = debuggable->reason();
        doc["identifier"] = debuggable->full_identifier();
        set_if_not_empty(doc, "possibleCauses", debuggable->possible_causes());
        set_if_not_empty(doc, "suggestedFixes", debuggable->suggested_fixes());
        set_if_not_empty(doc, "documentationLinks", debuggable->documentation_links());
        set_if_not_empty(doc, "stackOverflowQuestions", debuggable->stack_overflow_questions());
        set_if_not_empty(doc, "gitHubIssues", debuggable->github_issues());
    }
    return doc;
}

Response ErrorNormalizer::respond(const std::exception* failure, const std::string& type_name, const Request& request) const
{
    const StatusCode status = status_of(failure);
    log_failure(failure, type_name);

    if (view_ && request.accept().prefers("html")) {
        try {
            return view_->render(failure, status, request);
        } catch (const std::exception& e) {
            logger_->error("Error view failed, answering with JSON instead: {}", e.what());
        } catch (...) {
            logger_->error("Error view failed, answering with JSON instead: {}", current_exception_type_name());
        }
    }

    return Response::json(document(failure, status), status);
}

void ErrorNormalizer::log_failure(const std::exception* failure, const std::string& type_name) const
{
    if (const auto* debuggable = dynamic_cast<const Debuggable*>(failure)) {
        logger_->error(loggable(*debuggable));
        return;
    }

    logger_->error("[{}: {}]", type_name, failure != nullptr ? failure->what() : "non-standard exception");
    logger_->info("Conform '{}' to Debuggable to provide more debug information.", type_name);
}

} // namespace conduit::http
