#include <conduit/http/error_view.hpp>
#include <conduit/http/abort.hpp>
#include <conduit/support/view.hpp>

namespace conduit::http {

namespace {

constexpr const char* kDefaultTemplate = R"(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>{{ status }} {{ statusPhrase }}</title>
</head>
<body>
<h1>{{ status }} {{ statusPhrase }}</h1>
<p>{{ reason }}</p>
@if(identifier)<p>Identifier: <code>{{ identifier }}</code></p>
@endif@if(possibleCauses)<h2>Possible causes</h2>
<ul>@foreach(possibleCauses as item)<li>{{ item }}</li>@endforeach</ul>
@endif@if(suggestedFixes)<h2>Suggested fixes</h2>
<ul>@foreach(suggestedFixes as item)<li>{{ item }}</li>@endforeach</ul>
@endif@if(documentationLinks)<h2>Documentation</h2>
<ul>@foreach(documentationLinks as item)<li><a href="{{ item }}">{{ item }}</a></li>@endforeach</ul>
@endif@if(stackOverflowQuestions)<h2>Stack Overflow</h2>
<ul>@foreach(stackOverflowQuestions as item)<li><a href="{{ item }}">{{ item }}</a></li>@endforeach</ul>
@endif@if(gitHubIssues)<h2>GitHub issues</h2>
<ul>@foreach(gitHubIssues as item)<li><a href="{{ item }}">{{ item }}</a></li>@endforeach</ul>
@endif</body>
</html>
)";

void set_if_not_empty(nlohmann::json& doc, const char* key, const std::vector<std::string>& items)
{
    if (!items.empty()) {
        doc[key] = items;
    }
}

} // namespace

TemplateErrorView::TemplateErrorView(std::shared_ptr<support::ViewEngine> engine, core::Environment environment,
                                     std::string template_name)
    : engine_(std::move(engine))
    , environment_(std::move(environment))
    , template_name_(std::move(template_name))
{
}

Response TemplateErrorView::render(const std::exception* failure, StatusCode status, const Request&) const
{
    const auto data = context(failure, status, environment_);

    std::string body;
    try {
        if (!engine_) {
            throw support::ViewNotFound("no view engine configured");
        }
        body = engine_->render(template_name_, data);
    } catch (const support::ViewNotFound&) {
        body = support::View::render_string(kDefaultTemplate, data);
    }
    return Response::html(std::move(body), status);
}

nlohmann::json TemplateErrorView::context(const std::exception* failure, StatusCode status,
                                          const core::Environment& environment)
{
    nlohmann::json data = {
        {"error", true},
        {"status", code(status)},
        {"statusPhrase", std::string{reason_phrase(status)}},
        {"reason", std::string{reason_phrase(status)}},
    };
    if (environment.is_production() || failure == nullptr) {
        return data;
    }

    if (const auto* abort = dynamic_cast<const AbortError*>(failure)) {
        if (auto metadata = abort->metadata(); !metadata.is_null()) {
            data["metadata"] = std::move(metadata);
        }
    }
    if (const auto* debuggable = dynamic_cast<const Debuggable*>(failure)) {
        data["reason"] = debuggable->reason();
        data["identifier"] = debuggable->full_identifier();
        set_if_not_empty(data, "possibleCauses", debuggable->possible_causes());
        set_if_not_empty(data, "suggestedFixes", debuggable->suggested_fixes());
        set_if_not_empty(data, "documentationLinks", debuggable->documentation_links());
        set_if_not_empty(data, "stackOverflowQuestions", debuggable->stack_overflow_questions());
        set_if_not_empty(data, "gitHubIssues", debuggable->github_issues());
    }
    return data;
}

const char* TemplateErrorView::default_template()
{
    return kDefaultTemplate;
}

} // namespace conduit::http
