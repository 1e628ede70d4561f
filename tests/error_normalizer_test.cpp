#include <conduit/http/abort.hpp>
#include <conduit/http/error_normalizer.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace conduit::http {

namespace {

// Abortable only.
class Teapot : public std::runtime_error, public AbortError {
public:
    Teapot() : std::runtime_error("short and stout") {}

    StatusCode status() const override { return StatusCode::ImATeapot; }
    nlohmann::json metadata() const override { return {{"brew", "coffee"}}; }
};

// Debuggable only.
class Diagnosed : public std::runtime_error, public Debuggable {
public:
    Diagnosed() : std::runtime_error("diagnosed") {}

    std::string type_identifier() const override { return "Diagnosed"; }
    std::string reason() const override { return "it broke"; }
    std::string identifier() const override { return "broken"; }
    std::vector<std::string> possible_causes() const override { return {"a", "b"}; }
    std::vector<std::string> suggested_fixes() const override { return {"c"}; }
};

class ThrowingView : public ErrorView {
public:
    Response render(const std::exception*, StatusCode, const Request&) const override
    {
        throw std::runtime_error("template exploded");
    }
};

class ThrowingValueView : public ErrorView {
public:
    Response render(const std::exception*, StatusCode, const Request&) const override { throw 7; }
};

Request html_request()
{
    Request req(Method::Get, "/missing");
    req.set_header("Accept", "text/html,application/xhtml+xml;q=0.9,*/*;q=0.8");
    return req;
}

} // namespace

TEST(AbortTest, StatusOnlyUsesDefaults)
{
    const Abort abort(StatusCode::Gone);
    EXPECT_EQ(abort.status(), StatusCode::Gone);
    EXPECT_EQ(abort.reason(), "Gone");
    EXPECT_STREQ(abort.what(), "Gone");
    EXPECT_EQ(abort.full_identifier(), "Abort.410");
    EXPECT_TRUE(abort.metadata().is_null());
    EXPECT_TRUE(abort.possible_causes().empty());
}

TEST(AbortTest, DetailsOverrideDefaults)
{
    const Abort abort(StatusCode::Gone, Abort::Details{.reason = "moved away", .identifier = "moved"});
    EXPECT_EQ(abort.reason(), "moved away");
    EXPECT_EQ(abort.full_identifier(), "Abort.moved");
}

class ErrorNormalizerTest : public ::testing::Test {
protected:
    ErrorNormalizer make(core::Environment environment, std::shared_ptr<const ErrorView> view = nullptr)
    {
        if (!view) {
            view = std::make_shared<TemplateErrorView>(nullptr, environment);
        }
        return ErrorNormalizer(std::move(environment), std::move(view), log.logger);
    }

    test::CapturedLog log = test::capture_log("normalizer");
};

TEST_F(ErrorNormalizerTest, StatusComesFromAbortableFailures)
{
    const Teapot teapot;
    const std::runtime_error plain("boom");
    const Diagnosed diagnosed;

    EXPECT_EQ(ErrorNormalizer::status_of(&teapot), StatusCode::ImATeapot);
    EXPECT_EQ(ErrorNormalizer::status_of(&plain), StatusCode::InternalServerError);
    EXPECT_EQ(ErrorNormalizer::status_of(&diagnosed), StatusCode::InternalServerError);
    EXPECT_EQ(ErrorNormalizer::status_of(nullptr), StatusCode::InternalServerError);
}

TEST_F(ErrorNormalizerTest, ProductionDocumentHasOnlyGenericReason)
{
    auto normalizer = make(core::Environment::production());
    const Abort abort(StatusCode::NotFound, Abort::Details{
        .reason = "user 7 is gone",
        .identifier = "userGone",
        .metadata = {{"id", 7}},
        .possible_causes = {"deleted"},
    });

    EXPECT_EQ(normalizer.document(&abort, StatusCode::NotFound),
              (nlohmann::json{{"error", true}, {"reason", "Not Found"}}));

    const Diagnosed diagnosed;
    EXPECT_EQ(normalizer.document(&diagnosed, StatusCode::InternalServerError),
              (nlohmann::json{{"error", true}, {"reason", "Internal Server Error"}}));
}

TEST_F(ErrorNormalizerTest, AbortableDocumentCarriesMetadata)
{
    auto normalizer = make(core::Environment::development());
    const Teapot teapot;

    auto doc = normalizer.document(&teapot, StatusCode::ImATeapot);
    EXPECT_EQ(doc["error"], true);
    EXPECT_EQ(doc["reason"], "I'm a teapot");
    EXPECT_EQ(doc["metadata"], (nlohmann::json{{"brew", "coffee"}}));
    EXPECT_FALSE(doc.contains("identifier"));
}

TEST_F(ErrorNormalizerTest, DebuggableDocumentCarriesDiagnostics)
{
    auto normalizer = make(core::Environment::testing());
    const Diagnosed diagnosed;

    auto doc = normalizer.document(&diagnosed, StatusCode::InternalServerError);
    EXPECT_EQ(doc["reason"], "it broke");
    EXPECT_EQ(doc["identifier"], "Diagnosed.broken");
    EXPECT_EQ(doc["possibleCauses"], (nlohmann::json{"a", "b"}));
    EXPECT_EQ(doc["suggestedFixes"], (nlohmann::json{"c"}));
    EXPECT_FALSE(doc.contains("documentationLinks"));
    EXPECT_FALSE(doc.contains("stackOverflowQuestions"));
    EXPECT_FALSE(doc.contains("gitHubIssues"));
    EXPECT_FALSE(doc.contains("metadata"));
}

TEST_F(ErrorNormalizerTest, AbortDocumentHasBothCapabilities)
{
    auto normalizer = make(core::Environment::development());
    const auto abort = Abort::not_found();

    auto doc = normalizer.document(&abort, StatusCode::NotFound);
    EXPECT_EQ(doc["reason"], "Not Found");
    EXPECT_EQ(doc["identifier"], "Abort.notFound");
    EXPECT_TRUE(doc["metadata"].is_null());
}

TEST_F(ErrorNormalizerTest, OpaqueDocumentOutsideProduction)
{
    auto normalizer = make(core::Environment::development());
    const std::runtime_error plain("secret");

    EXPECT_EQ(normalizer.document(&plain, StatusCode::InternalServerError),
              (nlohmann::json{{"error", true}, {"reason", "Internal Server Error"}}));
}

TEST_F(ErrorNormalizerTest, NormalizeAnswersJsonByDefault)
{
    auto normalizer = make(core::Environment::development());

    auto res = normalizer.normalize(std::make_exception_ptr(Teapot{}), Request(Method::Get, "/"));
    EXPECT_EQ(res.status(), StatusCode::ImATeapot);
    EXPECT_EQ(res.header("Content-Type"), "application/json; charset=utf-8");
    EXPECT_EQ(nlohmann::json::parse(res.body())["reason"], "I'm a teapot");
}

TEST_F(ErrorNormalizerTest, NormalizeRendersHtmlWhenPreferred)
{
    auto normalizer = make(core::Environment::development());

    auto res = normalizer.normalize(std::make_exception_ptr(Abort::not_found("No user <7>")), html_request());
    EXPECT_EQ(res.status(), StatusCode::NotFound);
    EXPECT_EQ(res.header("Content-Type"), "text/html; charset=utf-8");
    EXPECT_NE(res.body().find("<h1>404 Not Found</h1>"), std::string::npos);
    EXPECT_NE(res.body().find("No user &lt;7&gt;"), std::string::npos);
    EXPECT_NE(res.body().find("Abort.notFound"), std::string::npos);
}

TEST_F(ErrorNormalizerTest, ProductionHtmlHidesDiagnostics)
{
    auto normalizer = make(core::Environment::production());

    auto res = normalizer.normalize(std::make_exception_ptr(Abort::not_found("secret detail")), html_request());
    EXPECT_EQ(res.status(), StatusCode::NotFound);
    EXPECT_EQ(res.body().find("secret detail"), std::string::npos);
    EXPECT_EQ(res.body().find("Abort.notFound"), std::string::npos);
}

TEST_F(ErrorNormalizerTest, FailingViewFallsBackToJson)
{
    auto normalizer = make(core::Environment::development(), std::make_shared<ThrowingView>());

    auto res = normalizer.normalize(std::make_exception_ptr(Abort::forbidden()), html_request());
    EXPECT_EQ(res.status(), StatusCode::Forbidden);
    EXPECT_EQ(res.header("Content-Type"), "application/json; charset=utf-8");
    EXPECT_NE(log.str().find("template exploded"), std::string::npos);
}

TEST_F(ErrorNormalizerTest, ViewThrowingNonStandardValueFallsBackToJson)
{
    auto normalizer = make(core::Environment::development(), std::make_shared<ThrowingValueView>());

    Response res;
    EXPECT_NO_THROW(res = normalizer.normalize(std::make_exception_ptr(Abort::forbidden()), html_request()));
    EXPECT_EQ(res.status(), StatusCode::Forbidden);
    EXPECT_EQ(res.header("Content-Type"), "application/json; charset=utf-8");
    EXPECT_NE(log.str().find("Error view failed, answering with JSON instead: int"), std::string::npos);
}

TEST_F(ErrorNormalizerTest, InvalidUtf8ReasonIsReplaced)
{
    auto normalizer = make(core::Environment::development());

    Response res;
    EXPECT_NO_THROW(res = normalizer.normalize(std::make_exception_ptr(Abort::not_found("No user with id \xFF\xFE")),
                                               Request(Method::Get, "/users/x")));
    EXPECT_EQ(res.status(), StatusCode::NotFound);

    const auto doc = nlohmann::json::parse(res.body());
    EXPECT_EQ(doc["reason"], "No user with id \xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(doc["identifier"], "Abort.notFound");
}

TEST_F(ErrorNormalizerTest, InvalidUtf8MetadataIsReplaced)
{
    auto normalizer = make(core::Environment::development());
    const Abort abort(StatusCode::BadRequest, Abort::Details{.metadata = {{"input", "\xC3"}}});

    Response res;
    EXPECT_NO_THROW(res = normalizer.normalize(std::make_exception_ptr(abort), Request(Method::Post, "/")));
    EXPECT_EQ(res.status(), StatusCode::BadRequest);
    EXPECT_EQ(nlohmann::json::parse(res.body())["metadata"]["input"], "\xEF\xBF\xBD");
}

TEST_F(ErrorNormalizerTest, InvalidUtf8ReasonRendersAsHtml)
{
    auto normalizer = make(core::Environment::development());

    Response res;
    EXPECT_NO_THROW(res = normalizer.normalize(std::make_exception_ptr(Abort::not_found("id \xFF")), html_request()));
    EXPECT_EQ(res.status(), StatusCode::NotFound);
    EXPECT_EQ(res.header("Content-Type"), "text/html; charset=utf-8");
}

TEST_F(ErrorNormalizerTest, LogsDebuggableDiagnostics)
{
    // Logs keep every detail, production included.
    auto normalizer = make(core::Environment::production());
    normalizer.normalize(std::make_exception_ptr(Diagnosed{}), Request(Method::Get, "/"));

    EXPECT_NE(log.str().find("[error] [Diagnosed: it broke] [Identifier: Diagnosed.broken] "
                             "[Possible Causes: a, b] [Suggested Fixes: c]"),
              std::string::npos);
    EXPECT_EQ(log.str().find("Conform"), std::string::npos);
}

TEST_F(ErrorNormalizerTest, LogsOpaqueFailureWithHint)
{
    auto normalizer = make(core::Environment::development());
    auto res = normalizer.normalize(std::make_exception_ptr(std::runtime_error("boom")), Request(Method::Get, "/"));

    EXPECT_EQ(res.status(), StatusCode::InternalServerError);
    EXPECT_NE(log.str().find("[error] [std::runtime_error: boom]"), std::string::npos);
    EXPECT_NE(log.str().find("[info] Conform 'std::runtime_error' to Debuggable to provide more debug information."),
              std::string::npos);
}

TEST_F(ErrorNormalizerTest, NonStandardThrowIsInternalError)
{
    auto normalizer = make(core::Environment::development());
    auto res = normalizer.normalize(std::make_exception_ptr(42), Request(Method::Get, "/"));

    EXPECT_EQ(res.status(), StatusCode::InternalServerError);
    EXPECT_EQ(nlohmann::json::parse(res.body()), (nlohmann::json{{"error", true}, {"reason", "Internal Server Error"}}));
    EXPECT_NE(log.str().find("[int: non-standard exception]"), std::string::npos);
}

TEST_F(ErrorNormalizerTest, InspectWarnsAboutMissingContentType)
{
    auto normalizer = make(core::Environment::development());

    normalizer.inspect(Response::text("typed"));
    EXPECT_TRUE(log.str().empty());

    normalizer.inspect(Response{StatusCode::NotModified});
    EXPECT_TRUE(log.str().empty());

    normalizer.inspect(Response::ok("untyped"));
    EXPECT_NE(log.str().find("[warning] Response had no 'Content-Type' header."), std::string::npos);
}

} // namespace conduit::http
