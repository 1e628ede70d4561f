#include <conduit/http/abort.hpp>
#include <conduit/http/fallback.hpp>
#include <conduit/http/protocol.hpp>

#include <gtest/gtest.h>

namespace conduit::http {

TEST(FallbackHandlerTest, StandardVerbsAreNotFound)
{
    FallbackHandler fallback;
    for (auto method : {Method::Get, Method::Post, Method::Put, Method::Patch, Method::Delete}) {
        try {
            fallback(Request(method, "/missing"));
            ADD_FAILURE() << "expected Abort for " << to_string(method);
        } catch (const Abort& e) {
            EXPECT_EQ(e.status(), StatusCode::NotFound);
            EXPECT_EQ(e.full_identifier(), "Abort.notFound");
        }
    }
}

TEST(FallbackHandlerTest, OptionsAnswersAllow)
{
    auto res = FallbackHandler{}(Request(Method::Options, "/anything"));
    EXPECT_EQ(res.status(), StatusCode::OK);
    EXPECT_EQ(res.header("Allow"), "OPTIONS");
    EXPECT_TRUE(res.body().empty());
}

TEST(FallbackHandlerTest, OtherVerbsAreNotImplemented)
{
    FallbackHandler fallback;
    EXPECT_EQ(fallback(Request("PROPFIND", "/")).status(), StatusCode::NotImplemented);
    EXPECT_EQ(fallback(Request(Method::Trace, "/")).status(), StatusCode::NotImplemented);
    EXPECT_EQ(fallback(Request(Method::Connect, "/")).status(), StatusCode::NotImplemented);
}

TEST(ProtocolTest, HeadIsServedAsGet)
{
    Request req(Method::Head, "/users");
    EXPECT_EQ(normalize_method(req), Method::Head);
    EXPECT_EQ(req.method(), Method::Get);
    EXPECT_EQ(req.method_name(), "GET");
}

TEST(ProtocolTest, OtherMethodsAreUntouched)
{
    Request req(Method::Post, "/users");
    EXPECT_EQ(normalize_method(req), Method::Post);
    EXPECT_EQ(req.method(), Method::Post);
}

TEST(ProtocolTest, FormFieldOverridesMethod)
{
    Request req(Method::Post, "/users/1");
    req.set_header("Content-Type", "application/x-www-form-urlencoded");
    req.set_body("_method=delete");

    EXPECT_EQ(normalize_method(req), Method::Delete);
    EXPECT_EQ(req.method_name(), "DELETE");
}

TEST(ProtocolTest, OverrideToHeadIsServedAsGet)
{
    Request req(Method::Post, "/users");
    req.set_field(kMethodOverrideField, "HEAD");

    EXPECT_EQ(normalize_method(req), Method::Head);
    EXPECT_EQ(req.method(), Method::Get);
}

TEST(ProtocolTest, EmptyOverrideIsIgnored)
{
    Request req(Method::Post, "/users");
    req.set_field(kMethodOverrideField, "");
    EXPECT_EQ(normalize_method(req), Method::Post);
}

TEST(ProtocolTest, FinalizeStripsBodyForHeadOnly)
{
    auto head = Response::text("body", StatusCode::Accepted);
    head.set_header("X-Custom", "1");
    finalize_response(Method::Head, head);
    EXPECT_EQ(head.status(), StatusCode::Accepted);
    EXPECT_EQ(head.header("X-Custom"), "1");
    EXPECT_EQ(head.header("Content-Type"), "text/plain; charset=utf-8");
    EXPECT_TRUE(head.body().empty());

    auto get = Response::text("body");
    finalize_response(Method::Get, get);
    EXPECT_EQ(get.body(), "body");
}

} // namespace conduit::http
