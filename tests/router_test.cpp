#include <conduit/http/router.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace conduit::http {

namespace {

Response dispatch(const Router& router, const Request& req)
{
    auto handler = router.route(req);
    if (!handler) {
        ADD_FAILURE() << "no route for " << req.method_name() << " " << req.path();
        return Response{StatusCode::NotFound};
    }
    return (*handler)(req);
}

} // namespace

class RouterTest : public ::testing::Test {
protected:
    Router router;
};

TEST_F(RouterTest, MatchesStaticRoute)
{
    router.get("/users", [](const Request&) { return Response::text("index"); });

    EXPECT_EQ(dispatch(router, Request(Method::Get, "/users")).body(), "index");
    EXPECT_EQ(dispatch(router, Request(Method::Get, "/users/")).body(), "index");
}

TEST_F(RouterTest, NoMatchYieldsNothing)
{
    router.get("/users", [](const Request&) { return Response::ok(); });

    EXPECT_FALSE(router.route(Request(Method::Get, "/missing")).has_value());
    EXPECT_FALSE(router.route(Request(Method::Post, "/users")).has_value());
    EXPECT_FALSE(router.route(Request("PROPFIND", "/users")).has_value());
}

TEST_F(RouterTest, ExtractsParameters)
{
    router.get("/users/{id}/posts/{post}", [](const Request& req) {
        return Response::text(req.param("id") + "-" + req.param("post"));
    });

    EXPECT_EQ(dispatch(router, Request(Method::Get, "/users/7/posts/42")).body(), "7-42");
    EXPECT_FALSE(router.route(Request(Method::Get, "/users/7/posts")).has_value());
}

TEST_F(RouterTest, LiteralSegmentsAreNotPatterns)
{
    router.get("/files/a.txt", [](const Request&) { return Response::ok(); });

    EXPECT_TRUE(router.route(Request(Method::Get, "/files/a.txt")).has_value());
    EXPECT_FALSE(router.route(Request(Method::Get, "/files/abtxt")).has_value());
}

TEST_F(RouterTest, FirstRegisteredWins)
{
    router.get("/users/me", [](const Request&) { return Response::text("me"); });
    router.get("/users/{id}", [](const Request&) { return Response::text("id"); });

    EXPECT_EQ(dispatch(router, Request(Method::Get, "/users/me")).body(), "me");
    EXPECT_EQ(dispatch(router, Request(Method::Get, "/users/3")).body(), "id");
}

TEST_F(RouterTest, MatchAndAny)
{
    router.match({"PUT", "PATCH"}, "/items/{id}", [](const Request& req) { return Response::text(req.method_name()); });
    router.any("/ping", [](const Request&) { return Response::text("pong"); });

    EXPECT_EQ(dispatch(router, Request(Method::Patch, "/items/1")).body(), "PATCH");
    EXPECT_EQ(dispatch(router, Request(Method::Put, "/items/1")).body(), "PUT");
    EXPECT_EQ(dispatch(router, Request(Method::Delete, "/ping")).body(), "pong");
    EXPECT_EQ(router.size(), 8U);
}

TEST_F(RouterTest, GroupsSharePrefixAndMiddleware)
{
    std::vector<std::string> trace;
    auto admin = router.group("/admin");
    admin.middleware([&trace](const Request& req, const Handler& next) {
        trace.push_back("group");
        return next(req);
    });
    admin.get("/dashboard", [&trace](const Request&) {
        trace.push_back("handler");
        return Response::text("dashboard");
    }).middleware([&trace](const Request& req, const Handler& next) {
        trace.push_back("route");
        return next(req);
    });

    EXPECT_EQ(dispatch(router, Request(Method::Get, "/admin/dashboard")).body(), "dashboard");
    EXPECT_EQ(trace, (std::vector<std::string>{"group", "route", "handler"}));
}

TEST_F(RouterTest, NestedGroups)
{
    router.group("/api").group("/v1").get("/status", [](const Request&) { return Response::text("ok"); });
    router.group("/api").group([](Router::Group& api) {
        api.post("/echo", [](const Request& req) { return Response::text(req.body()); });
    });

    EXPECT_EQ(dispatch(router, Request(Method::Get, "/api/v1/status")).body(), "ok");

    Request echo(Method::Post, "/api/echo");
    echo.set_body("hi");
    EXPECT_EQ(dispatch(router, echo).body(), "hi");
}

TEST_F(RouterTest, UrlFor)
{
    router.get("/users/{id}", [](const Request&) { return Response::ok(); }).name("users.show");
    router.group("/users").get("/", [](const Request&) { return Response::ok(); }).name("users.index");

    EXPECT_EQ(router.url_for("users.show", {{"id", "5"}}), "/users/5");
    EXPECT_EQ(router.url_for("users.index"), "/users");
    EXPECT_EQ(router.url_for("unknown"), "");
}

TEST_F(RouterTest, RouteDoesNotMutateCallerRequest)
{
    router.get("/users/{id}", [](const Request& req) { return Response::text(req.param("id")); });

    Request req(Method::Get, "/users/9");
    EXPECT_EQ(dispatch(router, req).body(), "9");
    EXPECT_TRUE(req.params().empty());
}

TEST(RouterPathTest, JoinPaths)
{
    EXPECT_EQ(Router::join_paths("/api", "status"), "/api/status");
    EXPECT_EQ(Router::join_paths("", "/x"), "/x");
    EXPECT_EQ(Router::join_paths("/api", "/"), "/api");
    EXPECT_EQ(Router::normalize_path(""), "/");
}

} // namespace conduit::http
