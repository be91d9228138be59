#include "gtest/gtest.h"
#include "http/http_router.h"
#include <string>

namespace {

HttpRequest makeRequest(HttpRequest::Method method, const std::string& path) {
    HttpRequest req;
    req.setMethod(method);
    req.setPath(path);
    req.setVersion("HTTP/1.1");
    return req;
}

HttpHandler bodyHandler(const std::string& body) {
    return [body](const HttpRequest&, HttpResponse* resp) {
        resp->setStatusCode(HttpResponse::k200Ok);
        resp->setBody(body);
    };
}

} // namespace

TEST(HttpRouterTest, ExactRouteMatches) {
    HttpRouter router;
    ASSERT_TRUE(router.addRoute(HttpRequest::GET, "/health", bodyHandler("ok")));
    HttpRequest req = makeRequest(HttpRequest::GET, "/health");
    HttpResponse resp;
    router.route(req, &resp);
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(resp.getBody(), "ok");
}

TEST(HttpRouterTest, UnknownPathIs404) {
    HttpRouter router;
    router.addRoute(HttpRequest::GET, "/health", bodyHandler("ok"));
    HttpRequest req = makeRequest(HttpRequest::GET, "/nope");
    HttpResponse resp;
    router.route(req, &resp);
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k404NotFound);
}

TEST(HttpRouterTest, WrongMethodIs405WithAllow) {
    HttpRouter router;
    router.addRoute(HttpRequest::GET, "/health", bodyHandler("ok"));
    HttpRequest req = makeRequest(HttpRequest::POST, "/health");
    HttpResponse resp;
    router.route(req, &resp);
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k405MethodNotAllowed);
    EXPECT_EQ(resp.getHeader("Allow"), "GET");
}

TEST(HttpRouterTest, RegexRouteCapturesParams) {
    HttpRouter router;
    std::string captured;
    ASSERT_TRUE(router.addRoute(HttpRequest::GET, "/static/(.+)",
        [&captured](const HttpRequest& req, HttpResponse* resp) {
            captured = req.getRouteParams().at(0);
            resp->setStatusCode(HttpResponse::k200Ok);
        }));
    HttpRequest req = makeRequest(HttpRequest::GET, "/static/css/site.css");
    HttpResponse resp;
    router.route(req, &resp);
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(captured, "css/site.css");

    HttpRequest post = makeRequest(HttpRequest::DELETE, "/static/x");
    HttpResponse post_resp;
    router.route(post, &post_resp);
    EXPECT_EQ(post_resp.getStatusCode(), HttpResponse::k405MethodNotAllowed);
}

TEST(HttpRouterTest, ExactRouteWinsOverRegex) {
    HttpRouter router;
    router.addRoute(HttpRequest::GET, "/static/(.+)", bodyHandler("regex"));
    router.addRoute(HttpRequest::GET, "/static/special", bodyHandler("exact"));
    HttpRequest req = makeRequest(HttpRequest::GET, "/static/special");
    HttpResponse resp;
    router.route(req, &resp);
    EXPECT_EQ(resp.getBody(), "exact");
}

TEST(HttpRouterTest, InvalidRegexIsRejected) {
    HttpRouter router;
    EXPECT_FALSE(router.addRoute(HttpRequest::GET, "/bad/(unclosed", bodyHandler("x")));
    EXPECT_EQ(router.routeCount(), 0u);
}

TEST(HttpResponseTest, SerializesStatusHeadersAndBody) {
    HttpResponse resp;
    resp.setStatusCode(HttpResponse::k404NotFound);
    resp.setContentType("text/plain");
    resp.setBody("User guide not available");
    Buffer buf;
    resp.appendToBuffer(&buf);
    std::string wire = buf.retrieveAllAsString();
    EXPECT_EQ(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u) << wire;
    EXPECT_NE(wire.find("Content-Length: 24\r\n"), std::string::npos) << wire;
    EXPECT_NE(wire.find("Content-Type: text/plain\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 24), "User guide not available");
}

TEST(HttpResponseTest, EmptyBodyGetsZeroLengthExceptNotModified) {
    HttpResponse empty;
    empty.setStatusCode(HttpResponse::k200Ok);
    Buffer buf;
    empty.appendToBuffer(&buf);
    EXPECT_NE(buf.retrieveAllAsString().find("Content-Length: 0\r\n"), std::string::npos);

    HttpResponse not_modified;
    not_modified.setStatusCode(HttpResponse::k304NotModified);
    not_modified.appendToBuffer(&buf);
    std::string wire = buf.retrieveAllAsString();
    EXPECT_EQ(wire.find("Content-Length"), std::string::npos) << wire;
    EXPECT_EQ(wire.rfind("HTTP/1.1 304 Not Modified\r\n", 0), 0u);
}
