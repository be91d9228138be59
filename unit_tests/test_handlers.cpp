#include "gtest/gtest.h"
#include "http/handlers.h"
#include "http/http_server.h"
#include "security/credential_verifier.h"
#include "test_utils.h"
#include "utils/server_settings.h"
#include <memory>
#include <string>

class DownloadHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::make_unique<TempDir>("handlers");
        write_test_file(*root_ / "userguides" / "user-guide.pdf", "%PDF-1.4 protected guide");
        write_test_file(*root_ / "userguides" / "notes.exe", "MZ");
        write_test_file(*root_ / "public" / "user-guide.pdf", "%PDF-1.4 public guide");
        write_test_file(*root_ / "static" / "css" / "site.css", "body{}");

        settings_.user_guide_dir = (*root_ / "userguides").string();
        settings_.user_guide_file = "user-guide.pdf";
        settings_.public_document = (*root_ / "public" / "user-guide.pdf").string();
        settings_.static_dir = (*root_ / "static").string();
        rebuild();
    }

    void rebuild() {
        router_ = std::make_unique<HttpRouter>();
        handlers_ = std::make_unique<DownloadHandlers>(
            settings_, std::make_shared<StaticTokenVerifier>(settings_.auth_token));
        handlers_->registerRoutes(router_.get());
    }

    HttpResponse get(const std::string& path, const std::string& authorization = std::string()) {
        HttpRequest req;
        req.setMethod(HttpRequest::GET);
        req.setPath(path);
        req.setVersion("HTTP/1.1");
        req.setPeerAddr("127.0.0.1:50000");
        if (!authorization.empty()) {
            req.setHeader("Authorization", authorization);
        }
        HttpResponse resp;
        HttpServer::dispatch(*router_, req, &resp);
        return resp;
    }

    std::unique_ptr<TempDir> root_;
    ServerSettings settings_;
    std::unique_ptr<HttpRouter> router_;
    std::unique_ptr<DownloadHandlers> handlers_;
};

TEST_F(DownloadHandlersTest, ProtectedDownloadWithoutHeaderIs401) {
    HttpResponse resp = get("/protected/download");
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k401Unauthorized);
    EXPECT_EQ(resp.getHeader("WWW-Authenticate"), "Bearer");
    EXPECT_EQ(resp.getBody(), "Unauthorized");
}

TEST_F(DownloadHandlersTest, ProtectedDownloadWithWrongTokenIs401) {
    EXPECT_EQ(get("/protected/download", "Bearer wrong-token").getStatusCode(),
              HttpResponse::k401Unauthorized);
    EXPECT_EQ(get("/protected/download", "Basic dXNlcjpwYXNz").getStatusCode(),
              HttpResponse::k401Unauthorized);
}

TEST_F(DownloadHandlersTest, ProtectedDownloadWithValidTokenServesGuide) {
    HttpResponse resp = get("/protected/download", "Bearer valid-oauth-token");
    ASSERT_EQ(resp.getStatusCode(), HttpResponse::k200Ok) << resp.getBody();
    EXPECT_EQ(resp.getBody(), "%PDF-1.4 protected guide");
    EXPECT_EQ(resp.getHeader("Content-Type"), "application/pdf");
    EXPECT_EQ(resp.getHeader("Content-Disposition"), "attachment; filename=\"user-guide.pdf\"");
    EXPECT_FALSE(resp.getHeader("Last-Modified").empty());
}

TEST_F(DownloadHandlersTest, HeadersFollowConfiguredNameNotSymlinkTarget) {
    write_test_file(*root_ / "userguides" / "page.html", "<html>guide</html>");
    std::filesystem::create_symlink(*root_ / "userguides" / "page.html",
                                    *root_ / "userguides" / "guide.pdf");
    settings_.user_guide_file = "guide.pdf";
    rebuild();

    HttpResponse resp = get("/protected/download", "Bearer valid-oauth-token");
    ASSERT_EQ(resp.getStatusCode(), HttpResponse::k200Ok) << resp.getBody();
    EXPECT_EQ(resp.getBody(), "<html>guide</html>");
    EXPECT_EQ(resp.getHeader("Content-Type"), "application/pdf");
    EXPECT_EQ(resp.getHeader("Content-Disposition"), "attachment; filename=\"guide.pdf\"");
}

TEST_F(DownloadHandlersTest, LegacyAliasBehavesTheSame) {
    EXPECT_EQ(get("/download/userguide").getStatusCode(), HttpResponse::k401Unauthorized);
    HttpResponse resp = get("/download/userguide", "bearer valid-oauth-token");
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(resp.getBody(), "%PDF-1.4 protected guide");
}

TEST_F(DownloadHandlersTest, DisallowedConfiguredFileIs404) {
    settings_.user_guide_file = "notes.exe";
    rebuild();
    HttpResponse resp = get("/protected/download", "Bearer valid-oauth-token");
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k404NotFound);
    EXPECT_EQ(resp.getBody(), "User guide not available");
}

TEST_F(DownloadHandlersTest, TraversalInConfiguredFileIs404) {
    settings_.user_guide_file = "..%2f..%2fetc%2fpasswd";
    rebuild();
    HttpResponse resp = get("/protected/download", "Bearer valid-oauth-token");
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k404NotFound);
    EXPECT_EQ(resp.getBody(), "User guide not available");
}

TEST_F(DownloadHandlersTest, MissingGuideIs404) {
    settings_.user_guide_file = "other.pdf";
    rebuild();
    EXPECT_EQ(get("/protected/download", "Bearer valid-oauth-token").getStatusCode(),
              HttpResponse::k404NotFound);
}

TEST_F(DownloadHandlersTest, CustomTokenFromSettings) {
    settings_.auth_token = "rotated-token";
    rebuild();
    EXPECT_EQ(get("/protected/download", "Bearer valid-oauth-token").getStatusCode(),
              HttpResponse::k401Unauthorized);
    EXPECT_EQ(get("/protected/download", "Bearer rotated-token").getStatusCode(),
              HttpResponse::k200Ok);
}

TEST_F(DownloadHandlersTest, PublicDownloadNeedsNoAuth) {
    HttpResponse resp = get("/public/download");
    ASSERT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(resp.getBody(), "%PDF-1.4 public guide");
    EXPECT_EQ(resp.getHeader("Content-Type"), "application/pdf");
    EXPECT_EQ(resp.getHeader("Content-Disposition"), "attachment; filename=\"user-guide.pdf\"");
}

TEST_F(DownloadHandlersTest, PublicDownloadMissingIs404) {
    settings_.public_document = (*root_ / "public" / "gone.pdf").string();
    rebuild();
    EXPECT_EQ(get("/public/download").getStatusCode(), HttpResponse::k404NotFound);
}

TEST_F(DownloadHandlersTest, HealthReportsHealthy) {
    HttpResponse resp = get("/health");
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(resp.getHeader("Content-Type"), "application/json");
    EXPECT_EQ(resp.getBody(), "{\"status\": \"healthy\"}");
}

TEST_F(DownloadHandlersTest, StaticPassthroughKeepsContainment) {
    HttpResponse ok = get("/static/css/site.css");
    ASSERT_EQ(ok.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(ok.getBody(), "body{}");
    EXPECT_EQ(ok.getHeader("Content-Type"), "text/css");

    EXPECT_EQ(get("/static/../userguides/user-guide.pdf").getStatusCode(), HttpResponse::k404NotFound);
    EXPECT_EQ(get("/static/missing.css").getStatusCode(), HttpResponse::k404NotFound);
}

TEST_F(DownloadHandlersTest, EveryResponseCarriesSecurityHeaders) {
    const char* paths[] = {"/health", "/protected/download", "/nope", "/health/"};
    for (const char* path : paths) {
        HttpResponse resp = get(path);
        EXPECT_EQ(resp.getHeader("X-Content-Type-Options"), "nosniff") << path;
        EXPECT_EQ(resp.getHeader("X-Frame-Options"), "DENY") << path;
        EXPECT_EQ(resp.getHeader("X-XSS-Protection"), "1; mode=block") << path;
        EXPECT_EQ(resp.getHeader("Cache-Control"), "public, max-age=3600") << path;
        EXPECT_EQ(resp.getHeader("Referrer-Policy"), "strict-origin-when-cross-origin") << path;
        EXPECT_EQ(resp.getHeader("Server"), "guide_server") << path;
    }
}

TEST_F(DownloadHandlersTest, TrailingSlashIs404BeforeHandlers) {
    EXPECT_EQ(get("/health/").getStatusCode(), HttpResponse::k404NotFound);
    EXPECT_EQ(get("/protected/download/", "Bearer valid-oauth-token").getStatusCode(),
              HttpResponse::k404NotFound);
    EXPECT_EQ(get("/").getStatusCode(), HttpResponse::k404NotFound);
}

TEST_F(DownloadHandlersTest, NonGetMethodIs405) {
    HttpRequest req;
    req.setMethod(HttpRequest::POST);
    req.setPath("/health");
    HttpResponse resp;
    HttpServer::dispatch(*router_, req, &resp);
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k405MethodNotAllowed);
    EXPECT_EQ(resp.getHeader("Allow"), "GET");
}
