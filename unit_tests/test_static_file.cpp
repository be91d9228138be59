#include "gtest/gtest.h"
#include "http/static_file.h"
#include "test_utils.h"
#include "utils/timestamp.h"
#include <filesystem>
#include <sys/stat.h>

namespace {

time_t mtimeOf(const std::filesystem::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return st.st_mtime;
}

HttpRequest requestWithSince(const std::string& since) {
    HttpRequest req;
    req.setMethod(HttpRequest::GET);
    req.setPath("/doc");
    if (!since.empty()) {
        req.setHeader("If-Modified-Since", since);
    }
    return req;
}

} // namespace

TEST(StaticFileTest, ServesBodyWithLastModified) {
    TempDir dir("staticfile");
    write_test_file(dir / "guide.txt", "plain text guide");
    std::string path = (dir / "guide.txt").string();

    HttpResponse resp;
    ASSERT_TRUE(StaticFile::serve(requestWithSince(""), &resp, path, "text/plain", "attachment; filename=\"guide.txt\""));
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(resp.getBody(), "plain text guide");
    EXPECT_EQ(resp.getHeader("Content-Length"), "16");
    EXPECT_EQ(resp.getHeader("Content-Disposition"), "attachment; filename=\"guide.txt\"");
    EXPECT_EQ(resp.getHeader("Last-Modified"), Timestamp::fromUnixTime(mtimeOf(path)).toHttpDate());
}

TEST(StaticFileTest, NotModifiedWhenSinceIsCurrent) {
    TempDir dir("staticfile");
    write_test_file(dir / "guide.pdf", "%PDF");
    std::string path = (dir / "guide.pdf").string();
    std::string last_modified = Timestamp::fromUnixTime(mtimeOf(path)).toHttpDate();

    HttpResponse resp;
    ASSERT_TRUE(StaticFile::serve(requestWithSince(last_modified), &resp, path, "application/pdf"));
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k304NotModified);
    EXPECT_TRUE(resp.getBody().empty());
    EXPECT_FALSE(resp.hasHeader("Content-Disposition"));
}

TEST(StaticFileTest, ModifiedWhenSinceIsOlder) {
    TempDir dir("staticfile");
    write_test_file(dir / "guide.pdf", "%PDF");
    std::string path = (dir / "guide.pdf").string();

    HttpResponse resp;
    ASSERT_TRUE(StaticFile::serve(requestWithSince("Sun, 06 Nov 1994 08:49:37 GMT"), &resp, path, "application/pdf"));
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
    EXPECT_EQ(resp.getBody(), "%PDF");
}

TEST(StaticFileTest, GarbageSinceIsIgnored) {
    TempDir dir("staticfile");
    write_test_file(dir / "guide.pdf", "%PDF");
    HttpResponse resp;
    ASSERT_TRUE(StaticFile::serve(requestWithSince("not a date"), &resp, (dir / "guide.pdf").string(), "application/pdf"));
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k200Ok);
}

TEST(StaticFileTest, MissingFileIs500) {
    TempDir dir("staticfile");
    HttpResponse resp;
    EXPECT_FALSE(StaticFile::serve(requestWithSince(""), &resp, (dir / "gone.pdf").string(), "application/pdf"));
    EXPECT_EQ(resp.getStatusCode(), HttpResponse::k500InternalServerError);
}

TEST(StaticFileTest, InfersContentTypeFromExtension) {
    TempDir dir("staticfile");
    write_test_file(dir / "page.HTML", "<html></html>");
    HttpResponse resp;
    ASSERT_TRUE(StaticFile::serve(requestWithSince(""), &resp, (dir / "page.HTML").string()));
    EXPECT_EQ(resp.getHeader("Content-Type"), "text/html; charset=utf-8");
}
