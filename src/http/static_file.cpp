#include "http/static_file.h"
#include "mime_types.h"
#include "security/path_resolver.h"
#include "utils/logger.h"
#include "utils/timestamp.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace {

void internalError(HttpResponse* resp) {
    resp->setStatusCode(HttpResponse::k500InternalServerError);
    resp->setContentType("text/plain; charset=utf-8");
    resp->setBody("Internal Server Error");
}

} // namespace

bool StaticFile::serve(const HttpRequest& req, HttpResponse* resp, const std::string& path) {
    return serve(req, resp, path, MimeTypes::getMimeType(PathResolver::extensionOf(path)));
}

bool StaticFile::serve(const HttpRequest& req, HttpResponse* resp, const std::string& path,
                       const std::string& content_type, const std::string& disposition) {
    struct stat st;
    if (::stat(path.c_str(), &st) < 0) {
        LOG_ERROR << "stat " << path << " failed: " << strerror(errno);
        internalError(resp);
        return false;
    }
    Timestamp modified = Timestamp::fromUnixTime(st.st_mtime);
    std::string last_modified = modified.toHttpDate();

    std::string since_header = req.getHeader("If-Modified-Since");
    if (!since_header.empty()) {
        Timestamp since = Timestamp::fromHttpDate(since_header);
        // HTTP 日期只精确到秒
        if (since.valid() && since.secondsSinceEpoch() >= modified.secondsSinceEpoch()) {
            resp->setStatusCode(HttpResponse::k304NotModified);
            resp->addHeader("Last-Modified", last_modified);
            return true;
        }
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        LOG_ERROR << "Cannot open " << path << ": " << strerror(errno);
        internalError(resp);
        return false;
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        LOG_ERROR << "Read error on " << path;
        internalError(resp);
        return false;
    }

    resp->setStatusCode(HttpResponse::k200Ok);
    resp->setContentType(content_type);
    resp->addHeader("Last-Modified", last_modified);
    if (!disposition.empty()) {
        resp->addHeader("Content-Disposition", disposition);
    }
    resp->setBody(content.str());
    return true;
}
