#include "http/handlers.h"
#include "http/middleware.h"
#include "http/static_file.h"
#include "http_utils.h"
#include "mime_types.h"
#include "security/path_resolver.h"
#include "utils/logger.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

const char* const DownloadHandlers::kNotAvailableBody = "User guide not available";

namespace {

void notFound(HttpResponse* resp, const char* body) {
    resp->setStatusCode(HttpResponse::k404NotFound);
    resp->setContentType("text/plain; charset=utf-8");
    resp->setBody(body);
}

} // namespace

DownloadHandlers::DownloadHandlers(const ServerSettings& settings,
                                   std::shared_ptr<const CredentialVerifier> verifier)
    : service_(settings.user_guide_dir, settings.user_guide_file),
      public_document_(settings.public_document),
      static_dir_(settings.static_dir),
      verifier_(std::move(verifier)) {}

void DownloadHandlers::registerRoutes(HttpRouter* router) const {
    router->addRoute(HttpRequest::GET, "/public/download",
        [this](const HttpRequest& req, HttpResponse* resp) { handlePublicDownload(req, resp); });

    HttpHandler download = Middleware::requireBearer(verifier_,
        [this](const HttpRequest& req, HttpResponse* resp) { handleUserGuideDownload(req, resp); });
    router->addRoute(HttpRequest::GET, "/protected/download", download);
    // 旧路径，行为相同
    router->addRoute(HttpRequest::GET, "/download/userguide", download);

    router->addRoute(HttpRequest::GET, "/health",
        [this](const HttpRequest& req, HttpResponse* resp) { handleHealth(req, resp); });
    router->addRoute(HttpRequest::GET, "/static/(.+)",
        [this](const HttpRequest& req, HttpResponse* resp) { handleStatic(req, resp); });
}

void DownloadHandlers::handlePublicDownload(const HttpRequest& req, HttpResponse* resp) const {
    std::error_code ec;
    if (!fs::is_regular_file(public_document_, ec)) {
        LOG_WARN << "Public document " << public_document_ << " missing, request from " << req.getPeerAddr();
        notFound(resp, "404 page not found");
        return;
    }
    LOG_INFO << "Serving public document to " << req.getPeerAddr();
    StaticFile::serve(req, resp, public_document_, "application/pdf",
                      HttpUtils::attachmentDisposition("user-guide.pdf"));
}

void DownloadHandlers::handleUserGuideDownload(const HttpRequest& req, HttpResponse* resp) const {
    LOG_INFO << "User guide download request from " << req.getPeerAddr();

    std::string filename;
    CheckResult located = service_.locateUserGuide(&filename);
    if (!located) {
        LOG_WARN << "User guide download failed from " << req.getPeerAddr() << ": " << located.describe();
        notFound(resp, kNotAvailableBody);
        return;
    }

    // 内容来自 canonical 路径，类型和文件名来自校验过的名字
    std::string content_type = MimeTypes::getMimeType(PathResolver::extensionOf(filename));
    LOG_INFO << "Serving user guide " << filename << " to " << req.getPeerAddr();
    StaticFile::serve(req, resp, located.value(), content_type,
                      HttpUtils::attachmentDisposition(filename));
}

void DownloadHandlers::handleHealth(const HttpRequest&, HttpResponse* resp) const {
    resp->setStatusCode(HttpResponse::k200Ok);
    resp->setContentType("application/json");
    resp->setBody("{\"status\": \"healthy\"}");
}

void DownloadHandlers::handleStatic(const HttpRequest& req, HttpResponse* resp) const {
    const RouteParams& params = req.getRouteParams();
    if (params.empty()) {
        notFound(resp, "404 page not found");
        return;
    }
    CheckResult located = PathResolver::containedRegularFile(static_dir_, params[0]);
    if (!located) {
        LOG_WARN << "Static request " << req.getPath() << " from " << req.getPeerAddr()
                 << " rejected: " << located.describe();
        notFound(resp, "404 page not found");
        return;
    }
    StaticFile::serve(req, resp, located.value());
}
