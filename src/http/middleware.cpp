#include "http/middleware.h"
#include "http_utils.h"
#include "security/check_result.h"
#include "utils/logger.h"

namespace Middleware {

void applySecurityHeaders(HttpResponse* resp) {
    resp->addHeader("X-Content-Type-Options", "nosniff");
    resp->addHeader("X-Frame-Options", "DENY");
    resp->addHeader("X-XSS-Protection", "1; mode=block");
    resp->addHeader("Cache-Control", "public, max-age=3600");
    resp->addHeader("Referrer-Policy", "strict-origin-when-cross-origin");
}

bool rejectTrailingSlash(const HttpRequest& req, HttpResponse* resp) {
    const std::string& path = req.getPath();
    if (path.empty() || path.back() != '/') {
        return false;
    }
    LOG_DEBUG << "Rejecting directory-style path " << path << " from " << req.getPeerAddr();
    resp->setStatusCode(HttpResponse::k404NotFound);
    resp->setContentType("text/plain; charset=utf-8");
    resp->setBody("404 page not found");
    return true;
}

namespace {

void unauthorized(const HttpRequest& req, HttpResponse* resp, const char* why) {
    LOG_WARN << rejectionName(Rejection::kUnauthorized) << ": " << why
             << " for " << req.getPath() << " from " << req.getPeerAddr();
    resp->setStatusCode(HttpResponse::k401Unauthorized);
    resp->addHeader("WWW-Authenticate", "Bearer");
    resp->setContentType("text/plain; charset=utf-8");
    resp->setBody("Unauthorized");
}

} // namespace

HttpHandler requireBearer(std::shared_ptr<const CredentialVerifier> verifier, HttpHandler next) {
    return [verifier, next](const HttpRequest& req, HttpResponse* resp) {
        if (!req.hasHeader("Authorization")) {
            unauthorized(req, resp, "missing Authorization header");
            return;
        }
        std::optional<std::string> token = HttpUtils::extractBearerToken(req.getHeader("Authorization"));
        if (!token) {
            unauthorized(req, resp, "malformed Bearer credential");
            return;
        }
        std::optional<Principal> principal = verifier->verify(*token);
        if (!principal) {
            unauthorized(req, resp, "invalid token");
            return;
        }
        LOG_DEBUG << "Authenticated " << principal->subject << " for " << req.getPath();
        next(req, resp);
    };
}

} // namespace Middleware
