#pragma once
#include "http/http_router.h"
#include "security/credential_verifier.h"
#include <memory>

namespace Middleware {

// nosniff、禁止 frame、XSS 过滤、缓存和 Referrer 策略，所有响应都加
void applySecurityHeaders(HttpResponse* resp);

// 以 '/' 结尾的路径一律 404，不进入任何 handler
// @return: 已经生成了 404 响应时返回 true
bool rejectTrailingSlash(const HttpRequest& req, HttpResponse* resp);

// 包装 handler：没有合法 Bearer 令牌时返回 401，不调用 next
HttpHandler requireBearer(std::shared_ptr<const CredentialVerifier> verifier, HttpHandler next);

} // namespace Middleware
