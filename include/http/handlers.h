#pragma once
#include "http/http_router.h"
#include "security/credential_verifier.h"
#include "service/user_guide_service.h"
#include "utils/server_settings.h"
#include <memory>
#include <string>

// 下载服务的全部 handler，构造后只读，可被多个工作线程同时调用
class DownloadHandlers{
public:
    DownloadHandlers(const ServerSettings& settings, std::shared_ptr<const CredentialVerifier> verifier);

    // GET /public/download、/protected/download、/download/userguide、/health、/static/(.+)
    void registerRoutes(HttpRouter* router) const;

    // 不校验，直接发送配置的公开文档
    void handlePublicDownload(const HttpRequest& req, HttpResponse* resp) const;
    // 调用前须已通过令牌校验
    void handleUserGuideDownload(const HttpRequest& req, HttpResponse* resp) const;
    void handleHealth(const HttpRequest& req, HttpResponse* resp) const;
    void handleStatic(const HttpRequest& req, HttpResponse* resp) const;

    static const char* const kNotAvailableBody;

private:
    UserGuideService service_;
    const std::string public_document_;
    const std::string static_dir_;
    std::shared_ptr<const CredentialVerifier> verifier_;
};
