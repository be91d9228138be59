#pragma once
#include "http/http_router.h"
#include "server.h"
#include "utils/noncopyable.h"
#include <memory>
#include <string>

// 在 Server 之上解析 HTTP 请求并分发到路由，HTTP 和 HTTPS 监听可以共享一个路由表
class HttpServer : NonCopyable{
public:
    static const char* const kServerName;

    HttpServer(EventLoop* loop, const std::string& name, uint16_t port, int idle_timeout_sec,
               int num_threads, std::shared_ptr<const HttpRouter> router);

    void enableSsl(const std::string& cert_path, const std::string& key_path) {
        server_.enableSsl(cert_path, key_path);
    }
    void start() { server_.start(); }
    uint16_t port() const { return server_.port(); }
    const std::string& name() const { return server_.name(); }

    // 一个完整请求的处理流程，不涉及连接：目录式路径拦截、路由、安全头
    static void dispatch(const HttpRouter& router, HttpRequest& req, HttpResponse* resp);

private:
    static void sendBadRequest(const Server::ConnectionPtr& conn);

    std::shared_ptr<const HttpRouter> router_;
    // 最后声明，最先析构
    Server server_;
};
