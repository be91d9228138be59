#include "http/http_server.h"
#include "http/middleware.h"
#include "utils/logger.h"

const char* const HttpServer::kServerName = "guide_server";

HttpServer::HttpServer(EventLoop* loop, const std::string& name, uint16_t port, int idle_timeout_sec,
                       int num_threads, std::shared_ptr<const HttpRouter> router)
    : router_(std::move(router)),
      server_(loop, name, port, idle_timeout_sec, num_threads) {
    // router_ 由 shared_ptr 持有，回调拷贝一份，避免在工作线程里访问已析构的 HttpServer
    std::shared_ptr<const HttpRouter> shared_router = router_;
    // 建议客户端比服务端略早关闭空闲连接，避免竞态
    int advertised = idle_timeout_sec > 5 ? idle_timeout_sec - 5 : 1;
    std::string keep_alive_header = "timeout=" + std::to_string(advertised) + ", max=10000";
    server_.setMessageCallback([shared_router, keep_alive_header](const Server::ConnectionPtr& conn, Buffer* buf) {
        HttpRequest& req = conn->getRequest();
        while (buf->readableBytes() > 0) {
            if (!req.parse(buf)) {
                LOG_WARN << "Bad request from " << conn->getPeerAddrStr();
                buf->retrieveAll();
                sendBadRequest(conn);
                return;
            }
            if (!req.gotAll()) {
                break;
            }

            HttpResponse resp;
            dispatch(*shared_router, req, &resp);
            bool keep_alive = req.keepAlive();
            resp.setKeepAlive(keep_alive);
            if (keep_alive) {
                resp.addHeader("Keep-Alive", keep_alive_header);
            }
            LOG_DEBUG << HttpRequest::methodName(req.getMethod()) << " " << req.getPath()
                      << " " << static_cast<int>(resp.getStatusCode()) << " " << conn->getPeerAddrStr();

            Buffer out;
            resp.appendToBuffer(&out);
            conn->send(&out);
            req.reset();
            if (!keep_alive) {
                buf->retrieveAll();
                conn->shutdown();
                return;
            }
        }
    });
}

void HttpServer::dispatch(const HttpRouter& router, HttpRequest& req, HttpResponse* resp) {
    if (!Middleware::rejectTrailingSlash(req, resp)) {
        router.route(req, resp);
    }
    Middleware::applySecurityHeaders(resp);
    resp->addHeader("Server", kServerName);
    resp->addHeader("Date", Timestamp::now().toHttpDate());
}

void HttpServer::sendBadRequest(const Server::ConnectionPtr& conn) {
    HttpResponse resp;
    resp.setStatusCode(HttpResponse::k400BadRequest);
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody("400 Bad Request");
    Middleware::applySecurityHeaders(&resp);
    resp.addHeader("Server", kServerName);
    resp.setKeepAlive(false);

    Buffer out;
    resp.appendToBuffer(&out);
    conn->send(&out);
    conn->getRequest().reset();
    conn->shutdown();
}
