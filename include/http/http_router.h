#pragma once
#include "http_request.h"
#include "http_response.h"
#include <functional>
#include <map>
#include <regex>
#include <string>
#include <vector>

// 所有HTTP请求处理函数的统一签名
// 参数：解析好的请求对象，待填充的响应对象
using HttpHandler = std::function<void(const HttpRequest&, HttpResponse*)>;

class HttpRouter{
public:
    struct Route {
        HttpRequest::Method method;
        std::string pattern;
        std::regex path_regex;
        HttpHandler handler;
    };

    // 不含正则元字符的路径走精确匹配，否则编译为正则
    // @return: 正则编译失败返回 false
    bool addRoute(HttpRequest::Method method, const std::string& path_pattern, HttpHandler handler);

    // 精确匹配优先，再按注册顺序尝试正则
    // 路径存在但方法不匹配时返回 405 并带 Allow 头，否则 404
    void route(HttpRequest& req, HttpResponse* resp) const;

    size_t routeCount() const;

private:
    void handleNotFound(const HttpRequest& req, HttpResponse* resp) const;
    void handleMethodNotAllowed(const HttpRequest& req, HttpResponse* resp,
                                const std::vector<HttpRequest::Method>& allowed) const;

    // 精确匹配：map<path, map<method, handler>>
    std::map<std::string, std::map<HttpRequest::Method, HttpHandler>> static_routes_;
    std::vector<Route> regex_routes_;
};
