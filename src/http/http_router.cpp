#include "http/http_router.h"
#include "utils/logger.h"
#include <algorithm>

bool HttpRouter::addRoute(HttpRequest::Method method, const std::string& path_pattern, HttpHandler handler) {
    if (path_pattern.find_first_of("*+?()[]{}|^$\\") == std::string::npos) {
        static_routes_[path_pattern][method] = std::move(handler);
        LOG_DEBUG << "Adding route: " << HttpRequest::methodName(method) << " " << path_pattern;
        return true;
    }
    try {
        regex_routes_.push_back({method, path_pattern, std::regex(path_pattern), std::move(handler)});
        LOG_DEBUG << "Adding regex route: " << HttpRequest::methodName(method) << " " << path_pattern;
        return true;
    } catch (const std::regex_error& e) {
        LOG_ERROR << "Invalid regex pattern '" << path_pattern << "': " << e.what();
        return false;
    }
}

size_t HttpRouter::routeCount() const {
    size_t count = regex_routes_.size();
    for (const auto& entry : static_routes_) {
        count += entry.second.size();
    }
    return count;
}

void HttpRouter::route(HttpRequest& req, HttpResponse* resp) const {
    std::vector<HttpRequest::Method> allowed;

    auto path_it = static_routes_.find(req.getPath());
    if (path_it != static_routes_.end()) {
        auto method_it = path_it->second.find(req.getMethod());
        if (method_it != path_it->second.end()) {
            method_it->second(req, resp);
            return;
        }
        for (const auto& entry : path_it->second) {
            allowed.push_back(entry.first);
        }
    }

    std::smatch match;
    for (const auto& route : regex_routes_) {
        if (!std::regex_match(req.getPath(), match, route.path_regex)) {
            continue;
        }
        if (req.getMethod() != route.method) {
            if (std::find(allowed.begin(), allowed.end(), route.method) == allowed.end()) {
                allowed.push_back(route.method);
            }
            continue;
        }
        // match[0] 是整个匹配的字符串，从 match[1] 开始是捕获组
        RouteParams params;
        for (size_t i = 1; i < match.size(); ++i) {
            params.push_back(match[i].str());
        }
        req.setRouteParams(params);
        route.handler(req, resp);
        return;
    }

    if (!allowed.empty()) {
        handleMethodNotAllowed(req, resp, allowed);
        return;
    }
    handleNotFound(req, resp);
}

void HttpRouter::handleNotFound(const HttpRequest& req, HttpResponse* resp) const {
    LOG_DEBUG << "No route found for " << HttpRequest::methodName(req.getMethod())
              << " " << req.getPath();
    resp->setStatusCode(HttpResponse::k404NotFound);
    resp->setContentType("text/plain; charset=utf-8");
    resp->setBody("404 page not found");
}

void HttpRouter::handleMethodNotAllowed(const HttpRequest& req, HttpResponse* resp,
                                        const std::vector<HttpRequest::Method>& allowed) const {
    std::string allow;
    for (HttpRequest::Method method : allowed) {
        if (!allow.empty()) {
            allow += ", ";
        }
        allow += HttpRequest::methodName(method);
    }
    LOG_DEBUG << "Method " << HttpRequest::methodName(req.getMethod())
              << " not allowed for " << req.getPath();
    resp->setStatusCode(HttpResponse::k405MethodNotAllowed);
    resp->addHeader("Allow", allow);
    resp->setContentType("text/plain; charset=utf-8");
    resp->setBody("Method Not Allowed");
}
