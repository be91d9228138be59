#pragma once
#include "buffer.h"
#include <string>
#include <unordered_map>
#include <vector>

// 路由正则的捕获组，例如 /static/(.+) 中的相对路径
using RouteParams = std::vector<std::string>;

// 增量解析的 HTTP/1.x 请求，一个连接复用一个对象，每处理完一个请求 reset()
class HttpRequest{
public:
    enum Method {GET, POST, HEAD, PUT, DELETE, INVALID};
    enum ParseState{
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static const size_t kMaxHeaderBytes = 8 * 1024;
    static const size_t kMaxBodyBytes = 1024 * 1024;

    HttpRequest();

    // 消费 buffer 中的数据，返回 false 表示请求格式错误（应回复 400）
    // 数据不完整时返回 true 且 gotAll() 为 false
    bool parse(Buffer* buffer);
    bool gotAll() const { return state_ == kGotAll; }

    Method getMethod() const { return method_; }
    static const char* methodName(Method method);
    const std::string& getPath() const { return path_; }
    const std::string& getQuery() const { return query_; }
    const std::string& getVersion() const { return version_; }
    // 头部名不区分大小写，不存在时返回空串
    std::string getHeader(const std::string& key) const;
    bool hasHeader(const std::string& key) const;
    const std::string& getBody() const { return body_; }

    bool keepAlive() const;
    void reset();

    const RouteParams& getRouteParams() const { return route_params_; }
    void setRouteParams(const RouteParams& params) { route_params_ = params; }

    const std::string& getPeerAddr() const { return peer_addr_; }
    void setPeerAddr(const std::string& addr) { peer_addr_ = addr; }

    // 不经过网络构造请求，供内部分发和测试使用
    void setMethod(Method method) { method_ = method; }
    void setPath(const std::string& path) { path_ = path; }
    void setVersion(const std::string& version) { version_ = version; }
    void setHeader(const std::string& key, const std::string& value);

private:
    bool parseRequestLine(const char* begin, const char* end);
    bool parseHeader(const char* begin, const char* end);
    bool finishHeaders();

    ParseState state_;
    Method method_;
    std::string path_;
    std::string version_;
    std::string query_;
    // key 统一存为小写
    std::unordered_map<std::string, std::string> headers_;
    std::string body_;
    size_t content_length_;
    size_t header_bytes_;

    RouteParams route_params_;
    std::string peer_addr_;
};
