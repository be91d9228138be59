#pragma once
#include "buffer.h"
#include <map>
#include <string>
#include <utility>

class HttpResponse{
public:
    enum HttpStatusCode{
        kUnknown,
        k200Ok = 200,
        k304NotModified = 304,
        k400BadRequest = 400,
        k401Unauthorized = 401,
        k403Forbidden = 403,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k500InternalServerError = 500,
    };

    HttpResponse();

    void setStatusCode(HttpStatusCode code) { status_code_ = code; }
    void setStatusMessage(const std::string& message) { status_message_ = message; }
    void setContentType(const std::string& content_type) { addHeader("Content-Type", content_type); }
    void addHeader(const std::string& key, const std::string& value) { headers_[key] = value; }
    void removeHeader(const std::string& key) { headers_.erase(key); }
    // 设置正文并同步 Content-Length
    void setBody(const std::string& body);
    void setBody(std::string&& body);
    // 添加Connection头为Keep-Alive做准备
    void setKeepAlive(bool on){
        if(on) addHeader("Connection", "keep-alive");
        else addHeader("Connection", "close");
    }
    bool closeConnection() const;

    HttpStatusCode getStatusCode() const { return status_code_; }
    std::string getStatusMessage() const;
    // 不存在时返回空串
    std::string getHeader(const std::string& key) const;
    bool hasHeader(const std::string& key) const { return headers_.count(key) > 0; }
    const std::map<std::string, std::string>& headers() const { return headers_; }
    const std::string& getBody() const { return body_; }

    static const char* reasonPhrase(int code);

    // 状态行\r\n，头部: 值\r\n，\r\n，正文
    void appendToBuffer(Buffer* buffer) const;
private:
    HttpStatusCode status_code_;
    std::string status_message_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};
