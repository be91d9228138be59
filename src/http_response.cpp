#include "http_response.h"
#include <cstdio>

HttpResponse::HttpResponse() : status_code_(kUnknown){
}

const char* HttpResponse::reasonPhrase(int code){
    switch(code){
        case 200: return "OK";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

void HttpResponse::setBody(const std::string& body){
    body_ = body;
    addHeader("Content-Length", std::to_string(body_.size()));
}

void HttpResponse::setBody(std::string&& body){
    body_ = std::move(body);
    addHeader("Content-Length", std::to_string(body_.size()));
}

std::string HttpResponse::getStatusMessage() const{
    // 如果用户设置了自定义消息，则使用用户的
    if(!status_message_.empty()){
        return status_message_;
    }
    return reasonPhrase(status_code_);
}

std::string HttpResponse::getHeader(const std::string& key) const{
    auto it = headers_.find(key);
    return it == headers_.end() ? "" : it->second;
}

bool HttpResponse::closeConnection() const{
    return getHeader("Connection") == "close";
}

void HttpResponse::appendToBuffer(Buffer* buffer) const{
    char buf[128];
    snprintf(buf, sizeof(buf), "HTTP/1.1 %d %s\r\n",
             static_cast<int>(status_code_), getStatusMessage().c_str());
    buffer->append(buf);

    for(const auto& header : headers_){
        buffer->append(header.first);
        buffer->append(": ");
        buffer->append(header.second);
        buffer->append("\r\n");
    }
    // 304 不带 Content-Length
    if(headers_.find("Content-Length") == headers_.end() && status_code_ != k304NotModified){
        buffer->append("Content-Length: 0\r\n");
    }

    buffer->append("\r\n");
    if(!body_.empty()){
        buffer->append(body_);
    }
}
