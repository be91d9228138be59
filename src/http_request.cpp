#include "http_request.h"
#include "http_utils.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

HttpRequest::HttpRequest(){
    reset();
}

void HttpRequest::reset(){
    state_ = kExpectRequestLine;
    method_ = INVALID;
    path_.clear();
    query_.clear();
    version_.clear();
    headers_.clear();
    body_.clear();
    content_length_ = 0;
    header_bytes_ = 0;
    route_params_.clear();
}

const char* HttpRequest::methodName(Method method){
    switch(method){
        case GET: return "GET";
        case POST: return "POST";
        case HEAD: return "HEAD";
        case PUT: return "PUT";
        case DELETE: return "DELETE";
        default: return "INVALID";
    }
}

bool HttpRequest::parse(Buffer* buffer){
    while(state_ != kGotAll){
        if(state_ == kExpectBody){
            if(buffer->readableBytes() < content_length_){
                return true;
            }
            body_ = buffer->retrieveAsString(content_length_);
            state_ = kGotAll;
            break;
        }

        const char* crlf = buffer->findCRLF();
        if(!crlf){
            // 一行还没收完，但已经超过了头部上限
            if(header_bytes_ + buffer->readableBytes() > kMaxHeaderBytes){
                return false;
            }
            return true;
        }

        const char* start = buffer->peek();
        header_bytes_ += static_cast<size_t>(crlf - start) + 2;
        if(header_bytes_ > kMaxHeaderBytes){
            return false;
        }

        if(state_ == kExpectRequestLine){
            if(!parseRequestLine(start, crlf)){
                return false;
            }
            buffer->retrieveUntil(crlf + 2);
            state_ = kExpectHeaders;
        }else if(start == crlf){
            // 空行，头部结束
            buffer->retrieveUntil(crlf + 2);
            if(!finishHeaders()){
                return false;
            }
        }else{
            if(!parseHeader(start, crlf)){
                return false;
            }
            buffer->retrieveUntil(crlf + 2);
        }
    }
    return true;
}

bool HttpRequest::finishHeaders(){
    if(hasHeader("Transfer-Encoding")){
        // 只支持 Content-Length 形式的请求体
        return false;
    }
    std::string length_str = getHeader("Content-Length");
    if(length_str.empty()){
        state_ = kGotAll;
        return true;
    }
    if(!std::all_of(length_str.begin(), length_str.end(),
                    [](unsigned char c){ return std::isdigit(c); })){
        return false;
    }
    try{
        unsigned long long length = std::stoull(length_str);
        if(length > kMaxBodyBytes){
            return false;
        }
        content_length_ = static_cast<size_t>(length);
    }catch(const std::exception&){
        return false;
    }
    state_ = content_length_ > 0 ? kExpectBody : kGotAll;
    return true;
}

bool HttpRequest::parseRequestLine(const char* begin, const char* end){
    std::string line(begin, end);
    size_t method_end = line.find(' ');
    size_t target_end = line.rfind(' ');
    if(method_end == std::string::npos || target_end == method_end){
        return false;
    }

    std::string method_str = line.substr(0, method_end);
    if(method_str == "GET") method_ = GET;
    else if(method_str == "POST") method_ = POST;
    else if(method_str == "HEAD") method_ = HEAD;
    else if(method_str == "PUT") method_ = PUT;
    else if(method_str == "DELETE") method_ = DELETE;
    else return false;

    version_ = line.substr(target_end + 1);
    if(version_ != "HTTP/1.1" && version_ != "HTTP/1.0"){
        return false;
    }

    std::string target = line.substr(method_end + 1, target_end - method_end - 1);
    if(target.empty() || target[0] != '/'){
        return false;
    }
    std::string raw_path = target;
    size_t query_pos = target.find('?');
    if(query_pos != std::string::npos){
        raw_path = target.substr(0, query_pos);
        query_ = target.substr(query_pos + 1);
    }
    // 路径中的错误转义直接视为格式错误
    return HttpUtils::pathUnescape(raw_path, &path_);
}

bool HttpRequest::parseHeader(const char* begin, const char* end){
    const char* colon = std::find(begin, end, ':');
    if(colon == end || colon == begin){
        return false;
    }
    std::string key(begin, colon);
    if(key.find_first_of(" \t") != std::string::npos){
        return false;
    }
    setHeader(key, HttpUtils::trim(std::string(colon + 1, end)));
    return true;
}

void HttpRequest::setHeader(const std::string& key, const std::string& value){
    headers_[HttpUtils::toLower(key)] = value;
}

std::string HttpRequest::getHeader(const std::string& key) const{
    auto it = headers_.find(HttpUtils::toLower(key));
    return it == headers_.end() ? "" : it->second;
}

bool HttpRequest::hasHeader(const std::string& key) const{
    return headers_.find(HttpUtils::toLower(key)) != headers_.end();
}

bool HttpRequest::keepAlive() const {
    std::string connection = HttpUtils::toLower(getHeader("Connection"));
    if(connection == "close"){
        return false;
    }
    if(version_ == "HTTP/1.0"){
        return connection == "keep-alive";
    }
    return true;
}
